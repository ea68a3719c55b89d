// *****************************************************************************
// HTTP Transport
// *****************************************************************************

#ifndef _HTTP_TRANSPORT_H_
#define _HTTP_TRANSPORT_H_

// Section 1: Includes
// C++ Standard Library
#include <memory>
#include <mutex>
#include <string>

// Project Includes
#include "transport/http_message.h"
#include "transport/transport.h"

// Section 2: Defines and Macros
constexpr int HTTP_DEFAULT_TIMEOUT_MS = 30000;

// Section 3: Class Definition
/**
 * Transport over HTTP/1.1, one connection per request, TLS for https
 * endpoints with the system trust store and host name verification.
 */
class HttpTransport : public Transport
{
public:
    HttpTransport(HttpUrl url, std::string token, int timeoutMs = HTTP_DEFAULT_TIMEOUT_MS);

    /**
     * @return nullptr with err set to SYNC_ERR_CONFIGURATION for a malformed endpoint
     */
    static std::unique_ptr<HttpTransport> create(const std::string &endpoint, const std::string &token, SyncError &err,
                                                 int timeoutMs = HTTP_DEFAULT_TIMEOUT_MS);

    SyncError login(const std::string &username, const std::string &password, std::string &token) override;
    SyncError ping() override;
    SyncError check(const com::workspacesync::Manifest &local, com::workspacesync::CheckResponse &response) override;
    SyncError upload(const UploadPart &part) override;
    SyncError download(const std::string &path, DownloadResult &result) override;
    SyncError resolveConflict(const std::string &conflictId, Resolution resolution) override;

    void setToken(const std::string &token) override;
    void setPeerId(const std::string &peerId) override;

    /**
     * Sends one request and reads the whole response
     * @return SYNC_ERR_NETWORK if no complete response arrived
     */
    SyncError send(const HttpRequest &request, HttpResponse &response);

    /**
     * 401/403 to SYNC_ERR_AUTH, other non-2xx to SYNC_ERR_NETWORK
     */
    static SyncError statusToError(const HttpResponse &response);

    /**
     * The manifest as the JSON array the check endpoint takes
     */
    static std::string manifestToJson(const com::workspacesync::Manifest &manifest);

private:
    HttpRequest makeRequest(const std::string &method, const std::string &path) const;

    HttpUrl mUrl;
    int mTimeoutMs;
    mutable std::mutex mMutex;
    std::string mToken;
    std::string mPeerId;
};

#endif // _HTTP_TRANSPORT_H_
