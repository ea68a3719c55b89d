// *****************************************************************************
// HTTP/1.1 Message Helpers
// *****************************************************************************

#ifndef _HTTP_MESSAGE_H_
#define _HTTP_MESSAGE_H_

// Section 1: Includes
// C++ Standard Library
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Section 2: Types
struct HttpUrl {
    bool tls = false;
    std::string host;
    uint16_t port = 0;
    std::string basePath;       ///< without trailing '/', may be empty

    /**
     * Accepts http:// and https:// URLs with optional port and path
     * @return false on any other scheme or a malformed authority
     */
    static bool parse(const std::string &url, HttpUrl &out);
};

struct HttpRequest {
    std::string method;
    std::string target;         ///< path and query
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /**
     * Request line, Host, Content-Length, the headers and the body
     */
    [[nodiscard]] std::string serialize(const std::string &host) const;
};

struct HttpResponse {
    int status = 0;
    std::string reason;
    std::map<std::string, std::string> headers;     ///< names lower-cased
    std::string body;

    [[nodiscard]] std::string header(const std::string &name) const;
    [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
};

/**
 * Incremental response parser. Handles Content-Length, chunked transfer
 * encoding and bodies delimited by connection close.
 */
class HttpResponseParser
{
public:
    enum class State : std::uint8_t {
        HEADERS = 0,
        BODY,
        CHUNK_SIZE,
        CHUNK_DATA,
        CHUNK_TRAILER,
        COMPLETE,
        FAILED,
    };

    /**
     * Feeds received bytes
     * @return current state, COMPLETE once the whole response is in
     */
    State feed(std::string_view data);

    /**
     * The peer closed the connection. Completes a close-delimited body.
     */
    State finish();

    [[nodiscard]] State state() const { return mState; }
    [[nodiscard]] const HttpResponse &response() const { return mResponse; }
    HttpResponse &response() { return mResponse; }

private:
    bool parseHeaders();
    void advance();

    State mState = State::HEADERS;
    std::string mBuffer;
    HttpResponse mResponse;
    uint64_t mRemaining = 0;
    bool mUntilClose = false;
};

/**
 * multipart/form-data body builder
 */
class MultipartForm
{
public:
    explicit MultipartForm(std::string boundary);

    void addField(const std::string &name, const std::string &value);
    void addFile(const std::string &name, const std::string &filename, const std::string &content,
                 const std::string &contentType = "application/octet-stream");

    [[nodiscard]] std::string contentType() const;
    [[nodiscard]] std::string body() const;

private:
    std::string mBoundary;
    std::string mBody;
};

std::string httpStatusText(int status);

#endif // _HTTP_MESSAGE_H_
