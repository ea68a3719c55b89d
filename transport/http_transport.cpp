// Section 1: Main Header
#include "http_transport.h"

// Section 2: Includes
// C Standard Library
#include <cctype>
#include <cstdint>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

// C++ Standard Library
#include <algorithm>
#include <array>
#include <atomic>
#include <random>
#include <sstream>

// Third-Party Includes
#include <google/protobuf/util/json_util.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

// Project Includes
#include "transport/socket_helpers.h"

// Section 3: Defines and Macros
constexpr size_t RECEIVE_BUFFER_SIZE = 16 * 1024;
constexpr int BOUNDARY_RANDOM_DIGITS = 16;

// Section 4: Connection
namespace
{
    SSL_CTX *clientContext()
    {
        static SSL_CTX *context = []() {
            SSL_CTX *ctx = SSL_CTX_new(TLS_client_method());
            if (ctx != nullptr) {
                SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
                SSL_CTX_set_default_verify_paths(ctx);
                SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            }
            return ctx;
        }();
        return context;
    }

    /**
     * One TCP connection, optionally wrapped in TLS. Closed on destruction.
     */
    class HttpConnection
    {
    public:
        HttpConnection() = default;
        ~HttpConnection() { close(); }

        HttpConnection(const HttpConnection &) = delete;
        HttpConnection &operator=(const HttpConnection &) = delete;

        SyncError open(const HttpUrl &url, int timeoutMs)
        {
            if (SocketHelpers::connect_timeout(url.host, url.port, timeoutMs, mFd) != 0)
                return SyncError::make(SYNC_ERR_NETWORK, "cannot connect to " + url.host + ":" + std::to_string(url.port));
            SocketHelpers::set_timeouts(mFd, timeoutMs);

            if (!url.tls)
                return SyncError::success();

            SSL_CTX *ctx = clientContext();
            if (ctx == nullptr)
                return SyncError::make(SYNC_ERR_NETWORK, "TLS unavailable");

            mSsl = SSL_new(ctx);
            if (mSsl == nullptr)
                return SyncError::make(SYNC_ERR_NETWORK, "TLS unavailable");
            SSL_set_fd(mSsl, mFd);
            SSL_set_tlsext_host_name(mSsl, url.host.c_str());
            SSL_set1_host(mSsl, url.host.c_str());

            if (SSL_connect(mSsl) != 1) {
                const long verify = SSL_get_verify_result(mSsl);
                ERR_clear_error();
                if (verify != X509_V_OK)
                    return SyncError::make(SYNC_ERR_NETWORK, std::string("certificate untrusted: ") + X509_verify_cert_error_string(verify));
                return SyncError::make(SYNC_ERR_NETWORK, "TLS handshake failed with " + url.host);
            }
            return SyncError::success();
        }

        int write(std::string_view data)
        {
            if (mSsl == nullptr)
                return SocketHelpers::send_all(mFd, data);

            size_t sent = 0;
            while (sent < data.size()) {
                const int num = SSL_write(mSsl, data.data() + sent, static_cast<int>(std::min<size_t>(data.size() - sent, INT32_MAX)));
                if (num <= 0)
                    return -1;
                sent += static_cast<size_t>(num);
            }
            return 0;
        }

        /**
         * @return bytes read, 0 on orderly close, negative on error or timeout
         */
        ssize_t read(char *buffer, size_t size)
        {
            if (mSsl == nullptr)
                return ::recv(mFd, buffer, size, 0);

            const int num = SSL_read(mSsl, buffer, static_cast<int>(size));
            if (num > 0)
                return num;
            return SSL_get_error(mSsl, num) == SSL_ERROR_ZERO_RETURN ? 0 : -1;
        }

        void close()
        {
            if (mSsl != nullptr) {
                SSL_shutdown(mSsl);
                SSL_free(mSsl);
                mSsl = nullptr;
            }
            if (mFd >= 0) {
                ::close(mFd);
                mFd = -1;
            }
        }

    private:
        int mFd = -1;
        SSL *mSsl = nullptr;
    };

    std::string makeBoundary()
    {
        static std::atomic<uint64_t> counter{0};
        std::random_device device;
        std::mt19937_64 generator(device() ^ ++counter);
        std::uniform_int_distribution<int> digit(0, 9);
        std::string boundary = "----workspace-sync-";
        for (int i = 0; i < BOUNDARY_RANDOM_DIGITS; ++i)
            boundary += static_cast<char>('0' + digit(generator));
        return boundary;
    }

    std::string jsonOf(const google::protobuf::Message &message)
    {
        google::protobuf::util::JsonPrintOptions options;
        options.preserve_proto_field_names = true;
        std::string json;
        if (!google::protobuf::util::MessageToJsonString(message, &json, options).ok())
            return "{}";
        return json;
    }

    std::string urlEncode(const std::string &value)
    {
        static constexpr std::array<char, 16> HEX = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                     '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};
        std::string out;
        for (unsigned char chr : value) {
            if (std::isalnum(chr) || chr == '-' || chr == '_' || chr == '.' || chr == '~') {
                out += static_cast<char>(chr);
            } else {
                out += '%';
                out += HEX[chr >> 4];
                out += HEX[chr & 0x0F];
            }
        }
        return out;
    }
}

// Section 5: Constructors and Destructors
HttpTransport::HttpTransport(HttpUrl url, std::string token, int timeoutMs) :
    mUrl(std::move(url)),
    mTimeoutMs(timeoutMs),
    mToken(std::move(token))
{}

// Section 6: Static Methods
std::unique_ptr<HttpTransport> HttpTransport::create(const std::string &endpoint, const std::string &token, SyncError &err,
                                                     int timeoutMs)
{
    HttpUrl url;
    if (!HttpUrl::parse(endpoint, url)) {
        err = SyncError::make(SYNC_ERR_CONFIGURATION, "invalid endpoint '" + endpoint + "'");
        return nullptr;
    }
    err = SyncError::success();
    return std::make_unique<HttpTransport>(std::move(url), token, timeoutMs);
}

SyncError HttpTransport::statusToError(const HttpResponse &response)
{
    if (response.ok())
        return SyncError::success();
    if (response.status == 401 || response.status == 403)
        return SyncError::make(SYNC_ERR_AUTH, "authentication rejected (" + std::to_string(response.status) + ")");

    std::string text = response.reason.empty() ? httpStatusText(response.status) : response.reason;
    return SyncError::make(SYNC_ERR_NETWORK, "server answered " + std::to_string(response.status) + " " + text);
}

std::string HttpTransport::manifestToJson(const com::workspacesync::Manifest &manifest)
{
    std::string json = "[";
    for (int i = 0; i < manifest.files_size(); ++i) {
        if (i > 0)
            json += ",";
        json += jsonOf(manifest.files(i));
    }
    return json + "]";
}

// Section 7: Public Methods
SyncError HttpTransport::login(const std::string &username, const std::string &password, std::string &token)
{
    com::workspacesync::LoginRequest body;
    body.set_username(username);
    body.set_password(password);
    {
        std::lock_guard<std::mutex> lock(mMutex);
        body.set_peer_id(mPeerId);
    }

    HttpRequest request = makeRequest("POST", "/api/auth/login");
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = jsonOf(body);

    HttpResponse response;
    SyncError err = send(request, response);
    if (!err.ok())
        return err;
    // a failed login is a credential problem whatever the status says
    if (!response.ok())
        return SyncError::make(SYNC_ERR_AUTH, "login failed (" + std::to_string(response.status) + ")");

    com::workspacesync::LoginResponse parsed;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    if (!google::protobuf::util::JsonStringToMessage(response.body, &parsed, options).ok() || parsed.token().empty())
        return SyncError::make(SYNC_ERR_PROTOCOL, "login response carries no token");

    token = parsed.token();
    setToken(token);
    return SyncError::success();
}

SyncError HttpTransport::ping()
{
    HttpResponse response;
    SyncError err = send(makeRequest("GET", "/api/sync/ping"), response);
    if (!err.ok())
        return err;
    return statusToError(response);
}

SyncError HttpTransport::check(const com::workspacesync::Manifest &local, com::workspacesync::CheckResponse &result)
{
    HttpRequest request = makeRequest("POST", "/api/sync/check");
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = manifestToJson(local);

    HttpResponse response;
    SyncError err = send(request, response);
    if (!err.ok())
        return err;
    err = statusToError(response);
    if (!err.ok())
        return err;

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    result.Clear();
    auto status = google::protobuf::util::JsonStringToMessage(response.body, &result, options);
    if (!status.ok())
        return SyncError::make(SYNC_ERR_PROTOCOL, "malformed check response: " + status.ToString());
    return SyncError::success();
}

SyncError HttpTransport::upload(const UploadPart &part)
{
    MultipartForm form(makeBoundary());
    form.addField("hash", part.hash);
    form.addField("size", std::to_string(part.size));
    form.addField("mtime", std::to_string(part.mtime));
    if (!part.encoding.empty())
        form.addField("encoding", part.encoding);
    if (part.chunkCount > 1) {
        form.addField("chunk_index", std::to_string(part.chunkIndex));
        form.addField("chunk_count", std::to_string(part.chunkCount));
    }
    // the file field is keyed by its module-qualified path
    form.addFile(part.path, part.path.substr(part.path.find_last_of('/') + 1), part.content);

    HttpRequest request = makeRequest("POST", "/api/sync/upload");
    request.headers.emplace_back("Content-Type", form.contentType());
    request.body = form.body();

    HttpResponse response;
    SyncError err = send(request, response);
    if (!err.ok())
        return err;
    return statusToError(response);
}

SyncError HttpTransport::download(const std::string &path, DownloadResult &result)
{
    com::workspacesync::DownloadRequest body;
    body.set_path(path);

    HttpRequest request = makeRequest("POST", "/api/sync/download");
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = jsonOf(body);

    HttpResponse response;
    SyncError err = send(request, response);
    if (!err.ok())
        return err;
    err = statusToError(response);
    if (!err.ok())
        return err;

    result.content = std::move(response.body);
    result.encoding = response.header("content-encoding");
    return SyncError::success();
}

SyncError HttpTransport::resolveConflict(const std::string &conflictId, Resolution resolution)
{
    com::workspacesync::ConflictResolutionRequest body;
    body.set_resolution(toString(resolution));

    HttpRequest request = makeRequest("PUT", "/api/sync/conflicts/" + urlEncode(conflictId));
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = jsonOf(body);

    HttpResponse response;
    SyncError err = send(request, response);
    if (!err.ok())
        return err;
    return statusToError(response);
}

void HttpTransport::setToken(const std::string &token)
{
    std::lock_guard<std::mutex> lock(mMutex);
    mToken = token;
}

void HttpTransport::setPeerId(const std::string &peerId)
{
    std::lock_guard<std::mutex> lock(mMutex);
    mPeerId = peerId;
}

SyncError HttpTransport::send(const HttpRequest &request, HttpResponse &response)
{
    HttpConnection connection;
    SyncError err = connection.open(mUrl, mTimeoutMs);
    if (!err.ok())
        return err;

    const bool defaultPort = mUrl.port == (mUrl.tls ? 443 : 80);
    const std::string host = defaultPort ? mUrl.host : mUrl.host + ":" + std::to_string(mUrl.port);
    if (connection.write(request.serialize(host)) != 0)
        return SyncError::make(SYNC_ERR_NETWORK, "sending request to " + mUrl.host + " failed");

    HttpResponseParser parser;
    std::array<char, RECEIVE_BUFFER_SIZE> buffer{};
    for (;;)
    {
        const ssize_t num = connection.read(buffer.data(), buffer.size());
        if (num < 0)
            return SyncError::make(SYNC_ERR_NETWORK, "timed out waiting for " + mUrl.host);
        if (num == 0) {
            parser.finish();
            break;
        }
        const auto state = parser.feed(std::string_view(buffer.data(), static_cast<size_t>(num)));
        if (state == HttpResponseParser::State::COMPLETE || state == HttpResponseParser::State::FAILED)
            break;
    }

    if (parser.state() != HttpResponseParser::State::COMPLETE)
        return SyncError::make(SYNC_ERR_PROTOCOL, "incomplete response from " + mUrl.host);

    response = std::move(parser.response());
    return SyncError::success();
}

// Section 8: Private Methods
HttpRequest HttpTransport::makeRequest(const std::string &method, const std::string &path) const
{
    HttpRequest request;
    request.method = method;
    request.target = mUrl.basePath + path;

    std::lock_guard<std::mutex> lock(mMutex);
    if (!mToken.empty())
        request.headers.emplace_back("Authorization", "Bearer " + mToken);
    if (!mPeerId.empty())
        request.headers.emplace_back("X-Peer-Id", mPeerId);
    return request;
}
