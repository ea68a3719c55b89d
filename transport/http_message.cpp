// Section 1: Main Header
#include "http_message.h"

// Section 2: Includes
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

// Section 3: Defines and Macros
constexpr uint16_t HTTP_DEFAULT_PORT = 80;
constexpr uint16_t HTTPS_DEFAULT_PORT = 443;
constexpr int HEX_BASE = 16;

// Section 4: Static Helpers
namespace
{
    std::string lower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char chr) { return std::tolower(chr); });
        return value;
    }

    std::string trim(std::string_view value)
    {
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            value.remove_prefix(1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r'))
            value.remove_suffix(1);
        return std::string(value);
    }
}

// Section 5: HttpUrl
bool HttpUrl::parse(const std::string &url, HttpUrl &out)
{
    std::string_view rest(url);
    if (rest.starts_with("https://")) {
        out.tls = true;
        out.port = HTTPS_DEFAULT_PORT;
        rest.remove_prefix(8);
    } else if (rest.starts_with("http://")) {
        out.tls = false;
        out.port = HTTP_DEFAULT_PORT;
        rest.remove_prefix(7);
    } else {
        return false;
    }

    const size_t slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    out.basePath = slash == std::string_view::npos ? "" : std::string(rest.substr(slash));
    while (!out.basePath.empty() && out.basePath.back() == '/')
        out.basePath.pop_back();

    if (authority.empty() || authority.find('@') != std::string_view::npos)
        return false;

    size_t colon = authority.rfind(':');
    // [v6]:port
    if (authority.front() == '[') {
        const size_t close = authority.find(']');
        if (close == std::string_view::npos)
            return false;
        out.host = std::string(authority.substr(1, close - 1));
        colon = close + 1 < authority.size() && authority[close + 1] == ':' ? close + 1 : std::string_view::npos;
    } else {
        out.host = std::string(authority.substr(0, colon));
    }

    if (colon != std::string_view::npos) {
        std::string_view portText = authority.substr(colon + 1);
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc() || ptr != portText.data() + portText.size() || port == 0 || port > UINT16_MAX)
            return false;
        out.port = static_cast<uint16_t>(port);
    }
    return !out.host.empty();
}

// Section 6: HttpRequest
std::string HttpRequest::serialize(const std::string &host) const
{
    std::ostringstream out;
    out << method << " " << (target.empty() ? "/" : target) << " HTTP/1.1\r\n";
    out << "Host: " << host << "\r\n";
    out << "Connection: close\r\n";
    out << "Accept-Encoding: gzip\r\n";
    for (const auto &[name, value] : headers)
        out << name << ": " << value << "\r\n";
    if (!body.empty() || method == "POST" || method == "PUT")
        out << "Content-Length: " << body.size() << "\r\n";
    out << "\r\n";
    out << body;
    return out.str();
}

// Section 7: HttpResponse
std::string HttpResponse::header(const std::string &name) const
{
    auto it = headers.find(lower(name));
    return it == headers.end() ? std::string() : it->second;
}

// Section 8: HttpResponseParser
HttpResponseParser::State HttpResponseParser::feed(std::string_view data)
{
    if (mState == State::COMPLETE || mState == State::FAILED)
        return mState;
    mBuffer.append(data);
    advance();
    return mState;
}

HttpResponseParser::State HttpResponseParser::finish()
{
    if (mState == State::BODY && mUntilClose) {
        mResponse.body += mBuffer;
        mBuffer.clear();
        mState = State::COMPLETE;
    } else if (mState != State::COMPLETE) {
        mState = State::FAILED;
    }
    return mState;
}

bool HttpResponseParser::parseHeaders()
{
    const size_t end = mBuffer.find("\r\n\r\n");
    if (end == std::string::npos)
        return false;

    std::istringstream head(mBuffer.substr(0, end));
    mBuffer.erase(0, end + 4);

    std::string line;
    std::getline(head, line);
    line = trim(line);
    // HTTP/1.1 200 OK
    if (!line.starts_with("HTTP/1.")) {
        mState = State::FAILED;
        return true;
    }
    const size_t firstSpace = line.find(' ');
    const size_t secondSpace = line.find(' ', firstSpace + 1);
    const std::string code = line.substr(firstSpace + 1, secondSpace == std::string::npos ? std::string::npos : secondSpace - firstSpace - 1);
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), mResponse.status);
    if (ec != std::errc() || mResponse.status < 100 || mResponse.status > 999) {
        mState = State::FAILED;
        return true;
    }
    mResponse.reason = secondSpace == std::string::npos ? "" : line.substr(secondSpace + 1);

    while (std::getline(head, line)) {
        const size_t colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        mResponse.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    if (lower(mResponse.header("transfer-encoding")).find("chunked") != std::string::npos) {
        mState = State::CHUNK_SIZE;
    } else if (!mResponse.header("content-length").empty()) {
        const std::string length = mResponse.header("content-length");
        auto [lengthPtr, lengthEc] = std::from_chars(length.data(), length.data() + length.size(), mRemaining);
        if (lengthEc != std::errc()) {
            mState = State::FAILED;
            return true;
        }
        mState = mRemaining == 0 ? State::COMPLETE : State::BODY;
    } else if (mResponse.status == 204 || mResponse.status == 304) {
        mState = State::COMPLETE;
    } else {
        mUntilClose = true;
        mState = State::BODY;
    }
    return true;
}

void HttpResponseParser::advance()
{
    for (;;)
    {
        switch (mState)
        {
            case State::HEADERS:
                if (!parseHeaders())
                    return;
                break;

            case State::BODY:
                if (mUntilClose) {
                    mResponse.body += mBuffer;
                    mBuffer.clear();
                    return;
                } else {
                    const size_t take = static_cast<size_t>(std::min<uint64_t>(mRemaining, mBuffer.size()));
                    mResponse.body.append(mBuffer, 0, take);
                    mBuffer.erase(0, take);
                    mRemaining -= take;
                    if (mRemaining > 0)
                        return;
                    mState = State::COMPLETE;
                }
                break;

            case State::CHUNK_SIZE: {
                const size_t eol = mBuffer.find("\r\n");
                if (eol == std::string::npos)
                    return;
                std::string sizeText = mBuffer.substr(0, eol);
                const size_t semicolon = sizeText.find(';');
                if (semicolon != std::string::npos)
                    sizeText.resize(semicolon);
                sizeText = trim(sizeText);
                mBuffer.erase(0, eol + 2);
                auto [ptr, ec] = std::from_chars(sizeText.data(), sizeText.data() + sizeText.size(), mRemaining, HEX_BASE);
                if (ec != std::errc() || sizeText.empty()) {
                    mState = State::FAILED;
                    return;
                }
                mState = mRemaining == 0 ? State::CHUNK_TRAILER : State::CHUNK_DATA;
                break;
            }

            case State::CHUNK_DATA: {
                // chunk bytes plus their CRLF
                if (mBuffer.size() < mRemaining + 2)
                    return;
                mResponse.body.append(mBuffer, 0, static_cast<size_t>(mRemaining));
                mBuffer.erase(0, static_cast<size_t>(mRemaining) + 2);
                mRemaining = 0;
                mState = State::CHUNK_SIZE;
                break;
            }

            case State::CHUNK_TRAILER: {
                const size_t eol = mBuffer.find("\r\n");
                if (eol == std::string::npos)
                    return;
                const bool last = eol == 0;
                mBuffer.erase(0, eol + 2);
                if (last)
                    mState = State::COMPLETE;
                break;
            }

            case State::COMPLETE:
            case State::FAILED:
                return;
        }
    }
}

// Section 9: MultipartForm
MultipartForm::MultipartForm(std::string boundary) : mBoundary(std::move(boundary)) {}

void MultipartForm::addField(const std::string &name, const std::string &value)
{
    mBody += "--" + mBoundary + "\r\n";
    mBody += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
    mBody += value + "\r\n";
}

void MultipartForm::addFile(const std::string &name, const std::string &filename, const std::string &content,
                            const std::string &contentType)
{
    mBody += "--" + mBoundary + "\r\n";
    mBody += "Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" + filename + "\"\r\n";
    mBody += "Content-Type: " + contentType + "\r\n\r\n";
    mBody += content;
    mBody += "\r\n";
}

std::string MultipartForm::contentType() const
{
    return "multipart/form-data; boundary=" + mBoundary;
}

std::string MultipartForm::body() const
{
    return mBody + "--" + mBoundary + "--\r\n";
}

std::string httpStatusText(int status)
{
    switch (status) {
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "HTTP " + std::to_string(status);
    }
}
