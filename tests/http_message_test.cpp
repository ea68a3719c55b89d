#include <gtest/gtest.h>

#include <string>

#include "transport/http_message.h"

TEST(HttpUrlTest, ParsesSchemesPortsAndPaths)
{
    HttpUrl url;
    ASSERT_TRUE(HttpUrl::parse("https://peer.example/api/", url));
    EXPECT_TRUE(url.tls);
    EXPECT_EQ(url.host, "peer.example");
    EXPECT_EQ(url.port, 443);
    EXPECT_EQ(url.basePath, "/api");

    ASSERT_TRUE(HttpUrl::parse("http://127.0.0.1:8080", url));
    EXPECT_FALSE(url.tls);
    EXPECT_EQ(url.host, "127.0.0.1");
    EXPECT_EQ(url.port, 8080);
    EXPECT_TRUE(url.basePath.empty());

    ASSERT_TRUE(HttpUrl::parse("http://[::1]:9000/sync", url));
    EXPECT_EQ(url.host, "::1");
    EXPECT_EQ(url.port, 9000);
}

TEST(HttpUrlTest, RejectsOtherSchemesAndBadPorts)
{
    HttpUrl url;
    EXPECT_FALSE(HttpUrl::parse("ftp://peer", url));
    EXPECT_FALSE(HttpUrl::parse("http://", url));
    EXPECT_FALSE(HttpUrl::parse("http://peer:0", url));
    EXPECT_FALSE(HttpUrl::parse("http://peer:70000", url));
    EXPECT_FALSE(HttpUrl::parse("http://user@peer", url));
}

TEST(HttpRequestTest, SerializesHeadersAndBody)
{
    HttpRequest request;
    request.method = "POST";
    request.target = "/api/sync/check";
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = "{}";

    const std::string wire = request.serialize("peer.example");
    EXPECT_TRUE(wire.starts_with("POST /api/sync/check HTTP/1.1\r\n"));
    EXPECT_NE(wire.find("Host: peer.example\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_TRUE(wire.ends_with("\r\n\r\n{}"));
}

TEST(HttpResponseParserTest, ContentLengthAcrossFeeds)
{
    HttpResponseParser parser;
    EXPECT_EQ(parser.feed("HTTP/1.1 200 OK\r\nContent-Le"), HttpResponseParser::State::HEADERS);
    EXPECT_EQ(parser.feed("ngth: 5\r\nX-Token: abc\r\n\r\nhel"), HttpResponseParser::State::BODY);
    EXPECT_EQ(parser.feed("lo"), HttpResponseParser::State::COMPLETE);

    const HttpResponse &response = parser.response();
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.reason, "OK");
    EXPECT_TRUE(response.ok());
    EXPECT_EQ(response.header("x-token"), "abc");
    EXPECT_EQ(response.header("X-TOKEN"), "abc");
    EXPECT_EQ(response.body, "hello");
}

TEST(HttpResponseParserTest, ChunkedBody)
{
    HttpResponseParser parser;
    parser.feed("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n");
    parser.feed("4\r\nWiki\r\n5;ext=1\r\npedia\r\n");
    EXPECT_EQ(parser.feed("0\r\n\r\n"), HttpResponseParser::State::COMPLETE);
    EXPECT_EQ(parser.response().body, "Wikipedia");
}

TEST(HttpResponseParserTest, BodyUntilClose)
{
    HttpResponseParser parser;
    EXPECT_EQ(parser.feed("HTTP/1.0 500 Internal Server Error\r\n\r\nboom"), HttpResponseParser::State::BODY);
    EXPECT_EQ(parser.finish(), HttpResponseParser::State::COMPLETE);
    EXPECT_EQ(parser.response().status, 500);
    EXPECT_FALSE(parser.response().ok());
    EXPECT_EQ(parser.response().body, "boom");
}

TEST(HttpResponseParserTest, NoContentCompletesImmediately)
{
    HttpResponseParser parser;
    EXPECT_EQ(parser.feed("HTTP/1.1 204 No Content\r\n\r\n"), HttpResponseParser::State::COMPLETE);
}

TEST(HttpResponseParserTest, TruncatedResponseFails)
{
    HttpResponseParser parser;
    parser.feed("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort");
    EXPECT_EQ(parser.finish(), HttpResponseParser::State::FAILED);

    HttpResponseParser garbage;
    EXPECT_EQ(garbage.feed("SSH-2.0-OpenSSH\r\n\r\n"), HttpResponseParser::State::FAILED);
}

TEST(MultipartFormTest, BuildsFieldsAndFiles)
{
    MultipartForm form("XyZ");
    form.addField("path", "/notes/a.md");
    form.addFile("file", "a.md", "content");

    EXPECT_EQ(form.contentType(), "multipart/form-data; boundary=XyZ");
    const std::string body = form.body();
    EXPECT_TRUE(body.starts_with("--XyZ\r\nContent-Disposition: form-data; name=\"path\"\r\n\r\n/notes/a.md\r\n"));
    EXPECT_NE(body.find("filename=\"a.md\""), std::string::npos);
    EXPECT_NE(body.find("\r\n\r\ncontent\r\n"), std::string::npos);
    EXPECT_TRUE(body.ends_with("--XyZ--\r\n"));
}

TEST(HttpStatusTextTest, KnownCodes)
{
    EXPECT_EQ(httpStatusText(401), "Unauthorized");
    EXPECT_EQ(httpStatusText(404), "Not Found");
}
