#include "mload/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using mload::network::HttpMethod;
using mload::network::HttpParser;

namespace {

mload::Result<bool> feed(HttpParser& parser, const std::string& text) {
    return parser.parse(text.data(), text.size());
}

} // namespace

TEST(HttpParserTest, ParsesRequestWithoutBody) {
    HttpParser parser;
    auto res = feed(parser, "GET /api/model/upload-status HTTP/1.1\r\nHost: localhost\r\n\r\n");
    ASSERT_TRUE(res.is_ok()) << res.error();
    EXPECT_TRUE(res.value());

    const auto request = parser.get_request();
    EXPECT_EQ(request.method, HttpMethod::GET);
    EXPECT_EQ(request.url, "/api/model/upload-status");
    EXPECT_EQ(request.get_header("host"), "localhost");
    EXPECT_TRUE(request.body.empty());
}

TEST(HttpParserTest, BinaryBodyAcrossFragments) {
    std::string body("\x00\x01\xff\r\n\x7f", 6);
    const std::string head = "PUT /api/model/chunks/3 HTTP/1.1\r\nContent-Length: 6\r\nX-Chunk-Sha256: abc\r\n\r\n";
    const std::string message = head + body;

    HttpParser parser;
    for (std::size_t i = 0; i < message.size(); ++i) {
        auto res = parser.parse(message.data() + i, 1);
        ASSERT_TRUE(res.is_ok()) << res.error();
        EXPECT_EQ(res.value(), i + 1 == message.size());
    }

    auto request = parser.take_request();
    EXPECT_EQ(request.method, HttpMethod::PUT);
    EXPECT_EQ(request.path(), "/api/model/chunks/3");
    EXPECT_EQ(request.get_header("x-chunk-sha256"), "abc");
    ASSERT_EQ(request.body.size(), 6u);
    EXPECT_EQ(request.body[0], 0x00);
    EXPECT_EQ(request.body[2], 0xff);
}

TEST(HttpParserTest, SplitsPathAndQuery) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "POST /api/model/initialize/continue?batch_size=5 HTTP/1.1\r\n\r\n").value());

    const auto request = parser.get_request();
    EXPECT_EQ(request.path(), "/api/model/initialize/continue");
    EXPECT_EQ(request.query(), "batch_size=5");
}

TEST(HttpParserTest, RejectsMalformedRequests) {
    {
        HttpParser parser;
        EXPECT_TRUE(feed(parser, "get / HTTP/1.1\r\n\r\n").is_error());
    }
    {
        HttpParser parser;
        EXPECT_TRUE(feed(parser, "GET / HTTP/2.0\r\n\r\n").is_error());
    }
    {
        HttpParser parser;
        auto res = feed(parser, "POST / HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
        ASSERT_TRUE(res.is_error());
        EXPECT_FALSE(parser.payload_too_large());
    }
    {
        HttpParser parser;
        EXPECT_TRUE(feed(parser, "POST / HTTP/1.1\r\nContent-Length: 99999999999999999999999\r\n\r\n").is_error());
    }
}

TEST(HttpParserTest, OversizedBodyIsPayloadTooLarge) {
    HttpParser parser(256);
    auto res = feed(parser, "PUT /api/model/chunks/0 HTTP/1.1\r\nContent-Length: 1000\r\n\r\n");
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(parser.payload_too_large());
}

TEST(HttpParserTest, OversizedHeadIsPayloadTooLarge) {
    HttpParser parser(64);
    auto res = feed(parser, "GET /" + std::string(100, 'a') + " HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(parser.payload_too_large());
}

TEST(HttpParserTest, BodyWithinLimitIsAccepted) {
    HttpParser parser(256);
    const std::string body(100, 'x');
    auto res = feed(parser, "PUT /api/model/chunks/0 HTTP/1.1\r\nContent-Length: 100\r\n\r\n" + body);
    ASSERT_TRUE(res.is_ok()) << res.error();
    EXPECT_TRUE(res.value());
    EXPECT_EQ(parser.get_request().body_as_string(), body);
}

TEST(HttpParserTest, ResetAllowsReuse) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "GET /a HTTP/1.1\r\n\r\n").value());
    parser.reset();
    ASSERT_TRUE(feed(parser, "GET /b HTTP/1.0\r\n\r\n").value());
    EXPECT_EQ(parser.get_request().url, "/b");
}
