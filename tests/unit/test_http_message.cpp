/**
 * @file test_http_message.cpp
 * @brief Unit tests for HTTP/1.1 message parsing and serialization.
 */

#include "network/http_message.hpp"

#include <gtest/gtest.h>

using namespace sandbox_gate;

TEST(HttpMessageTest, ParseRequestHead) {
    auto request = parse_request_head(
        "POST /execute?trace=1 HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type:  application/json \r\n"
        "Content-Length: 17\r\n");
    ASSERT_TRUE(request) << request.error().message;
    EXPECT_EQ(request->method, "POST");
    EXPECT_EQ(request->target, "/execute?trace=1");
    EXPECT_EQ(request->path, "/execute");
    EXPECT_EQ(request->query, "trace=1");
    EXPECT_EQ(request->version, "HTTP/1.1");
    EXPECT_EQ(request->header("content-type").value_or(""), "application/json");
    EXPECT_EQ(request->header("HOST").value_or(""), "localhost");
    EXPECT_FALSE(request->header("accept").has_value());

    auto length = content_length(*request);
    ASSERT_TRUE(length);
    EXPECT_EQ(*length, 17u);
}

TEST(HttpMessageTest, BareLineFeedsAccepted) {
    auto request = parse_request_head("GET /health HTTP/1.0\nAccept: */*\n");
    ASSERT_TRUE(request);
    EXPECT_EQ(request->path, "/health");
    EXPECT_TRUE(request->query.empty());
}

TEST(HttpMessageTest, MalformedHeads) {
    EXPECT_FALSE(parse_request_head(""));
    EXPECT_FALSE(parse_request_head("GET\r\n"));
    EXPECT_FALSE(parse_request_head("GET /x SPDY/3\r\n"));
    EXPECT_FALSE(parse_request_head("GET /x HTTP/1.1\r\nno colon here\r\n"));
    EXPECT_FALSE(parse_request_head("GET /x HTTP/1.1\r\n: empty name\r\n"));
}

TEST(HttpMessageTest, ContentLength) {
    auto none = parse_request_head("GET / HTTP/1.1\r\n");
    ASSERT_TRUE(none);
    EXPECT_EQ(content_length(*none).value(), 0u);

    auto bad = parse_request_head("POST / HTTP/1.1\r\nContent-Length: 12abc\r\n");
    ASSERT_TRUE(bad);
    EXPECT_FALSE(content_length(*bad));

    auto chunked = parse_request_head("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n");
    ASSERT_TRUE(chunked);
    auto length = content_length(*chunked);
    ASSERT_FALSE(length);
    EXPECT_EQ(length.error().kind, ErrorKind::ValidationError);
}

TEST(HttpMessageTest, SerializeResponse) {
    auto response = HttpResponse::json(404, R"({"detail":"Not found"})");
    response.headers["content-length"] = "999";
    auto wire = serialize_response(response);

    EXPECT_TRUE(wire.starts_with("HTTP/1.1 404 Not Found\r\n"));
    EXPECT_NE(wire.find("content-type: application/json\r\n"), std::string::npos);
    EXPECT_NE(wire.find("content-length: 22\r\n"), std::string::npos);
    EXPECT_EQ(wire.find("999"), std::string::npos);
    EXPECT_NE(wire.find("connection: close\r\n\r\n"), std::string::npos);
    EXPECT_TRUE(wire.ends_with(R"({"detail":"Not found"})"));

    auto parsed = parse_response(wire);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->status, 404);
    EXPECT_EQ(parsed->body, response.body);
    EXPECT_EQ(parsed->header("Content-Type").value_or(""), "application/json");
}

TEST(HttpMessageTest, ParseResponseRejectsGarbage) {
    EXPECT_FALSE(parse_response("HTTP/1.1 200 OK\r\n"));
    EXPECT_FALSE(parse_response("garbage\r\n\r\n"));
}

TEST(HttpMessageTest, ReasonPhrases) {
    EXPECT_EQ(reason_phrase(200), "OK");
    EXPECT_EQ(reason_phrase(413), "Payload Too Large");
    EXPECT_EQ(reason_phrase(503), "Service Unavailable");
    EXPECT_EQ(reason_phrase(299), "Unknown");
}

TEST(HttpMessageTest, UrlDecode) {
    EXPECT_EQ(url_decode("abc"), "abc");
    EXPECT_EQ(url_decode("a%20b%2Fc"), "a b/c");
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_decode("%zz"), "%zz");
    EXPECT_EQ(url_decode("%41"), "A");
}
