#include <gtest/gtest.h>

#include <cstdint>

#include "common/ByteBuffer.hpp"
#include "common/HttpMessage.hpp"

using namespace lanwatch;

namespace
{
    void Append(common::ByteBuffer &buffer, const std::string &text)
    {
        buffer.Append(reinterpret_cast<const uint8_t *>(text.data()), text.size());
    }
}

TEST(HttpMessageTest, ParsesRequestLineAndHeaders)
{
    const std::string raw =
        "GET /devices?verbose=1 HTTP/1.1\r\n"
        "Host: 192.168.1.2:8000\r\n"
        "If-None-Match:   \"abc\"  \r\n"
        "\r\n";

    http::ParseResult result = http::ParseRequest(raw);
    ASSERT_EQ(result.status, http::ParseStatus::Complete);
    EXPECT_EQ(result.consumed, raw.size());
    EXPECT_EQ(result.request.method, "GET");
    EXPECT_EQ(result.request.target, "/devices?verbose=1");
    EXPECT_EQ(result.request.path, "/devices");
    EXPECT_EQ(result.request.query, "verbose=1");
    EXPECT_EQ(result.request.version, "HTTP/1.1");
    EXPECT_EQ(result.request.Header("host"), std::optional<std::string>("192.168.1.2:8000"));
    EXPECT_EQ(result.request.Header("IF-NONE-MATCH"), std::optional<std::string>("\"abc\""));
    EXPECT_FALSE(result.request.Header("Accept").has_value());
}

TEST(HttpMessageTest, PartialHeadIsIncomplete)
{
    EXPECT_EQ(http::ParseRequest("GET /devices HTTP/1.1\r\nHost: x\r\n").status,
              http::ParseStatus::Incomplete);
    EXPECT_EQ(http::ParseRequest("").status, http::ParseStatus::Incomplete);
}

TEST(HttpMessageTest, RejectsMalformedRequests)
{
    EXPECT_EQ(http::ParseRequest("get /devices HTTP/1.1\r\n\r\n").status, http::ParseStatus::Malformed);
    EXPECT_EQ(http::ParseRequest("GET devices HTTP/1.1\r\n\r\n").status, http::ParseStatus::Malformed);
    EXPECT_EQ(http::ParseRequest("GET /devices HTTP/2\r\n\r\n").status, http::ParseStatus::Malformed);
    EXPECT_EQ(http::ParseRequest("GET /devices\r\n\r\n").status, http::ParseStatus::Malformed);
    EXPECT_EQ(http::ParseRequest("GET / HTTP/1.1\r\nno colon here\r\n\r\n").status, http::ParseStatus::Malformed);
}

TEST(HttpMessageTest, OversizedHeadIsRejected)
{
    std::string raw = "GET / HTTP/1.1\r\nX-Filler: " + std::string(http::MAX_HEAD_LENGTH, 'a');
    EXPECT_EQ(http::ParseRequest(raw).status, http::ParseStatus::TooLarge);

    raw += "\r\n\r\n";
    EXPECT_EQ(http::ParseRequest(raw).status, http::ParseStatus::TooLarge);
}

TEST(HttpMessageTest, SerializesResponse)
{
    http::HttpResponse resp;
    resp.content_type = "application/json";
    resp.body = "[]";
    resp.headers["ETag"] = "\"x\"";

    const std::string wire = http::SerializeResponse(resp, false);
    EXPECT_EQ(wire,
              "HTTP/1.1 200 OK\r\n"
              "Content-Type: application/json\r\n"
              "ETag: \"x\"\r\n"
              "Content-Length: 2\r\n"
              "Connection: close\r\n"
              "\r\n"
              "[]");
}

TEST(HttpMessageTest, HeadResponseKeepsLengthWithoutBody)
{
    http::HttpResponse resp = http::HttpResponse::Text(404, "Not Found");
    const std::string wire = http::SerializeResponse(resp, true);

    EXPECT_EQ(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(wire.find("Content-Length: 10\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 4), "\r\n\r\n");
}

TEST(HttpMessageTest, ByteBufferFindsHead)
{
    common::ByteBuffer buffer;
    Append(buffer, "GET / HTTP/1.1\r\nHo");
    EXPECT_FALSE(buffer.HasCompleteHead());

    Append(buffer, "st: x\r\n\r\nleftover");
    ASSERT_TRUE(buffer.HasCompleteHead());
    EXPECT_EQ(buffer.HeadLength(), 27u);

    buffer.Consume(buffer.HeadLength());
    EXPECT_EQ(buffer.View(), "leftover");

    buffer.Clear();
    EXPECT_EQ(buffer.Size(), 0u);
}
