#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace lanwatch::http
{
    inline constexpr size_t MAX_HEAD_LENGTH = 16 * 1024;

    struct HttpRequest
    {
        std::string method;
        std::string target;
        std::string path;
        std::string query;
        std::string version;

        // Header names are lower-cased.
        std::map<std::string, std::string> headers;

        std::optional<std::string> Header(const std::string &name) const;
    };

    enum class ParseStatus
    {
        Incomplete,
        Complete,
        Malformed,
        TooLarge
    };

    struct ParseResult
    {
        ParseStatus status = ParseStatus::Incomplete;
        HttpRequest request;
        size_t consumed = 0;
    };

    // Parses the request line and headers; any body is ignored.
    ParseResult ParseRequest(std::string_view data);

    struct HttpResponse
    {
        int status_code = 200;
        std::string content_type;
        std::string body;

        // Extra headers, in order; Content-Length and Connection are added on
        // serialization.
        std::map<std::string, std::string> headers;

        static HttpResponse Text(int status_code, const std::string &text);
    };

    std::string ReasonPhrase(int status_code);

    // When head_only is set the body is left out but Content-Length still
    // reflects its size.
    std::string SerializeResponse(const HttpResponse &response, bool head_only);
}
