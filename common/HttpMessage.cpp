#include "HttpMessage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace lanwatch::http
{
    namespace
    {
        std::string ToLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string_view Trim(std::string_view s)
        {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
                s.remove_suffix(1);
            return s;
        }

        bool IsToken(std::string_view s)
        {
            if (s.empty())
                return false;
            return std::all_of(s.begin(), s.end(), [](unsigned char c)
                               { return std::isupper(c) != 0; });
        }

        bool ParseRequestLine(std::string_view line, HttpRequest &req)
        {
            size_t first = line.find(' ');
            if (first == std::string_view::npos)
                return false;
            size_t second = line.find(' ', first + 1);
            if (second == std::string_view::npos)
                return false;

            std::string_view method = line.substr(0, first);
            std::string_view target = line.substr(first + 1, second - first - 1);
            std::string_view version = line.substr(second + 1);

            if (!IsToken(method) || target.empty() || target.front() != '/')
                return false;
            if (version != "HTTP/1.1" && version != "HTTP/1.0")
                return false;

            req.method = std::string(method);
            req.target = std::string(target);
            req.version = std::string(version);

            size_t q = target.find('?');
            req.path = std::string(target.substr(0, q));
            if (q != std::string_view::npos)
                req.query = std::string(target.substr(q + 1));
            return true;
        }
    }

    std::optional<std::string> HttpRequest::Header(const std::string &name) const
    {
        auto it = headers.find(ToLower(name));
        if (it == headers.end())
            return std::nullopt;
        return it->second;
    }

    ParseResult ParseRequest(std::string_view data)
    {
        ParseResult result;

        size_t end = data.find("\r\n\r\n");
        if (end == std::string_view::npos)
        {
            result.status = data.size() > MAX_HEAD_LENGTH ? ParseStatus::TooLarge : ParseStatus::Incomplete;
            return result;
        }
        if (end + 4 > MAX_HEAD_LENGTH)
        {
            result.status = ParseStatus::TooLarge;
            return result;
        }

        std::string_view head = data.substr(0, end);
        size_t line_end = head.find("\r\n");
        std::string_view request_line = head.substr(0, line_end);

        if (!ParseRequestLine(request_line, result.request))
        {
            result.status = ParseStatus::Malformed;
            return result;
        }

        while (line_end != std::string_view::npos)
        {
            size_t start = line_end + 2;
            line_end = head.find("\r\n", start);
            std::string_view line = head.substr(start, line_end == std::string_view::npos ? std::string_view::npos : line_end - start);

            size_t colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0)
            {
                result.status = ParseStatus::Malformed;
                return result;
            }

            std::string name = ToLower(std::string(Trim(line.substr(0, colon))));
            result.request.headers[name] = std::string(Trim(line.substr(colon + 1)));
        }

        result.status = ParseStatus::Complete;
        result.consumed = end + 4;
        return result;
    }

    HttpResponse HttpResponse::Text(int status_code, const std::string &text)
    {
        HttpResponse resp;
        resp.status_code = status_code;
        resp.content_type = "text/plain; charset=utf-8";
        resp.body = text + "\n";
        return resp;
    }

    std::string ReasonPhrase(int status_code)
    {
        switch (status_code)
        {
        case 200:
            return "OK";
        case 304:
            return "Not Modified";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 431:
            return "Request Header Fields Too Large";
        case 500:
            return "Internal Server Error";
        default:
            return "Unknown";
        }
    }

    std::string SerializeResponse(const HttpResponse &response, bool head_only)
    {
        std::ostringstream os;
        os << "HTTP/1.1 " << response.status_code << ' ' << ReasonPhrase(response.status_code) << "\r\n";

        if (!response.content_type.empty())
            os << "Content-Type: " << response.content_type << "\r\n";

        for (const auto &header : response.headers)
            os << header.first << ": " << header.second << "\r\n";

        os << "Content-Length: " << response.body.size() << "\r\n";
        os << "Connection: close\r\n\r\n";

        if (!head_only)
            os << response.body;

        return os.str();
    }
}
