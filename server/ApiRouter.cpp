#include "ApiRouter.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

#include "../common/DeviceJson.hpp"

namespace lanwatch::server
{
    namespace fs = std::filesystem;
    using common::json;

    namespace
    {
        int HexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        bool ETagMatches(const std::string &header, const std::string &etag)
        {
            std::stringstream ss(header);
            std::string candidate;
            while (std::getline(ss, candidate, ','))
            {
                size_t start = candidate.find_first_not_of(" \t");
                size_t end = candidate.find_last_not_of(" \t");
                if (start == std::string::npos)
                    continue;
                candidate = candidate.substr(start, end - start + 1);
                if (candidate.rfind("W/", 0) == 0)
                    candidate = candidate.substr(2);
                if (candidate == "*" || candidate == etag)
                    return true;
            }
            return false;
        }

        json OptionalTimestamp(const std::optional<common::Clock::time_point> &tp)
        {
            if (!tp)
                return nullptr;
            return common::FormatTimestamp(*tp);
        }
    }

    std::optional<std::string> DecodePath(const std::string &path)
    {
        std::string decoded;
        decoded.reserve(path.size());

        for (size_t i = 0; i < path.size(); ++i)
        {
            if (path[i] != '%')
            {
                decoded.push_back(path[i]);
                continue;
            }
            if (i + 2 >= path.size())
                return std::nullopt;
            int hi = HexValue(path[i + 1]);
            int lo = HexValue(path[i + 2]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            char c = static_cast<char>(hi * 16 + lo);
            if (c == '\0')
                return std::nullopt;
            decoded.push_back(c);
            i += 2;
        }
        return decoded;
    }

    std::string ContentTypeFor(const std::string &path)
    {
        std::string ext = fs::path(path).extension().string();
        if (ext == ".html" || ext == ".htm")
            return "text/html; charset=utf-8";
        if (ext == ".js")
            return "application/javascript";
        if (ext == ".css")
            return "text/css";
        if (ext == ".json")
            return "application/json";
        if (ext == ".svg")
            return "image/svg+xml";
        if (ext == ".png")
            return "image/png";
        if (ext == ".ico")
            return "image/x-icon";
        if (ext == ".txt")
            return "text/plain; charset=utf-8";
        return "application/octet-stream";
    }

    ApiRouter::ApiRouter(const DeviceRegistry &registry, const ScanScheduler &scheduler, std::string frontend_dir)
        : m_registry(registry), m_scheduler(scheduler), m_frontend_dir(std::move(frontend_dir))
    {
    }

    std::string ApiRouter::ComputeETag(const std::string &body)
    {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char *>(body.data()), body.size(), hash);

        std::ostringstream ss;
        ss << '"';
        for (int i = 0; i < 16; ++i)
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        ss << '"';
        return ss.str();
    }

    http::HttpResponse ApiRouter::Handle(const http::HttpRequest &request) const
    {
        if (request.method != "GET" && request.method != "HEAD")
        {
            http::HttpResponse resp = http::HttpResponse::Text(405, "Method Not Allowed");
            resp.headers["Allow"] = "GET, HEAD";
            return resp;
        }

        std::string path = request.path;
        if (path == "/devices/" || path == "/status/")
            path.pop_back();

        if (path == "/devices")
            return HandleDevices(request);
        if (path == "/status")
            return HandleStatus();

        return ServeStatic(path);
    }

    http::HttpResponse ApiRouter::HandleDevices(const http::HttpRequest &request) const
    {
        std::shared_ptr<const DeviceList> devices = m_registry.SnapshotForRead();

        http::HttpResponse resp;
        resp.status_code = 200;
        resp.content_type = "application/json";
        // Resolver names are not guaranteed UTF-8; replace bad bytes instead of failing the list.
        resp.body = common::ToJson(*devices).dump(-1, ' ', false, json::error_handler_t::replace);
        resp.headers["Cache-Control"] = "no-store";

        std::string etag = ComputeETag(resp.body);
        resp.headers["ETag"] = etag;

        std::optional<std::string> if_none_match = request.Header("If-None-Match");
        if (if_none_match && ETagMatches(*if_none_match, etag))
        {
            resp.status_code = 304;
            resp.content_type.clear();
            resp.body.clear();
        }

        return resp;
    }

    http::HttpResponse ApiRouter::HandleStatus() const
    {
        SchedulerStats stats = m_scheduler.Stats();

        json j;
        j["state"] = StateName(stats.state);
        j["scans_completed"] = stats.scans_completed;
        j["scans_failed"] = stats.scans_failed;
        j["ticks_skipped"] = stats.ticks_skipped;
        j["last_scan_started"] = OptionalTimestamp(stats.last_scan_started);
        j["last_scan_finished"] = OptionalTimestamp(stats.last_scan_finished);
        j["last_scan_duration_ms"] = stats.last_scan_duration.count();
        j["device_count"] = m_registry.Size();
        j["online_count"] = m_registry.OnlineCount();
        j["scan_interval_seconds"] = std::chrono::duration_cast<std::chrono::seconds>(m_scheduler.Interval()).count();

        http::HttpResponse resp;
        resp.content_type = "application/json";
        resp.body = j.dump();
        resp.headers["Cache-Control"] = "no-store";
        return resp;
    }

    http::HttpResponse ApiRouter::ServeStatic(const std::string &path) const
    {
        std::optional<std::string> decoded = DecodePath(path);
        if (!decoded)
            return http::HttpResponse::Text(400, "Bad Request");

        std::string relative = decoded->substr(1);
        if (relative.empty() || relative.back() == '/')
            relative += "index.html";

        if (fs::path(relative).has_root_directory())
            return http::HttpResponse::Text(404, "Not Found");

        for (const auto &part : fs::path(relative))
        {
            if (part == ".." || part == "." || part.string().find('\\') != std::string::npos)
                return http::HttpResponse::Text(404, "Not Found");
        }

        fs::path full = fs::path(m_frontend_dir) / relative;
        std::error_code ec;
        if (!fs::is_regular_file(full, ec))
            return http::HttpResponse::Text(404, "Not Found");

        std::ifstream file(full, std::ios::binary);
        if (!file.is_open())
            return http::HttpResponse::Text(404, "Not Found");

        std::ostringstream contents;
        contents << file.rdbuf();

        http::HttpResponse resp;
        resp.content_type = ContentTypeFor(full.string());
        resp.body = contents.str();
        return resp;
    }
}
