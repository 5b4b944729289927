#pragma once

#include <optional>
#include <string>

#include "DeviceRegistry.hpp"
#include "ScanScheduler.hpp"
#include "../common/HttpMessage.hpp"

namespace lanwatch::server
{
    // Maps requests to responses: the device list, scheduler status and the
    // static dashboard files.
    class ApiRouter
    {
    public:
        ApiRouter(const DeviceRegistry &registry, const ScanScheduler &scheduler, std::string frontend_dir);

        http::HttpResponse Handle(const http::HttpRequest &request) const;

        // Quoted, truncated SHA-256 of the body.
        static std::string ComputeETag(const std::string &body);

    private:
        http::HttpResponse HandleDevices(const http::HttpRequest &request) const;
        http::HttpResponse HandleStatus() const;
        http::HttpResponse ServeStatic(const std::string &path) const;

        const DeviceRegistry &m_registry;
        const ScanScheduler &m_scheduler;
        std::string m_frontend_dir;
    };

    std::optional<std::string> DecodePath(const std::string &path);
    std::string ContentTypeFor(const std::string &path);
}
