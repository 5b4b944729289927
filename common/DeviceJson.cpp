#include "DeviceJson.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace lanwatch::common
{
    std::string FormatTimestamp(Clock::time_point tp)
    {
        std::time_t t = Clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);

        std::ostringstream os;
        os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return os.str();
    }

    json ToJson(const DeviceRecord &record)
    {
        json j;
        j["ip"] = record.ip.to_string();
        j["mac"] = record.mac ? json(record.mac->to_string()) : json(nullptr);
        j["hostname"] = record.DisplayName();
        j["status"] = StatusName(record.status);
        j["last_seen"] = FormatTimestamp(record.last_seen);
        return j;
    }

    json ToJson(const std::vector<DeviceRecord> &records)
    {
        json out = json::array();
        for (const auto &record : records)
            out.push_back(ToJson(record));
        return out;
    }
}
