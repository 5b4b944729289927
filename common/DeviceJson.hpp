#pragma once

#include <vector>
#include <nlohmann/json.hpp>

#include "DeviceRecord.hpp"

namespace lanwatch::common
{
    using json = nlohmann::json;

    json ToJson(const DeviceRecord &record);
    json ToJson(const std::vector<DeviceRecord> &records);
}
