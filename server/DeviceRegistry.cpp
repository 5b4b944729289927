#include "DeviceRegistry.hpp"

#include <algorithm>
#include <set>

namespace lanwatch::server
{
    DeviceRegistry::DeviceRegistry()
        : m_published(std::make_shared<const DeviceList>())
    {
    }

    void DeviceRegistry::Merge(const common::ScanSnapshot &snapshot)
    {
        Merge(snapshot, common::Clock::now());
    }

    void DeviceRegistry::Merge(const common::ScanSnapshot &snapshot, common::Clock::time_point now)
    {
        std::lock_guard<std::mutex> merge_lock(m_merge_mutex);

        std::set<Tins::IPv4Address> present;

        for (const auto &entry : snapshot.entries)
        {
            present.insert(entry.ip);

            auto it = m_devices.find(entry.ip);
            if (it == m_devices.end())
            {
                common::DeviceRecord record;
                record.ip = entry.ip;
                record.mac = entry.mac;
                record.hostname = entry.hostname;
                record.status = common::DeviceStatus::Online;
                record.last_seen = now;
                m_devices.emplace(entry.ip, std::move(record));
                continue;
            }

            common::DeviceRecord &record = it->second;
            if (!record.mac && entry.mac)
                record.mac = entry.mac;
            if (!record.hostname && entry.hostname)
                record.hostname = entry.hostname;
            record.status = common::DeviceStatus::Online;
            record.last_seen = std::max(record.last_seen, now);
        }

        for (auto &device : m_devices)
        {
            if (present.count(device.first) == 0)
                device.second.status = common::DeviceStatus::Offline;
        }

        auto next = std::make_shared<DeviceList>();
        next->reserve(m_devices.size());
        for (const auto &device : m_devices)
            next->push_back(device.second);

        std::lock_guard<std::mutex> publish_lock(m_publish_mutex);
        m_published = std::move(next);
    }

    std::shared_ptr<const DeviceList> DeviceRegistry::SnapshotForRead() const
    {
        std::lock_guard<std::mutex> lock(m_publish_mutex);
        return m_published;
    }

    size_t DeviceRegistry::Size() const
    {
        return SnapshotForRead()->size();
    }

    size_t DeviceRegistry::OnlineCount() const
    {
        auto devices = SnapshotForRead();
        return static_cast<size_t>(std::count_if(devices->begin(), devices->end(),
                                                 [](const common::DeviceRecord &record)
                                                 { return record.status == common::DeviceStatus::Online; }));
    }
}
