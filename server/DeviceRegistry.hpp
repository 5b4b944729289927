#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <tins/ip_address.h>

#include "../common/DeviceRecord.hpp"

namespace lanwatch::server
{
    using DeviceList = std::vector<common::DeviceRecord>;

    // Single source of truth for discovered devices. Merges are serialized
    // and build the next record set off to the side; the result is
    // published with a pointer swap, so a reader holds either the complete
    // pre-merge or the complete post-merge view.
    class DeviceRegistry
    {
    public:
        DeviceRegistry();

        void Merge(const common::ScanSnapshot &snapshot);
        void Merge(const common::ScanSnapshot &snapshot, common::Clock::time_point now);

        // Immutable view ordered by IP ascending.
        std::shared_ptr<const DeviceList> SnapshotForRead() const;

        size_t Size() const;
        size_t OnlineCount() const;

    private:
        std::mutex m_merge_mutex;
        std::map<Tins::IPv4Address, common::DeviceRecord> m_devices;

        mutable std::mutex m_publish_mutex;
        std::shared_ptr<const DeviceList> m_published;
    };
}
