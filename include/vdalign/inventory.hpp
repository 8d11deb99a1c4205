// include/vdalign/inventory.hpp
// Purpose: Lists machines and sessions on one endpoint and resolves their disk images

#pragma once

#include "types.hpp"
#include "broker.hpp"
#include "query_pool.hpp"
#include "logging.hpp"
#include <vector>
#include <string>

namespace vdalign {

// Figures from the most recent collection
struct InventoryStats {
    size_t listed = 0;
    size_t hosts_queried = 0;
    size_t resolved = 0;
    size_t timed_out = 0;
    size_t failed = 0;
    std::chrono::milliseconds query_elapsed{0};
};

class InventoryCollector {
public:
    InventoryCollector(BrokerClient& broker, DiskImageQueryPool& pool, Logger& logger);

    // A failed listing is logged and yields an empty list
    std::vector<Machine> collect_machines(const SiteId& site, const Endpoint& endpoint,
                                          const std::string& group_filter, size_t max_records);
    std::vector<Session> collect_sessions(const SiteId& site, const Endpoint& endpoint,
                                          const std::string& group_filter, size_t max_records);

    const InventoryStats& last_stats() const noexcept { return stats_; }

    // Host queried for an entity's disk image
    static HostName query_host(const Machine& machine);
    static HostName query_host(const Session& session);

private:
    BrokerClient& broker_;
    DiskImageQueryPool& pool_;
    Logger& logger_;
    InventoryStats stats_;

    template <typename Entity>
    void resolve_images(std::vector<Entity>& entities, const SiteId& site, const std::string& what);
};

} // namespace vdalign
