// src/inventory.cpp
// Implementation of inventory collection and disk image resolution

#include "vdalign/inventory.hpp"
#include "vdalign/errors.hpp"
#include "vdalign/utils.hpp"

namespace vdalign {

InventoryCollector::InventoryCollector(BrokerClient& broker, DiskImageQueryPool& pool, Logger& logger)
    : broker_(broker), pool_(pool), logger_(logger) {}

std::vector<Machine> InventoryCollector::collect_machines(const SiteId& site, const Endpoint& endpoint,
                                                          const std::string& group_filter,
                                                          size_t max_records) {
    stats_ = InventoryStats{};
    std::vector<Machine> machines;
    try {
        machines = broker_.list_available_machines(endpoint, group_filter, max_records);
    } catch (const std::exception& e) {
        logger_.error(Errors::listing_failed(endpoint, "available machines", e.what()).what());
        return {};
    }

    if (machines.size() > max_records) {
        machines.resize(max_records);
    }
    for (auto& machine : machines) {
        machine.site = site;
        machine.endpoint = endpoint;
    }
    stats_.listed = machines.size();

    logger_.info("Site " + site + ": " + std::to_string(machines.size()) +
                 " available machine(s) matching '" + group_filter + "'");
    resolve_images(machines, site, "machine");
    return machines;
}

std::vector<Session> InventoryCollector::collect_sessions(const SiteId& site, const Endpoint& endpoint,
                                                          const std::string& group_filter,
                                                          size_t max_records) {
    stats_ = InventoryStats{};
    std::vector<Session> sessions;
    try {
        sessions = broker_.list_sessions(endpoint, group_filter, max_records);
    } catch (const std::exception& e) {
        logger_.error(Errors::listing_failed(endpoint, "sessions", e.what()).what());
        return {};
    }

    if (sessions.size() > max_records) {
        sessions.resize(max_records);
    }
    for (auto& session : sessions) {
        session.site = site;
        session.endpoint = endpoint;
    }
    stats_.listed = sessions.size();

    logger_.info("Site " + site + ": " + std::to_string(sessions.size()) +
                 " session(s) matching '" + group_filter + "'");
    resolve_images(sessions, site, "session");
    return sessions;
}

HostName InventoryCollector::query_host(const Machine& machine) {
    return machine.dns_name.empty() ? machine.machine_name : machine.dns_name;
}

HostName InventoryCollector::query_host(const Session& session) {
    return session.dns_name.empty() ? session.machine_name : session.dns_name;
}

template <typename Entity>
void InventoryCollector::resolve_images(std::vector<Entity>& entities, const SiteId& site,
                                        const std::string& what) {
    if (entities.empty()) {
        return;
    }

    std::vector<HostName> hosts;
    hosts.reserve(entities.size());
    for (const auto& entity : entities) {
        hosts.push_back(query_host(entity));
    }

    QueryBatchResult batch = pool_.resolve(hosts);
    for (auto& entity : entities) {
        entity.disk_image = batch.lookup(query_host(entity));
    }

    stats_.hosts_queried = batch.identifiers.size();
    stats_.timed_out = batch.timed_out;
    stats_.failed = batch.failed;
    stats_.query_elapsed = batch.elapsed;
    for (const auto& entry : batch.identifiers) {
        if (entry.second) {
            ++stats_.resolved;
        }
    }

    for (const auto& failure : batch.failures) {
        logger_.warn(failure);
    }
    if (batch.timed_out > 0) {
        logger_.warn("Site " + site + ": " + std::to_string(batch.timed_out) + " of " +
                     std::to_string(stats_.hosts_queried) + " " + what +
                     " host(s) did not answer within " + Utils::format_duration(pool_.timeout()) +
                     ", their status is Unknown");
    }
    logger_.debug("Site " + site + ": resolved " + std::to_string(stats_.resolved) + "/" +
                  std::to_string(stats_.hosts_queried) + " " + what + " disk image(s) in " +
                  Utils::format_duration(batch.elapsed));
}

} // namespace vdalign
