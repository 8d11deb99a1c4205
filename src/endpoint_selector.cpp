// src/endpoint_selector.cpp
// Implementation of endpoint health filtering and per-site selection

#include "vdalign/endpoint_selector.hpp"
#include "vdalign/errors.hpp"

namespace vdalign {

EndpointHealthSelector::EndpointHealthSelector(BrokerClient& broker, Logger& logger)
    : broker_(broker), logger_(logger) {}

SiteEndpoints EndpointHealthSelector::select(const std::vector<Endpoint>& candidates) {
    SiteEndpoints selected;
    checks_.clear();

    for (const auto& endpoint : candidates) {
        EndpointCheck check;
        check.endpoint = endpoint;
        check.probe = probe_endpoint(endpoint);

        if (!check.probe.healthy()) {
            check.note = "unhealthy";
            logger_.warn("Skipping endpoint " + endpoint + ": broker=" +
                         Utils::subsystem_status_to_string(check.probe.broker) + ", hypervisor=" +
                         Utils::subsystem_status_to_string(check.probe.hypervisor));
            checks_.push_back(std::move(check));
            continue;
        }

        check.site = lookup_site(endpoint);
        if (!check.site) {
            check.note = "no site identity";
            logger_.warn("Skipping endpoint " + endpoint + ": site identity unavailable");
            checks_.push_back(std::move(check));
            continue;
        }

        auto inserted = selected.emplace(*check.site, endpoint);
        if (!inserted.second) {
            check.note = "duplicate of " + inserted.first->second;
            logger_.info("Discarding endpoint " + endpoint + " for site " + *check.site +
                         ", already bound to " + inserted.first->second);
        } else {
            check.selected = true;
            logger_.info("Site " + *check.site + " bound to endpoint " + endpoint);
        }
        checks_.push_back(std::move(check));
    }

    if (selected.empty()) {
        throw Errors::no_healthy_endpoint(candidates.size());
    }
    return selected;
}

HealthProbe EndpointHealthSelector::probe_endpoint(const Endpoint& endpoint) {
    try {
        return broker_.probe(endpoint);
    } catch (const std::exception& e) {
        logger_.warn(Errors::probe_failed(endpoint, e.what()).what());
        return HealthProbe{SubsystemStatus::OFFLINE, SubsystemStatus::OFFLINE};
    }
}

std::optional<SiteId> EndpointHealthSelector::lookup_site(const Endpoint& endpoint) {
    try {
        auto site = broker_.site_of(endpoint);
        if (site && site->empty()) {
            return std::nullopt;
        }
        return site;
    } catch (const std::exception& e) {
        logger_.warn(Errors::site_lookup_failed(endpoint, e.what()).what());
        return std::nullopt;
    }
}

} // namespace vdalign
