// include/vdalign/endpoint_selector.hpp
// Purpose: Picks one healthy management endpoint per site

#pragma once

#include "types.hpp"
#include "broker.hpp"
#include "logging.hpp"
#include <map>
#include <vector>
#include <optional>

namespace vdalign {

// Site identity -> the endpoint bound to it for the run
using SiteEndpoints = std::map<SiteId, Endpoint>;

// Outcome of checking one candidate, kept for reporting
struct EndpointCheck {
    Endpoint endpoint;
    HealthProbe probe;
    std::optional<SiteId> site;
    bool selected = false;
    std::string note;
};

class EndpointHealthSelector {
public:
    EndpointHealthSelector(BrokerClient& broker, Logger& logger);

    // Candidates are checked in order; the first healthy endpoint of a site wins
    // and later ones for the same site are dropped.
    // Throws FatalError when no candidate is healthy.
    SiteEndpoints select(const std::vector<Endpoint>& candidates);

    const std::vector<EndpointCheck>& checks() const noexcept { return checks_; }

private:
    BrokerClient& broker_;
    Logger& logger_;
    std::vector<EndpointCheck> checks_;

    HealthProbe probe_endpoint(const Endpoint& endpoint);
    std::optional<SiteId> lookup_site(const Endpoint& endpoint);
};

} // namespace vdalign
