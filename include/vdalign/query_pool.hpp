// include/vdalign/query_pool.hpp
// Purpose: Bounded concurrent fan-out of disk image queries with a batch deadline

#pragma once

#include "types.hpp"
#include "broker.hpp"
#include <map>
#include <memory>
#include <vector>
#include <string>
#include <chrono>

namespace vdalign {

// Outcome of one batch of host queries
struct QueryBatchResult {
    std::map<HostName, DiskImageId> identifiers;   // Every requested host, nullopt if unresolved
    size_t answered = 0;                           // Resolver returned before the deadline
    size_t timed_out = 0;                          // No answer before the deadline
    size_t failed = 0;                             // Resolver threw
    std::chrono::milliseconds elapsed{0};
    std::vector<std::string> failures;             // One message per failed host

    DiskImageId lookup(const HostName& host) const;
};

// Runs one query per distinct host on at most concurrency_limit worker threads.
// The timeout covers the whole batch: hosts still unanswered when it expires
// resolve to nullopt and their workers are abandoned to finish on their own.
class DiskImageQueryPool {
public:
    DiskImageQueryPool(std::shared_ptr<DiskImageResolver> resolver,
                       size_t concurrency_limit,
                       std::chrono::milliseconds timeout);

    QueryBatchResult resolve(const std::vector<HostName>& hosts);

    size_t concurrency_limit() const noexcept { return concurrency_limit_; }
    std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::shared_ptr<DiskImageResolver> resolver_;
    size_t concurrency_limit_;
    std::chrono::milliseconds timeout_;
};

} // namespace vdalign
