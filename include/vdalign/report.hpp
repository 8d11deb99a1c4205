// include/vdalign/report.hpp
// Purpose: Grouped summaries and final counters for a run

#pragma once

#include "types.hpp"
#include "run_context.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace vdalign {

// Label used for records whose disk image could not be resolved
constexpr const char* UNRESOLVED_IMAGE_LABEL = "(unknown)";

struct SiteSummary {
    SiteId site;
    Endpoint endpoint;
    size_t machines_analyzed = 0;
    size_t sessions_analyzed = 0;
    bool session_pass_deferred = false;   // Held back by outstanding machine restarts
};

struct RunReport {
    std::map<std::string, size_t> by_status;
    std::map<std::string, size_t> by_action;
    std::map<std::string, size_t> by_disk_image;

    std::vector<SiteSummary> sites;
    std::vector<ActionRecord> records;

    RunCounters::Snapshot counters;
    size_t restarts_pending = 0;
    std::vector<PendingTask> unresolved_tasks;
    std::chrono::milliseconds elapsed{0};
    bool monitoring_skipped = false;
    bool simulated = false;
};

class ReportAggregator {
public:
    void add_records(const std::vector<ActionRecord>& records);
    void add_site(SiteSummary site);

    // unresolved: tasks not known to be terminal when the run ended
    RunReport build(const RunCounters::Snapshot& counters,
                    const std::vector<PendingTask>& unresolved,
                    std::chrono::milliseconds elapsed,
                    bool monitoring_skipped = false,
                    bool simulated = false) const;

    static std::string to_text(const RunReport& report);
    static std::string to_json(const RunReport& report);

    // Throws SystemError if the file cannot be written
    static void write_json(const RunReport& report, const std::string& path);

    size_t record_count() const noexcept { return records_.size(); }

private:
    std::vector<ActionRecord> records_;
    std::vector<SiteSummary> sites_;
};

} // namespace vdalign
