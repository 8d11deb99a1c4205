// src/report.cpp
// Implementation of report aggregation and rendering

#include "vdalign/report.hpp"
#include "vdalign/errors.hpp"
#include "vdalign/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace vdalign {

void ReportAggregator::add_records(const std::vector<ActionRecord>& records) {
    records_.insert(records_.end(), records.begin(), records.end());
}

void ReportAggregator::add_site(SiteSummary site) {
    sites_.push_back(std::move(site));
}

RunReport ReportAggregator::build(const RunCounters::Snapshot& counters,
                                  const std::vector<PendingTask>& unresolved,
                                  std::chrono::milliseconds elapsed,
                                  bool monitoring_skipped,
                                  bool simulated) const {
    RunReport report;
    for (const auto& record : records_) {
        ++report.by_status[Utils::update_status_to_string(record.status)];
        ++report.by_action[Utils::proposed_action_to_string(record.action)];
        const DiskImageId& image = record.disk_image();
        ++report.by_disk_image[image ? *image : std::string(UNRESOLVED_IMAGE_LABEL)];
    }

    report.sites = sites_;
    report.records = records_;
    report.counters = counters;
    report.unresolved_tasks = unresolved;
    report.restarts_pending = unresolved.size();
    report.elapsed = elapsed;
    report.monitoring_skipped = monitoring_skipped;
    report.simulated = simulated;
    return report;
}

namespace {

void write_group(std::ostringstream& oss, const std::string& title,
                 const std::map<std::string, size_t>& group) {
    oss << title << "\n";
    if (group.empty()) {
        oss << "  (none)\n";
        return;
    }
    size_t width = 0;
    for (const auto& entry : group) {
        width = std::max(width, entry.first.size());
    }
    for (const auto& entry : group) {
        oss << "  " << std::left << std::setw(static_cast<int>(width)) << entry.first
            << "  " << std::right << std::setw(6) << entry.second << "\n";
    }
}

void write_counter(std::ostringstream& oss, const std::string& label, uint64_t value) {
    oss << "  " << std::left << std::setw(24) << label << std::right << std::setw(6) << value << "\n";
}

} // namespace

std::string ReportAggregator::to_text(const RunReport& report) {
    std::ostringstream oss;

    oss << "Sites\n";
    for (const auto& site : report.sites) {
        oss << "  " << site.site << " via " << site.endpoint << ": "
            << site.machines_analyzed << " machine(s), ";
        if (site.session_pass_deferred) {
            oss << "session pass deferred";
        } else {
            oss << site.sessions_analyzed << " session(s)";
        }
        oss << "\n";
    }

    write_group(oss, "By update status", report.by_status);
    write_group(oss, "By proposed action", report.by_action);
    write_group(oss, "By disk image", report.by_disk_image);

    const auto& c = report.counters;
    oss << (report.simulated ? "Totals (simulated run)\n" : "Totals\n");
    write_counter(oss, "Nags sent", c.nags_sent);
    write_counter(oss, "Nags failed", c.nags_failed);
    if (report.simulated) {
        write_counter(oss, "Nags simulated", c.nags_simulated);
        write_counter(oss, "Restarts simulated", c.restarts_simulated);
    }
    write_counter(oss, "Restarts requested", c.restarts_requested);
    write_counter(oss, "Restarts failed", c.restarts_failed);
    write_counter(oss, "Restarts skipped", c.restarts_skipped);
    write_counter(oss, "Restarts throttled", c.restarts_throttled);
    write_counter(oss, "Restarts succeeded", c.restarts_succeeded);
    write_counter(oss, "Restarts ended failed", c.restarts_completed_failed);
    write_counter(oss, "Restarts pending", report.restarts_pending);
    oss << "  " << std::left << std::setw(24) << "Elapsed" << Utils::format_duration(report.elapsed) << "\n";
    if (report.monitoring_skipped) {
        oss << "  Power actions were not monitored\n";
    }
    return oss.str();
}

std::string ReportAggregator::to_json(const RunReport& report) {
    nlohmann::json doc;

    doc["by_status"] = report.by_status;
    doc["by_action"] = report.by_action;
    doc["by_disk_image"] = report.by_disk_image;

    nlohmann::json sites = nlohmann::json::array();
    for (const auto& site : report.sites) {
        sites.push_back({
            {"site", site.site},
            {"endpoint", site.endpoint},
            {"machines_analyzed", site.machines_analyzed},
            {"sessions_analyzed", site.sessions_analyzed},
            {"session_pass_deferred", site.session_pass_deferred}
        });
    }
    doc["sites"] = sites;

    nlohmann::json records = nlohmann::json::array();
    for (const auto& record : report.records) {
        nlohmann::json item;
        item["kind"] = Utils::entity_kind_to_string(record.kind());
        item["name"] = record.display_name();
        item["site"] = record.site();
        item["status"] = Utils::update_status_to_string(record.status);
        item["action"] = Utils::proposed_action_to_string(record.action);
        const DiskImageId& image = record.disk_image();
        if (image) {
            item["disk_image"] = *image;
        } else {
            item["disk_image"] = nullptr;
        }
        records.push_back(item);
    }
    doc["records"] = records;

    const auto& c = report.counters;
    doc["counters"] = {
        {"nags_sent", c.nags_sent},
        {"nags_failed", c.nags_failed},
        {"nags_simulated", c.nags_simulated},
        {"restarts_requested", c.restarts_requested},
        {"restarts_failed", c.restarts_failed},
        {"restarts_simulated", c.restarts_simulated},
        {"restarts_skipped", c.restarts_skipped},
        {"restarts_throttled", c.restarts_throttled},
        {"restarts_succeeded", c.restarts_succeeded},
        {"restarts_completed_failed", c.restarts_completed_failed},
        {"restarts_pending", report.restarts_pending}
    };

    nlohmann::json pending = nlohmann::json::array();
    for (const auto& task : report.unresolved_tasks) {
        pending.push_back({
            {"task_id", task.task_id},
            {"machine", task.machine_name},
            {"site", task.site},
            {"endpoint", task.endpoint}
        });
    }
    doc["unresolved_tasks"] = pending;
    doc["elapsed_ms"] = report.elapsed.count();
    doc["monitoring_skipped"] = report.monitoring_skipped;
    doc["simulated"] = report.simulated;

    return doc.dump(2);
}

void ReportAggregator::write_json(const RunReport& report, const std::string& path) {
    if (!Utils::write_file_contents(path, to_json(report) + "\n")) {
        throw Errors::file_write_failed(path);
    }
}

} // namespace vdalign
