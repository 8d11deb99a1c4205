// src/classifier.cpp
// Implementation of disk image classification

#include "vdalign/classifier.hpp"
#include "vdalign/errors.hpp"

namespace vdalign {

namespace {

std::regex compile_pattern(const std::string& field, const std::string& pattern) {
    if (pattern.empty()) {
        throw Errors::invalid_pattern(field, pattern, "empty pattern");
    }
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw Errors::invalid_pattern(field, pattern, e.what());
    }
}

} // namespace

PatternClassifier::PatternClassifier(const std::string& all_versions_pattern,
                                     const std::string& target_version_pattern)
    : all_versions_source_(all_versions_pattern)
    , target_version_source_(target_version_pattern)
    , all_versions_(compile_pattern("all_versions_pattern", all_versions_pattern))
    , target_version_(compile_pattern("target_version_pattern", target_version_pattern)) {}

UpdateStatus PatternClassifier::classify(const DiskImageId& disk_image) const {
    if (!disk_image) {
        return UpdateStatus::UNKNOWN;
    }
    if (!is_managed(*disk_image)) {
        return UpdateStatus::INELIGIBLE;
    }
    if (is_target(*disk_image)) {
        return UpdateStatus::UPDATE_COMPLETED;
    }
    return UpdateStatus::RESTART_REQUIRED;
}

bool PatternClassifier::is_managed(const std::string& disk_image) const {
    return std::regex_search(disk_image, all_versions_);
}

bool PatternClassifier::is_target(const std::string& disk_image) const {
    return std::regex_search(disk_image, target_version_);
}

UpdateStatus classify(const DiskImageId& disk_image,
                      const std::string& all_versions_pattern,
                      const std::string& target_version_pattern) {
    if (!disk_image) {
        return UpdateStatus::UNKNOWN;
    }
    return PatternClassifier(all_versions_pattern, target_version_pattern).classify(disk_image);
}

} // namespace vdalign
