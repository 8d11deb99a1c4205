// include/vdalign/classifier.hpp
// Purpose: Maps a disk image identifier to an update status

#pragma once

#include "types.hpp"
#include <string>
#include <regex>

namespace vdalign {

// Patterns are ECMAScript regular expressions matched case-insensitively
// anywhere in the identifier; anchor them to require a full match.
class PatternClassifier {
public:
    // Throws ConfigError if either pattern is empty or does not compile
    PatternClassifier(const std::string& all_versions_pattern,
                      const std::string& target_version_pattern);

    UpdateStatus classify(const DiskImageId& disk_image) const;

    bool is_managed(const std::string& disk_image) const;
    bool is_target(const std::string& disk_image) const;

    const std::string& all_versions_pattern() const noexcept { return all_versions_source_; }
    const std::string& target_version_pattern() const noexcept { return target_version_source_; }

private:
    std::string all_versions_source_;
    std::string target_version_source_;
    std::regex all_versions_;
    std::regex target_version_;
};

// One-shot classification; compiles both patterns on every call
UpdateStatus classify(const DiskImageId& disk_image,
                      const std::string& all_versions_pattern,
                      const std::string& target_version_pattern);

} // namespace vdalign
