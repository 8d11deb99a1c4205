// include/vdalign/vdalign.hpp
// Purpose: Main header file for the vdalign engine
// This is the primary include for programs driving an alignment run

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "broker.hpp"
#include "classifier.hpp"
#include "report.hpp"
#include "orchestrator.hpp"
#include "utils.hpp"

namespace vdalign {

// Version information
constexpr const char* VERSION = "1.0.0";
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

// Get engine version
inline std::string version() {
    return VERSION;
}

} // namespace vdalign
