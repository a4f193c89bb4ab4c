#include "backscan/cleaning/CleaningConfig.hpp"
#include "backscan/core/exception.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace backscan {
namespace cleaning {

namespace {

const char* const kOptionNames[] = {
    "clean_by_curvature", "curv_high_thresh", "curv_low_thresh",
    "clean_by_variance", "variance_thresh",
    "clean_borders", "border_rings", "remove_islands"
};

bool parseBool(const std::string& name, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    BACKSCAN_THROW(core::ConfigException, "Expected a boolean for " + name + ", got '" + value + "'");
}

double parseDouble(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::logic_error& e) {
        // invalid_argument or out_of_range
        BACKSCAN_THROW(core::ConfigException,
                       "Expected a number for " + name + ", got '" + value + "': " + e.what());
    }
    if (consumed != value.size()) {
        BACKSCAN_THROW(core::ConfigException, "Expected a number for " + name + ", got '" + value + "'");
    }
    return result;
}

int parseInt(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::logic_error& e) {
        BACKSCAN_THROW(core::ConfigException,
                       "Expected an integer for " + name + ", got '" + value + "': " + e.what());
    }
    if (consumed != value.size()) {
        BACKSCAN_THROW(core::ConfigException, "Expected an integer for " + name + ", got '" + value + "'");
    }
    return result;
}

} // namespace

bool CleaningConfig::validate() const {
    return validationError().empty();
}

std::string CleaningConfig::validationError() const {
    if (!std::isfinite(curv_high_thresh) || !std::isfinite(curv_low_thresh)) {
        return "curvature thresholds must be finite";
    }
    if (!std::isfinite(variance_thresh)) {
        return "variance_thresh must be finite";
    }
    if (border_rings < 0) {
        return "border_rings must be non-negative";
    }
    return "";
}

std::string CleaningConfig::toString() const {
    std::stringstream ss;
    ss << "Mesh Cleaning Configuration:\n";
    ss << "  Curvature Stage: " << (clean_by_curvature ? "Enabled" : "Disabled");
    if (clean_by_curvature) {
        ss << " (keep " << curv_low_thresh << " <= H <= " << curv_high_thresh << ")";
    }
    ss << "\n";
    ss << "  Variance Stage: " << (clean_by_variance ? "Enabled" : "Disabled");
    if (clean_by_variance) {
        ss << " (threshold " << variance_thresh << ")";
    }
    ss << "\n";
    ss << "  Border Stage: " << (clean_borders ? "Enabled" : "Disabled");
    if (clean_borders) {
        ss << " (" << border_rings << " rings)";
    }
    ss << "\n";
    ss << "  Island Stage: " << (remove_islands ? "Enabled" : "Disabled");
    return ss.str();
}

CleaningConfig CleaningConfig::fromConfiguration(const core::Configuration& config,
                                                 const std::string& section) {
    const std::string prefix = section.empty() ? "" : section + ".";
    CleaningConfig result;

    result.clean_by_curvature = config.get<bool>(prefix + "clean_by_curvature", result.clean_by_curvature);
    result.curv_high_thresh = config.get<double>(prefix + "curv_high_thresh", result.curv_high_thresh);
    result.curv_low_thresh = config.get<double>(prefix + "curv_low_thresh", result.curv_low_thresh);
    result.clean_by_variance = config.get<bool>(prefix + "clean_by_variance", result.clean_by_variance);
    result.variance_thresh = config.get<double>(prefix + "variance_thresh", result.variance_thresh);
    result.clean_borders = config.get<bool>(prefix + "clean_borders", result.clean_borders);
    result.border_rings = config.get<int>(prefix + "border_rings", result.border_rings);
    result.remove_islands = config.get<bool>(prefix + "remove_islands", result.remove_islands);

    const std::string error = result.validationError();
    if (!error.empty()) {
        BACKSCAN_THROW(core::ConfigException, "Invalid cleaning configuration: " + error);
    }
    return result;
}

void CleaningConfig::applyOverrides(const std::map<std::string, std::string>& overrides) {
    CleaningConfig updated = *this;

    for (const auto& entry : overrides) {
        const std::string& name = entry.first;
        const std::string& value = entry.second;
        if (name == "clean_by_curvature") updated.clean_by_curvature = parseBool(name, value);
        else if (name == "curv_high_thresh") updated.curv_high_thresh = parseDouble(name, value);
        else if (name == "curv_low_thresh") updated.curv_low_thresh = parseDouble(name, value);
        else if (name == "clean_by_variance") updated.clean_by_variance = parseBool(name, value);
        else if (name == "variance_thresh") updated.variance_thresh = parseDouble(name, value);
        else if (name == "clean_borders") updated.clean_borders = parseBool(name, value);
        else if (name == "border_rings") updated.border_rings = parseInt(name, value);
        else if (name == "remove_islands") updated.remove_islands = parseBool(name, value);
        else BACKSCAN_THROW(core::ConfigException, "Unknown cleaning option '" + name + "'");
    }

    const std::string error = updated.validationError();
    if (!error.empty()) {
        BACKSCAN_THROW(core::ConfigException, "Invalid cleaning override: " + error);
    }
    *this = updated;
}

bool CleaningConfig::isOption(const std::string& name) {
    for (const char* known : kOptionNames) {
        if (name == known) return true;
    }
    return false;
}

} // namespace cleaning
} // namespace backscan
