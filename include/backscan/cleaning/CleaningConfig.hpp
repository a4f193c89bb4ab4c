#pragma once

#include "backscan/core/Configuration.hpp"
#include <map>
#include <string>

namespace backscan {
namespace cleaning {

/**
 * @brief Stage switches and thresholds for the cleaning pipeline
 *
 * Defaults are tuned for back-surface scans in millimeters with
 * mean curvature in 1/mm.
 */
struct CleaningConfig {
    // Stage 1: absolute curvature
    bool clean_by_curvature = true;
    double curv_high_thresh = 0.05;
    double curv_low_thresh = -0.1;

    // Stage 2: neighborhood curvature variance
    bool clean_by_variance = true;
    double variance_thresh = 0.001;

    // Stage 3: border rings
    bool clean_borders = true;
    int border_rings = 5;

    // Stage 4: island removal (face level)
    bool remove_islands = true;

    /**
     * @brief Validate configuration parameters
     */
    bool validate() const;

    /**
     * @brief Why validate() fails, empty when valid
     */
    std::string validationError() const;

    /**
     * @brief Get human-readable configuration string
     */
    std::string toString() const;

    /**
     * @brief Read keys under `section` (e.g. "cleaning.border_rings");
     *        absent keys keep their defaults
     * @throws core::ConfigException on a mistyped value or invalid result
     */
    static CleaningConfig fromConfiguration(const core::Configuration& config,
                                            const std::string& section = "cleaning");

    /**
     * @brief Apply textual overrides keyed by option name
     *        (e.g. {"border_rings", "3"}, {"clean_borders", "off"})
     *
     * Booleans accept true/false, 1/0, yes/no and on/off. The config is
     * left unchanged when any override is rejected.
     * @throws core::ConfigException on an unknown option, a malformed value
     *         or a result that fails validate()
     */
    void applyOverrides(const std::map<std::string, std::string>& overrides);

    /**
     * @brief Whether `name` is one of the eight cleaning options
     */
    static bool isOption(const std::string& name);
};

} // namespace cleaning
} // namespace backscan
