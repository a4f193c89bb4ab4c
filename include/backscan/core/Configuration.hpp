#pragma once

#include "backscan/core/exception.h"
#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace backscan {
namespace core {

/**
 * YAML-backed configuration store
 *
 * Keys are dot-separated paths into the document, e.g.
 * "cleaning.border_rings" reads `border_rings` under the `cleaning` map.
 * Missing keys fall back to the supplied default; a present key whose
 * value cannot be converted raises ConfigException.
 */
class Configuration {
public:
    Configuration() = default;

    /**
     * Process-wide instance used by the command-line tool
     */
    static Configuration& getInstance();

    /**
     * Load configuration from a YAML file
     * @throws FileException if the file is missing
     * @throws ConfigException if the YAML cannot be parsed
     */
    void load(const std::string& filename);

    /**
     * Load configuration from YAML text
     * @throws ConfigException if the YAML cannot be parsed
     */
    void loadFromString(const std::string& yaml);

    /**
     * Clear all configuration
     */
    void clear();

    /**
     * Check if key exists
     */
    bool has(const std::string& key) const;

    /**
     * Get value, or defaultValue when the key is absent
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        YAML::Node node = lookup(key);
        if (!node.IsDefined() || node.IsNull()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::BadConversion& e) {
            BACKSCAN_THROW(ConfigException,
                           "Invalid value for '" + key + "': " + std::string(e.what()));
        }
    }

    /**
     * File the configuration was loaded from, empty for string/default config
     */
    std::string getFilename() const { return currentFile_; }

private:
    YAML::Node lookup(const std::string& key) const;

    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace backscan
