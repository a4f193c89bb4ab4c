#include "backscan/core/Configuration.hpp"
#include <sstream>
#include <sys/stat.h>

namespace backscan {
namespace core {

namespace {

std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::load(const std::string& filename) {
    struct stat st;
    if (stat(filename.c_str(), &st) != 0) {
        BACKSCAN_THROW_CODE(FileException, ResultCode::ERROR_FILE_NOT_FOUND,
                            "Configuration file not found: " + filename);
    }

    try {
        root_ = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        BACKSCAN_THROW(ConfigException,
                       "Failed to parse " + filename + ": " + std::string(e.what()));
    }
    currentFile_ = filename;
}

void Configuration::loadFromString(const std::string& yaml) {
    try {
        root_ = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        BACKSCAN_THROW(ConfigException, "Failed to parse configuration: " + std::string(e.what()));
    }
    currentFile_.clear();
}

void Configuration::clear() {
    root_ = YAML::Node();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    YAML::Node node = lookup(key);
    return node.IsDefined() && !node.IsNull();
}

YAML::Node Configuration::lookup(const std::string& key) const {
    // reset() rebinds without writing through; const operator[] never inserts
    YAML::Node node;
    node.reset(root_);
    for (const auto& part : splitKey(key)) {
        if (!node.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node& current = node;
        YAML::Node child = current[part];
        if (!child.IsDefined()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        node.reset(child);
    }
    return node;
}

} // namespace core
} // namespace backscan
