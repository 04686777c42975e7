#include "proctoreye/core/Configuration.hpp"
#include "proctoreye/core/exception.h"
#include "proctoreye/core/Logger.hpp"
#include <fstream>
#include <sstream>
#include <vector>

namespace proctoreye {
namespace core {

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::load(const std::string& filename) {
    std::ifstream existing(filename);
    if (!existing.good()) {
        PROCTOREYE_THROW_CODE(ConfigurationException, ResultCode::ERROR_FILE_NOT_FOUND,
                              "Configuration file not found: " + filename);
    }

    YAML::Node parsed;
    try {
        parsed = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        PROCTOREYE_THROW(ConfigurationException,
                         "Failed to parse " + filename + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_ = parsed;
    currentFile_ = filename;
    LOG_INFO("Configuration loaded from " + filename);
}

void Configuration::loadFromString(const std::string& yaml) {
    YAML::Node parsed;
    try {
        parsed = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        PROCTOREYE_THROW(ConfigurationException,
                         std::string("Failed to parse configuration text: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_ = parsed;
    currentFile_.clear();
}

void Configuration::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_ = YAML::Node();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node node = lookup(key);
    return node && !node.IsNull();
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFile_;
}

namespace {

// Const traversal only: assigning one YAML::Node to another rebinds the tree
YAML::Node findNode(const YAML::Node& node, const std::vector<std::string>& parts, size_t index) {
    if (index == parts.size()) {
        return node;
    }
    if (!node.IsMap()) {
        return YAML::Node();
    }
    const YAML::Node child = node[parts[index]];
    if (!child) {
        return YAML::Node();
    }
    return findNode(child, parts, index + 1);
}

} // namespace

YAML::Node Configuration::lookup(const std::string& key) const {
    std::vector<std::string> parts;
    std::istringstream path(key);
    std::string part;
    while (std::getline(path, part, '.')) {
        parts.push_back(part);
    }
    if (parts.empty() || !root_ || root_.IsNull()) {
        return YAML::Node();
    }
    return findNode(root_, parts, 0);
}

void Configuration::throwBadValue(const std::string& key, const std::string& reason) {
    PROCTOREYE_THROW(ConfigurationException, "Invalid value for '" + key + "': " + reason);
}

} // namespace core
} // namespace proctoreye
