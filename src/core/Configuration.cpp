#include "facecue/core/Configuration.hpp"
#include "facecue/core/exception.h"
#include "facecue/core/Logger.hpp"

#include <sstream>
#include <sys/stat.h>

namespace facecue {
namespace core {

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::load(const std::string& filename) {
    struct stat st;
    if (stat(filename.c_str(), &st) != 0) {
        FACECUE_THROW_CODE(FileException, ResultCode::ERROR_FILE_NOT_FOUND,
                           "Configuration file not found: " + filename);
    }

    YAML::Node parsed;
    try {
        parsed = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        FACECUE_THROW_CODE(FileException, ResultCode::ERROR_FILE_IO,
                           "Cannot parse configuration file " + filename + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset(parsed);
    currentFile_ = filename;
    LOG_INFO("Configuration loaded from " + filename);
}

void Configuration::loadFromString(const std::string& yaml) {
    YAML::Node parsed;
    try {
        parsed = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        FACECUE_THROW(ConfigException, std::string("Cannot parse configuration: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset(parsed);
    currentFile_.clear();
}

void Configuration::reload() {
    std::string file = getFilename();
    if (file.empty()) {
        FACECUE_THROW_CODE(FileException, ResultCode::ERROR_NOT_INITIALIZED,
                           "No configuration file loaded");
    }
    load(file);
}

void Configuration::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node node = findNode(key);
    return node && node.IsScalar();
}

YAML::Node Configuration::findNode(const std::string& key) const {
    if (!root_ || !root_.IsMap()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }

    // reset() rebinds; plain assignment would write through into root_
    YAML::Node current;
    current.reset(root_);

    std::istringstream parts(key);
    std::string part;
    while (std::getline(parts, part, '.')) {
        if (!current.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node& view = current;
        YAML::Node child = view[part];
        if (!child) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        current.reset(child);
    }
    return current;
}

int Configuration::getInt(const std::string& key, int defaultValue) const {
    return get<int>(key, defaultValue);
}

double Configuration::getDouble(const std::string& key, double defaultValue) const {
    return get<double>(key, defaultValue);
}

bool Configuration::getBool(const std::string& key, bool defaultValue) const {
    return get<bool>(key, defaultValue);
}

std::string Configuration::getString(const std::string& key, const std::string& defaultValue) const {
    return get<std::string>(key, defaultValue);
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFile_;
}

} // namespace core
} // namespace facecue
