#pragma once

#include <yaml-cpp/yaml.h>
#include <mutex>
#include <string>

namespace facecue {
namespace core {

/**
 * Configuration management class
 *
 * Holds a YAML document and resolves dotted keys ("eye.min_blink_frames")
 * against its nested sections. Thread-safe.
 */
class Configuration {
public:
    Configuration() = default;

    /**
     * Get process-wide instance
     */
    static Configuration& getInstance();

    /**
     * Load configuration from a YAML file.
     * @throws FileException if the file is missing or cannot be parsed
     */
    void load(const std::string& filename);

    /**
     * Load configuration from YAML text.
     * @throws ConfigException if the text cannot be parsed
     */
    void loadFromString(const std::string& yaml);

    /**
     * Reload from the last loaded file
     */
    void reload();

    /**
     * Clear all configuration
     */
    void clear();

    /**
     * Check if a scalar value exists at key
     */
    bool has(const std::string& key) const;

    /**
     * Read the value at key. Returns false when the key is missing or its
     * value does not convert to T; out is untouched in that case.
     */
    template<typename T>
    bool tryGet(const std::string& key, T& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = findNode(key);
        if (!node || !node.IsScalar()) {
            return false;
        }
        try {
            out = node.as<T>();
            return true;
        } catch (const YAML::Exception&) {
            return false;
        }
    }

    /**
     * Get value or default
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        T value = defaultValue;
        if (!tryGet(key, value)) {
            return defaultValue;
        }
        return value;
    }

    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    bool getBool(const std::string& key, bool defaultValue = false) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * Get configuration filename
     */
    std::string getFilename() const;

private:
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    YAML::Node findNode(const std::string& key) const;

    mutable std::mutex mutex_;
    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace facecue
