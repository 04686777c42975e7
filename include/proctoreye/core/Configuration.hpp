#pragma once

#include <yaml-cpp/yaml.h>
#include <mutex>
#include <string>

namespace proctoreye {
namespace core {

/**
 * Configuration management class
 *
 * Wraps a YAML document. Keys are dot-separated paths into nested maps,
 * e.g. "engine.blink.ear_threshold".
 */
class Configuration {
public:
    /**
     * Get singleton instance
     */
    static Configuration& getInstance();

    /**
     * Load configuration from file
     * @throws ConfigurationException with ERROR_FILE_NOT_FOUND if the file is
     *         missing, ERROR_CONFIG_PARSE if it is malformed
     */
    void load(const std::string& filename);

    /**
     * Load configuration from an in-memory YAML document
     * @throws ConfigurationException if the text is malformed
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
     * @throws ConfigurationException if the key exists with an incompatible type
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = lookup(key);
        if (!node || node.IsNull()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception& e) {
            throwBadValue(key, e.what());
        }
        return defaultValue;
    }

    /**
     * Get configuration filename
     */
    std::string getFilename() const;

private:
    Configuration() = default;
    ~Configuration() = default;

    // Delete copy/move
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    YAML::Node lookup(const std::string& key) const;
    [[noreturn]] static void throwBadValue(const std::string& key, const std::string& reason);

    mutable std::mutex mutex_;
    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace proctoreye
