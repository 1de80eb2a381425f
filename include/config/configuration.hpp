// File: config/configuration.hpp

#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "common/logging/logger.hpp"

/*
 * YAML-backed key/value configuration. Nested maps are flattened into dotted keys, so
 *   synthesis: { categories: { wall: { thickness: 0.2 } } }
 * is read back with get<double>("synthesis.categories.wall.thickness").
 *
 * The process-wide instance (initialize / getInstance) belongs to the command line front end only.
 * Library code receives explicit settings built from a Configuration instead of reading it.
 */
namespace config {
    class Configuration {
    public:
        Configuration(const Configuration &) = delete;

        Configuration &operator=(const Configuration &) = delete;

        Configuration(Configuration &&) = delete;

        Configuration &operator=(Configuration &&) = delete;

        ~Configuration() = default;

        // Loads the given YAML file. Throws std::runtime_error if it cannot be read or parsed.
        explicit Configuration(const std::string &filename);

        explicit Configuration(const YAML::Node &root);

        [[nodiscard]] static std::unique_ptr<Configuration> fromString(const std::string &yaml);

        // Initialize the process-wide configuration with a custom filepath
        static void initialize(const std::string &filename);

        // Get the process-wide instance, loading the default file on first use
        static Configuration &getInstance();

        // Check if a key exists in the configuration
        [[nodiscard]] bool contains(const std::string &key) const;

        // Log the entire configuration at debug level
        void show() const;

        [[nodiscard]] std::vector<std::string> keys() const;

        // Get a value of type T from the configuration
        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const;

        // Get a value of type T from the configuration with a default value
        template<typename T>
        [[nodiscard]] T get(const std::string &key, T default_value) const;

        // Specialization to handle const char* as std::string
        [[nodiscard]] std::string get(const std::string &key, const char *default_value) const;

    private:
        std::unordered_map<std::string, YAML::Node> config_map_;
        std::string source_;

        static constexpr std::string_view default_filename_ = "configuration.yaml";
        static std::unique_ptr<Configuration> instance_;
        static std::mutex instance_mutex_;

        // Load the entire configuration into a map
        void load(const YAML::Node &node, const std::string &prefix = "");
    };

    template<typename T>
    std::optional<T> Configuration::get(const std::string &key) const {
        const auto it = config_map_.find(key);
        if (it == config_map_.end()) {
            LOG_TRACE("Key '{}' not found in configuration", key);
            return std::nullopt;
        }
        try {
            return it->second.as<T>();
        } catch (const YAML::Exception &e) {
            LOG_ERROR("YAML parsing exception for key '{}': {}", key, e.what());
            return std::nullopt;
        }
    }

    template<typename T>
    T Configuration::get(const std::string &key, T default_value) const {
        auto value = get<T>(key);
        return value ? *value : default_value;
    }

    // Specialization to force const char* to std::string
    inline std::string Configuration::get(const std::string &key, const char *default_value) const {
        return get<std::string>(key, std::string(default_value));
    }

    inline bool Configuration::contains(const std::string &key) const { return config_map_.contains(key); }

    inline void initialize(const std::string &filename = {}) { Configuration::initialize(filename); }

} // namespace config

#endif // CONFIGURATION_HPP
