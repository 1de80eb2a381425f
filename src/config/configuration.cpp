// File: config/configuration.cpp

#include "config/configuration.hpp"

#include <algorithm>
#include <stdexcept>

namespace config {

    std::unique_ptr<Configuration> Configuration::instance_;
    std::mutex Configuration::instance_mutex_;

    void Configuration::initialize(const std::string &filename) {
        auto configuration = std::make_unique<Configuration>(filename.empty() ? std::string(default_filename_)
                                                                              : filename);
        std::lock_guard lock(instance_mutex_);
        instance_ = std::move(configuration);
    }

    Configuration &Configuration::getInstance() {
        std::lock_guard lock(instance_mutex_);
        if (!instance_) {
            instance_ = std::make_unique<Configuration>(std::string(default_filename_));
        }
        return *instance_;
    }

    Configuration::Configuration(const std::string &filename) : source_(filename) {
        LOG_INFO("Loading configuration from file: {}", filename);

        try {
            const YAML::Node root = YAML::LoadFile(filename);
            load(root);
            LOG_INFO("Configuration file '{}' loaded successfully ({} keys).", filename, config_map_.size());
        } catch (const YAML::BadFile &e) {
            LOG_CRITICAL("Configuration file '{}' could not be opened: {}", filename, e.what());
            throw std::runtime_error("Configuration file could not be opened: " + filename);
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration '{}': {}", filename, e.what());
            throw std::runtime_error("YAML exception while loading configuration: " + filename);
        }
    }

    Configuration::Configuration(const YAML::Node &root) : source_("<memory>") {
        try {
            load(root);
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration: {}", e.what());
            throw std::runtime_error("YAML exception while loading configuration");
        }
    }

    std::unique_ptr<Configuration> Configuration::fromString(const std::string &yaml) {
        try {
            return std::make_unique<Configuration>(YAML::Load(yaml));
        } catch (const YAML::ParserException &e) {
            LOG_ERROR("Could not parse configuration text: {}", e.what());
            throw std::runtime_error(std::string("Could not parse configuration text: ") + e.what());
        }
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        if (!node.IsMap()) {
            if (prefix.empty() && !node.IsNull()) {
                throw std::runtime_error("Configuration root must be a map");
            }
            return;
        }

        for (const auto &it: node) {
            std::string key = prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
            if (it.second.IsMap()) {
                LOG_TRACE("Loading nested map for key: '{}'", key);
                load(it.second, key); // Recursively load nested maps
            } else {
                LOG_TRACE("Loaded key: '{}', value: '{}'", key,
                          it.second.IsScalar() ? it.second.as<std::string>() : "[non-scalar]");
                config_map_[key] = it.second;
            }
        }
    }

    std::vector<std::string> Configuration::keys() const {
        std::vector<std::string> keys;
        keys.reserve(config_map_.size());
        for (const auto &entry: config_map_) {
            keys.push_back(entry.first);
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    void Configuration::show() const {
        LOG_DEBUG("Configuration details ({}):", source_);
        for (const auto &key: keys()) {
            const YAML::Node &value = config_map_.at(key);
            if (value.IsScalar()) {
                LOG_DEBUG("{}: {}", key, value.as<std::string>());
            } else {
                LOG_DEBUG("{}: [non-scalar]", key);
            }
        }
    }
}
