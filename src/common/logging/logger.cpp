// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <filesystem>
#include <string_view>
#include <unordered_map>

namespace common::logging {

    std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
    std::once_flag Logger::init_flag_;
    std::mutex Logger::configure_mutex_;

    void Logger::init() {
        std::lock_guard lock(configure_mutex_);
        if (!logger_) {
            logger_ = build(Options{});
        }
    }

    std::shared_ptr<spdlog::logger> Logger::build(const Options &options) {
        try {
            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

            if (options.to_file) {
                if (!std::filesystem::exists(options.directory)) {
                    std::filesystem::create_directories(options.directory);
                }
                const auto path = std::filesystem::path(options.directory) / options.filename;
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true));
            }

            auto logger = std::make_shared<spdlog::logger>("blueprint3d", sinks.begin(), sinks.end());
            logger->set_level(getLogLevel(options.level));
            logger->set_pattern(options.pattern);

            spdlog::drop("blueprint3d");
            spdlog::register_logger(logger);
            spdlog::set_default_logger(logger);
            return logger;
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error &ex) {
            std::cerr << "Log directory could not be created: " << ex.what() << std::endl;
        }
        return nullptr;
    }

    void Logger::configure(const Options &options) {
        std::call_once(init_flag_, &Logger::init);
        std::lock_guard lock(configure_mutex_);
        if (auto logger = build(options)) {
            logger_ = std::move(logger);
        }
    }

    spdlog::level::level_enum Logger::getLogLevel(const std::string &level) {
        static const std::unordered_map<std::string_view, spdlog::level::level_enum> level_map = {
                {"trace", spdlog::level::trace},
                {"debug", spdlog::level::debug},
                {"info", spdlog::level::info},
                {"warn", spdlog::level::warn},
                {"error", spdlog::level::err},
                {"critical", spdlog::level::critical},
                {"off", spdlog::level::off}
        };
        const auto iterator = level_map.find(level);
        return iterator != level_map.end() ? iterator->second : spdlog::level::info;
    }

    std::shared_ptr<spdlog::logger> Logger::getLogger() {
        std::call_once(init_flag_, &Logger::init);
        std::lock_guard lock(configure_mutex_);
        return logger_;
    }

}
