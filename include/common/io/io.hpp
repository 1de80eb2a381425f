// File: common/io/io.hpp

#ifndef IO_HPP
#define IO_HPP

#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "common/logging/logger.hpp"
#include "common/utilities/string.hpp"

namespace common::io {

    /**
     * @brief Checks if a regular file exists and can be opened.
     *
     * @param file_path Path to the file.
     * @return true if the file exists, false otherwise.
     */
    inline bool fileExists(std::string_view file_path) {
        if (const std::filesystem::path path(file_path);
            std::filesystem::is_regular_file(path) && std::ifstream(path).good()) {
            LOG_TRACE("File exists: {}", file_path);
            return true;
        }

        LOG_DEBUG("File does not exist: {}", file_path);
        return false;
    }

    /**
     * @brief Lower-case extension of a path including the dot (".json"), or an empty string.
     */
    inline std::string extension(std::string_view file_path) {
        return common::utilities::toLower(std::filesystem::path(file_path).extension().string());
    }

    /**
     * @brief Creates the parent directory of a file path if it is missing.
     *
     * @throws std::runtime_error if the directory could not be created.
     */
    inline void ensureParentDirectory(std::string_view file_path) {
        const auto parent = std::filesystem::path(file_path).parent_path();
        if (parent.empty() || std::filesystem::exists(parent)) {
            return;
        }

        LOG_DEBUG("Creating directory: {}", parent.string());
        try {
            std::filesystem::create_directories(parent);
        } catch (const std::filesystem::filesystem_error &e) {
            LOG_ERROR("Filesystem error: {}", e.what());
            throw std::runtime_error(fmt::format("Could not create directory: {}", parent.string()));
        }
    }

    /**
     * @brief Writes text to a file, replacing existing content. Creates missing parent directories.
     *
     * @throws std::runtime_error if the file could not be written.
     */
    inline void writeTextFile(std::string_view file_path, std::string_view content) {
        ensureParentDirectory(file_path);

        std::ofstream file{std::filesystem::path(file_path)};
        if (!file.is_open()) {
            LOG_ERROR("Failed to open file for writing: {}", file_path);
            throw std::runtime_error(fmt::format("Failed to open file for writing: {}", file_path));
        }
        file << content;
        if (!file) {
            LOG_ERROR("Failed to write file: {}", file_path);
            throw std::runtime_error(fmt::format("Failed to write file: {}", file_path));
        }
        LOG_DEBUG("Wrote {} bytes to {}", content.size(), file_path);
    }

} // namespace common::io

#endif // IO_HPP
