// File: reconstruction/errors.hpp

#ifndef RECONSTRUCTION_ERRORS_HPP
#define RECONSTRUCTION_ERRORS_HPP

#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace reconstruction {

    class ReconstructionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // No usable scale could be established. Aborts the whole reconstruction.
    class CalibrationError final : public ReconstructionError {
    public:
        enum class Reason { NoReference, MissingBoundingBox, ZeroPixelHeight, InvalidOverride };

        CalibrationError(Reason reason, const std::string &message, std::optional<std::size_t> index = std::nullopt,
                         std::string label = {}) :
            ReconstructionError(message), reason_(reason), index_(index), label_(std::move(label)) {}

        [[nodiscard]] Reason reason() const noexcept { return reason_; }
        [[nodiscard]] std::optional<std::size_t> index() const noexcept { return index_; }
        [[nodiscard]] const std::string &label() const noexcept { return label_; }

    private:
        Reason reason_;
        std::optional<std::size_t> index_;
        std::string label_;
    };

    // A single detection cannot be turned into geometry. Recovered per detection, never fatal by itself.
    class MalformedDetectionError final : public ReconstructionError {
    public:
        MalformedDetectionError(std::size_t index, std::string label, const std::string &message) :
            ReconstructionError(message), index_(index), label_(std::move(label)) {}

        [[nodiscard]] std::size_t index() const noexcept { return index_; }
        [[nodiscard]] const std::string &label() const noexcept { return label_; }

    private:
        std::size_t index_;
        std::string label_;
    };

    // Nothing survived synthesis, so there is nothing to frame.
    class EmptySceneError final : public ReconstructionError {
    public:
        explicit EmptySceneError(const std::string &message, std::size_t skipped = 0) :
            ReconstructionError(message), skipped_(skipped) {}

        [[nodiscard]] std::size_t skipped() const noexcept { return skipped_; }

    private:
        std::size_t skipped_;
    };

    enum ExitCode : int { kSuccess = 0, kFailure = 1, kCalibrationFailed = 2, kEmptyScene = 3 };

    // Process exit status reported by the command line for a failed run.
    [[nodiscard]] inline ExitCode exitCodeFor(const std::exception &error) noexcept {
        if (dynamic_cast<const CalibrationError *>(&error) != nullptr) {
            return kCalibrationFailed;
        }
        if (dynamic_cast<const EmptySceneError *>(&error) != nullptr) {
            return kEmptyScene;
        }
        return kFailure;
    }

} // namespace reconstruction

#endif // RECONSTRUCTION_ERRORS_HPP
