#ifndef SKULD_COMMON_ERROR_HPP
#define SKULD_COMMON_ERROR_HPP
// Failure taxonomy shared by every module. Structural problems derive from the
// std::invalid_argument / std::length_error families, runtime problems from
// std::runtime_error, so callers that only care about the standard families keep working.

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Skuld::Error {
    // Plan violates a structural / feasibility rule (degrees, mesh divisibility, layer tiling).
    class InvalidPlan : public std::invalid_argument {
    public:
        explicit InvalidPlan(const std::string& message)
            : std::invalid_argument("Invalid plan: " + message) {}
    };

    class GraphTooLarge : public std::length_error {
    public:
        GraphTooLarge(std::size_t node_count, std::size_t maximum)
            : std::length_error("Plan graph has " + std::to_string(node_count)
                                + " nodes which exceeds the encoder maximum of " + std::to_string(maximum) + "."),
              node_count_(node_count),
              maximum_(maximum) {}

        [[nodiscard]] std::size_t node_count() const noexcept { return node_count_; }
        [[nodiscard]] std::size_t maximum() const noexcept { return maximum_; }

    private:
        std::size_t node_count_{};
        std::size_t maximum_{};
    };

    class SchemaMismatch : public std::runtime_error {
    public:
        SchemaMismatch(const std::string& context, const std::string& expected, const std::string& actual)
            : std::runtime_error("Schema mismatch for " + context + ": expected '" + expected
                                 + "' but found '" + actual + "'. Retrain the predictor for this configuration."),
              expected_(expected),
              actual_(actual) {}

        [[nodiscard]] const std::string& expected() const noexcept { return expected_; }
        [[nodiscard]] const std::string& actual() const noexcept { return actual_; }

    private:
        std::string expected_{};
        std::string actual_{};
    };

    class InsufficientData : public std::runtime_error {
    public:
        InsufficientData(std::size_t available, std::size_t minimum)
            : std::runtime_error("Training requires at least " + std::to_string(minimum)
                                 + " examples but only " + std::to_string(available)
                                 + " were collected. Provide more plans or lower the minimum example count."),
              available_(available),
              minimum_(minimum) {}

        [[nodiscard]] std::size_t available() const noexcept { return available_; }
        [[nodiscard]] std::size_t minimum() const noexcept { return minimum_; }

    private:
        std::size_t available_{};
        std::size_t minimum_{};
    };

    class DestinationConflict : public std::runtime_error {
    public:
        explicit DestinationConflict(const std::string& location)
            : std::runtime_error("An artifact already exists at '" + location
                                 + "'. Save with SaveMode::Replace to overwrite it or use a different key."),
              location_(location) {}

        [[nodiscard]] const std::string& location() const noexcept { return location_; }

    private:
        std::string location_{};
    };

    // Single ground-truth measurement failed; recovered locally by the training pipeline.
    class MeasurementFailure : public std::runtime_error {
    public:
        explicit MeasurementFailure(const std::string& message)
            : std::runtime_error("Measurement failed: " + message) {}
    };

    class ArtifactCorrupted : public std::runtime_error {
    public:
        explicit ArtifactCorrupted(const std::string& message)
            : std::runtime_error("Corrupted artifact: " + message) {}
    };
}

#endif // SKULD_COMMON_ERROR_HPP
