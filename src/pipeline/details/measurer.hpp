#ifndef SKULD_PIPELINE_MEASURER_HPP
#define SKULD_PIPELINE_MEASURER_HPP

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "../../common/error.hpp"
#include "../../plan/plan.hpp"

namespace Skuld::Pipeline::Details {
    enum class FailureReason {
        Error,          // transient
        Timeout,        // transient
        OutOfMemory,    // permanent
        Infeasible,     // permanent
    };

    inline std::string to_string(FailureReason reason)
    {
        switch (reason) {
            case FailureReason::Error:       return "error";
            case FailureReason::Timeout:     return "timeout";
            case FailureReason::OutOfMemory: return "out_of_memory";
            case FailureReason::Infeasible:  return "infeasible";
        }
        return "unknown";
    }

    inline FailureReason parse_failure_reason(const std::string& value)
    {
        if (value == "error") return FailureReason::Error;
        if (value == "timeout") return FailureReason::Timeout;
        if (value == "out_of_memory") return FailureReason::OutOfMemory;
        if (value == "infeasible") return FailureReason::Infeasible;
        throw std::invalid_argument("Unknown measurement failure reason '" + value + "'.");
    }

    [[nodiscard]] inline bool is_transient(FailureReason reason) noexcept
    {
        return reason == FailureReason::Error || reason == FailureReason::Timeout;
    }

    [[nodiscard]] inline bool is_valid_latency(double seconds) noexcept
    {
        return std::isfinite(seconds) && seconds >= 0.0;
    }

    struct MeasurementResult {
        std::optional<double> latency_seconds{};
        FailureReason reason{FailureReason::Error};
        std::string message{};

        [[nodiscard]] bool ok() const noexcept { return latency_seconds.has_value(); }

        [[nodiscard]] double value() const
        {
            if (!latency_seconds) {
                throw Error::MeasurementFailure(to_string(reason) + ": " + message);
            }
            return *latency_seconds;
        }

        static MeasurementResult success(double latency_seconds)
        {
            return MeasurementResult{.latency_seconds = latency_seconds, .reason = FailureReason::Error, .message = {}};
        }

        static MeasurementResult failure(FailureReason reason, std::string message)
        {
            return MeasurementResult{.latency_seconds = std::nullopt, .reason = reason, .message = std::move(message)};
        }
    };

    // The training compiler / profiler, seen from the pipeline. `measure` may block for a long
    // time and may be abandoned on timeout, so implementations must not rely on being joined.
    class Measurer {
    public:
        virtual ~Measurer() = default;

        [[nodiscard]] virtual MeasurementResult measure(const Plan::ExecutionPlan& plan) = 0;

        // Whether the compiler accepts the plan on the target cluster.
        [[nodiscard]] virtual bool validate(const Plan::ExecutionPlan& plan) { return !plan.stages().empty(); }

        // Only idempotent measurers are retried.
        [[nodiscard]] virtual bool idempotent() const { return true; }
    };
}

#endif // SKULD_PIPELINE_MEASURER_HPP
