#ifndef SKULD_PIPELINE_RETRY_HPP
#define SKULD_PIPELINE_RETRY_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "../../common/cancellation.hpp"
#include "measurer.hpp"

namespace Skuld::Pipeline::Details {
    struct RetryPolicy {
        std::size_t max_attempts{3};
        std::chrono::milliseconds timeout{std::chrono::minutes(10)};  // zero waits forever
        std::chrono::milliseconds backoff{std::chrono::milliseconds(200)};
    };

    struct MeasurementOutcome {
        MeasurementResult result{};
        std::size_t attempts{0};
        bool cancelled{false};      // stopped before the attempt budget was spent
    };

    // One call, bounded by `timeout`. A timed out call is abandoned on its own thread, which keeps
    // the measurer alive through the shared pointer until it returns.
    inline MeasurementResult measure_once(const std::shared_ptr<Measurer>& measurer,
                                          const Plan::ExecutionPlan& plan,
                                          std::chrono::milliseconds timeout)
    {
        if (timeout.count() <= 0) {
            try {
                return measurer->measure(plan);
            } catch (const std::exception& error) {
                return MeasurementResult::failure(FailureReason::Error, error.what());
            }
        }

        std::packaged_task<MeasurementResult()> task([measurer, plan] { return measurer->measure(plan); });
        auto future = task.get_future();
        std::thread(std::move(task)).detach();

        if (future.wait_for(timeout) != std::future_status::ready) {
            return MeasurementResult::failure(FailureReason::Timeout,
                                              "no result after " + std::to_string(timeout.count()) + " ms");
        }
        try {
            return future.get();
        } catch (const std::exception& error) {
            return MeasurementResult::failure(FailureReason::Error, error.what());
        }
    }

    // Retries transient failures of idempotent measurers until the attempt budget is spent.
    // A cancelled outcome carries the last failure but must not be taken as final.
    inline MeasurementOutcome measure_with_retry(const std::shared_ptr<Measurer>& measurer,
                                                 const Plan::ExecutionPlan& plan,
                                                 const RetryPolicy& policy,
                                                 const Common::CancellationToken& cancellation = {})
    {
        MeasurementOutcome outcome{};
        const auto budget = std::max<std::size_t>(policy.max_attempts, 1);
        while (outcome.attempts < budget) {
            if (outcome.attempts > 0) {
                if (cancellation.cancelled()) {
                    outcome.cancelled = true;
                    break;
                }
                std::this_thread::sleep_for(policy.backoff * static_cast<long>(outcome.attempts));
            }
            outcome.result = measure_once(measurer, plan, policy.timeout);
            ++outcome.attempts;
            if (outcome.result.ok() || !is_transient(outcome.result.reason) || !measurer->idempotent()) {
                break;
            }
        }
        return outcome;
    }
}

#endif // SKULD_PIPELINE_RETRY_HPP
