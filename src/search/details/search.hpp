#ifndef SKULD_SEARCH_SEARCH_HPP
#define SKULD_SEARCH_SEARCH_HPP

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <iterator>
#include <limits>
#include <mutex>
#include <numeric>
#include <optional>
#include <ostream>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "../../common/cancellation.hpp"
#include "../../common/error.hpp"
#include "../../encoding/encoding.hpp"
#include "../../graph/graph.hpp"
#include "../../model/model.hpp"
#include "../../plan/plan.hpp"
#include "../../utils/progressbar.hpp"
#include "../../utils/terminal.hpp"
#include "space.hpp"

namespace Skuld::Search::Details {
    enum class SearchStatus {
        Exhaustive,
        BudgetLimited,
        Cancelled,
    };

    inline std::string to_string(SearchStatus status)
    {
        switch (status) {
            case SearchStatus::Exhaustive:    return "exhaustive";
            case SearchStatus::BudgetLimited: return "best found, budget-limited";
            case SearchStatus::Cancelled:     return "cancelled, best so far";
        }
        return "unknown";
    }

    struct RankedPlan {
        Plan::ExecutionPlan plan{};
        double predicted_latency{0.0};
        double communication_volume{0.0};
    };

    struct SkippedPlan {
        std::string signature{};
        std::string reason{};
    };

    struct SearchResult {
        std::optional<Plan::ExecutionPlan> best_plan{};
        double predicted_latency{std::numeric_limits<double>::infinity()};
        std::vector<RankedPlan> ranked{};               // ascending predicted latency
        SearchStatus status{SearchStatus::Exhaustive};
        bool budget_limited{false};                     // kept when a budget-limited search is then cancelled
        std::size_t evaluated{0};
        std::size_t pruned{0};
        std::size_t skipped{0};
        std::vector<SkippedPlan> skipped_plans{};

        [[nodiscard]] bool found() const noexcept { return best_plan.has_value(); }
    };

    struct SearchOptions {
        std::size_t budget{0};          // 0 evaluates every candidate
        std::uint64_t seed{0};          // picks the evaluated subset when over budget
        std::size_t workers{0};         // 0 uses the hardware concurrency
        std::size_t batch_size{16};
        Encoding::EncoderOptions encoder{};
        Plan::HardwareProfile hardware{};
        std::ostream* stream{&std::cout};
        Common::CancellationToken cancellation{};
    };

    // Latency first, then total communication volume, then signature, so ties never depend on
    // evaluation order.
    [[nodiscard]] inline bool ranks_before(const RankedPlan& left, const RankedPlan& right)
    {
        if (left.predicted_latency != right.predicted_latency) {
            return left.predicted_latency < right.predicted_latency;
        }
        if (left.communication_volume != right.communication_volume) {
            return left.communication_volume < right.communication_volume;
        }
        return left.plan.signature() < right.plan.signature();
    }

    // Latency of caller-authored plans, in input order. Invalid plans raise InvalidPlan.
    inline std::vector<RankedPlan> predict_plans(const Plan::ModelSpec& spec,
                                                 const std::vector<Plan::ExecutionPlan>& plans,
                                                 const Model::LatencyEstimator& estimator,
                                                 const Encoding::EncoderOptions& encoder_options = {},
                                                 const Plan::HardwareProfile& hardware = {})
    {
        const Encoding::GraphEncoder encoder(encoder_options);
        std::vector<Encoding::EncodedGraph> encoded;
        encoded.reserve(plans.size());
        for (const auto& plan : plans) {
            encoded.push_back(encoder.encode(Graph::build(plan, spec, hardware)));
        }
        std::vector<const Encoding::EncodedGraph*> pointers;
        pointers.reserve(encoded.size());
        for (const auto& graph : encoded) {
            pointers.push_back(&graph);
        }
        const auto latencies = estimator.predict_batch(pointers);

        std::vector<RankedPlan> predictions;
        predictions.reserve(plans.size());
        for (std::size_t index = 0; index < plans.size(); ++index) {
            predictions.push_back({plans[index], latencies[index], encoded[index].communication_volume});
        }
        return predictions;
    }

    class PlanSearch {
    public:
        PlanSearch() = default;
        explicit PlanSearch(SearchOptions options) : options_(std::move(options)) {}

        [[nodiscard]] const SearchOptions& options() const noexcept { return options_; }
        [[nodiscard]] SearchOptions& options() noexcept { return options_; }

        [[nodiscard]] SearchResult search(const Plan::ModelSpec& spec,
                                          const SearchSpace& space,
                                          const Model::LatencyEstimator& estimator) const
        {
            SearchResult result{};
            result.pruned = space.pruned();

            const auto& candidates = space.candidates();
            std::vector<std::size_t> selected(candidates.size());
            std::iota(selected.begin(), selected.end(), std::size_t{0});
            if (options_.budget > 0 && candidates.size() > options_.budget) {
                std::mt19937_64 generator(options_.seed);
                std::vector<std::size_t> subset;
                subset.reserve(options_.budget);
                std::sample(selected.begin(), selected.end(), std::back_inserter(subset), options_.budget, generator);
                selected = std::move(subset);
                result.status = SearchStatus::BudgetLimited;
                result.budget_limited = true;
            }

            std::vector<std::optional<RankedPlan>> slots(selected.size());
            std::vector<std::optional<SkippedPlan>> skips(selected.size());
            std::atomic<std::size_t> next{0};
            std::exception_ptr failure;
            std::mutex failure_mutex;
            const Encoding::GraphEncoder encoder(options_.encoder);
            const auto chunk = std::max<std::size_t>(options_.batch_size, 1);
            Utils::ProgressBar progress(options_.stream, static_cast<std::int64_t>(selected.size()), "Searching");

            const auto work = [&] {
                while (true) {
                    if (options_.cancellation.cancelled()) {
                        return;
                    }
                    {
                        std::lock_guard<std::mutex> guard(failure_mutex);
                        if (failure) {
                            return;
                        }
                    }
                    const auto begin = next.fetch_add(chunk);
                    if (begin >= selected.size()) {
                        return;
                    }
                    const auto end = std::min(selected.size(), begin + chunk);
                    try {
                        evaluate_chunk(spec, candidates, selected, begin, end, encoder, estimator, slots, skips);
                    } catch (const std::exception&) {
                        std::lock_guard<std::mutex> guard(failure_mutex);
                        if (!failure) {
                            failure = std::current_exception();
                        }
                        return;
                    }
                    progress.advance(static_cast<std::int64_t>(end - begin));
                }
            };

            const auto hardware_threads = std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
            const auto worker_count = std::min(options_.workers > 0 ? options_.workers : hardware_threads,
                                               std::max<std::size_t>((selected.size() + chunk - 1) / chunk, 1));
            std::vector<std::thread> workers;
            workers.reserve(worker_count);
            for (std::size_t index = 0; index < worker_count; ++index) {
                workers.emplace_back(work);
            }
            for (auto& worker : workers) {
                worker.join();
            }
            if (failure) {
                std::rethrow_exception(failure);
            }
            if (options_.cancellation.cancelled() && next.load() < selected.size()) {
                result.status = SearchStatus::Cancelled;
            } else {
                progress.complete();
            }

            for (std::size_t index = 0; index < selected.size(); ++index) {
                if (slots[index]) {
                    result.ranked.push_back(std::move(*slots[index]));
                } else if (skips[index]) {
                    result.skipped_plans.push_back(std::move(*skips[index]));
                }
            }
            result.evaluated = result.ranked.size();
            result.skipped = result.skipped_plans.size();
            std::sort(result.ranked.begin(), result.ranked.end(), ranks_before);
            if (!result.ranked.empty()) {
                result.best_plan = result.ranked.front().plan;
                result.predicted_latency = result.ranked.front().predicted_latency;
            }
            report(result);
            return result;
        }

    private:
        void evaluate_chunk(const Plan::ModelSpec& spec,
                            const std::vector<Plan::ExecutionPlan>& candidates,
                            const std::vector<std::size_t>& selected,
                            std::size_t begin,
                            std::size_t end,
                            const Encoding::GraphEncoder& encoder,
                            const Model::LatencyEstimator& estimator,
                            std::vector<std::optional<RankedPlan>>& slots,
                            std::vector<std::optional<SkippedPlan>>& skips) const
        {
            std::vector<Encoding::EncodedGraph> encoded;
            std::vector<std::size_t> positions;
            encoded.reserve(end - begin);
            positions.reserve(end - begin);
            for (auto position = begin; position < end; ++position) {
                const auto& plan = candidates[selected[position]];
                try {
                    encoded.push_back(encoder.encode(Graph::build(plan, spec, options_.hardware)));
                    positions.push_back(position);
                } catch (const Error::InvalidPlan& error) {
                    skips[position] = SkippedPlan{plan.signature(), error.what()};
                } catch (const Error::GraphTooLarge& error) {
                    skips[position] = SkippedPlan{plan.signature(), error.what()};
                }
            }
            if (encoded.empty()) {
                return;
            }

            std::vector<const Encoding::EncodedGraph*> pointers;
            pointers.reserve(encoded.size());
            for (const auto& graph : encoded) {
                pointers.push_back(&graph);
            }
            const auto latencies = estimator.predict_batch(pointers);
            for (std::size_t index = 0; index < positions.size(); ++index) {
                slots[positions[index]] = RankedPlan{
                    .plan = candidates[selected[positions[index]]],
                    .predicted_latency = latencies[index],
                    .communication_volume = encoded[index].communication_volume,
                };
            }
        }

        void report(const SearchResult& result) const
        {
            auto* stream = options_.stream;
            std::ostringstream line;
            line << "Search evaluated " << result.evaluated << " plans (" << result.skipped << " skipped, "
                 << result.pruned << " pruned)";
            if (result.best_plan) {
                line << ", best predicted latency " << result.predicted_latency << " s";
            }
            line << " [" << to_string(result.status);
            if (result.status == SearchStatus::Cancelled && result.budget_limited) {
                line << ", budget-limited";
            }
            line << "]";
            if (result.status == SearchStatus::Exhaustive) {
                Utils::Terminal::Success(stream, line.str());
            } else {
                Utils::Terminal::Warn(stream, line.str());
            }
            for (const auto& skipped : result.skipped_plans) {
                Utils::Terminal::Warn(stream, "Skipped " + skipped.signature + ": " + skipped.reason);
            }
        }

        SearchOptions options_{};
    };
}

#endif // SKULD_SEARCH_SEARCH_HPP
