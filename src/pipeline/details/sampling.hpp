#ifndef SKULD_PIPELINE_SAMPLING_HPP
#define SKULD_PIPELINE_SAMPLING_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <random>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../../plan/plan.hpp"

namespace Skuld::Pipeline::Details {
    using StageInterval = std::pair<std::size_t, std::size_t>;  // inclusive layer range

    struct IntervalSampling {
        double probability{1.0};              // share of all L(L+1)/2 intervals to keep
        std::size_t reduce{0};                // drops the widest `reduce` interval widths
        std::vector<std::size_t> exclude{};   // start layers never sampled
        std::uint64_t seed{0};
    };

    // Contiguous layer intervals to profile. Every width from the minimum up to
    // `layer_count - reduce` (stepping so the total stays near the expected count) contributes
    // `probability` of its possible start positions. With probability 1 every interval is kept.
    inline std::vector<StageInterval> sample_stage_intervals(std::size_t layer_count, const IntervalSampling& options)
    {
        std::vector<StageInterval> intervals;
        if (layer_count == 0 || options.probability <= 0.0) {
            return intervals;
        }
        const auto probability = std::min(options.probability, 1.0);
        const auto all = static_cast<double>(layer_count * (layer_count + 1)) / 2.0;
        const auto expected = std::max<std::size_t>(static_cast<std::size_t>(probability * all), 1);

        const std::size_t min_width = probability >= 1.0 ? 0 : 2;
        const std::size_t max_width = layer_count > options.reduce ? layer_count - options.reduce : 0;
        const std::size_t step = std::max<std::size_t>(layer_count / expected, 1);

        std::mt19937_64 generator(options.seed);
        const std::unordered_set<std::size_t> excluded(options.exclude.begin(), options.exclude.end());
        for (std::size_t width = min_width; width < max_width; width += step) {
            std::vector<std::size_t> starts;
            for (std::size_t start = 0; start + width < layer_count; ++start) {
                if (!excluded.contains(start)) {
                    starts.push_back(start);
                }
            }
            const auto count = std::max<std::size_t>(static_cast<std::size_t>(static_cast<double>(layer_count - width) * probability), 1);
            std::vector<std::size_t> chosen;
            std::sample(starts.begin(), starts.end(), std::back_inserter(chosen), count, generator);
            for (const auto start : chosen) {
                intervals.emplace_back(start, start + width);
            }
        }

        if (intervals.size() > expected) {
            std::vector<StageInterval> kept;
            std::sample(intervals.begin(), intervals.end(), std::back_inserter(kept), expected, generator);
            intervals = std::move(kept);
        }
        std::sort(intervals.begin(), intervals.end());
        return intervals;
    }

    struct TrainingPlanOptions {
        IntervalSampling sampling{};
        std::int64_t max_micro_batches{16};
        std::size_t splits_per_partition{4};
        std::size_t max_plans{256};
        std::uint64_t seed{0};
    };

    // Feasible training plans built around sampled intervals: the interval becomes one stage and
    // the layers on either side become their own stages. Devices, logical shapes and micro batch
    // counts are drawn with the seeded generator.
    inline std::vector<Plan::ExecutionPlan> generate_training_plans(const Plan::ModelSpec& spec,
                                                                    const Plan::DeviceMesh& mesh,
                                                                    const TrainingPlanOptions& options = {})
    {
        std::vector<Plan::ExecutionPlan> plans;
        const auto layer_count = spec.layers.size();
        const auto micro_batches = Plan::micro_batch_choices(spec, options.max_micro_batches);
        if (layer_count == 0 || micro_batches.empty()) {
            return plans;
        }

        std::mt19937_64 generator(options.seed);
        std::unordered_set<std::string> seen;
        for (const auto& [first, last] : sample_stage_intervals(layer_count, options.sampling)) {
            std::vector<StageInterval> pieces;
            if (first > 0) {
                pieces.emplace_back(0, first - 1);
            }
            pieces.emplace_back(first, last);
            if (last + 1 < layer_count) {
                pieces.emplace_back(last + 1, layer_count - 1);
            }
            const auto pipeline = static_cast<std::int64_t>(pieces.size());

            for (const auto& split : Plan::mesh_splits(mesh, pieces.size(), options.splits_per_partition)) {
                std::uniform_int_distribution<std::size_t> pick_micro(0, micro_batches.size() - 1);
                const auto micro = micro_batches[pick_micro(generator)];
                const auto micro_batch_size = spec.global_batch_size / micro;

                std::vector<Plan::StageAssignment> stages;
                stages.reserve(pieces.size());
                for (std::size_t index = 0; index < pieces.size(); ++index) {
                    const auto shapes = Plan::logical_shapes(mesh, split[index].submesh, micro_batch_size, pipeline);
                    if (shapes.empty()) {
                        break;
                    }
                    std::uniform_int_distribution<std::size_t> pick_shape(0, shapes.size() - 1);
                    stages.push_back(Plan::StageAssignment{
                        .first_layer = pieces[index].first,
                        .last_layer = pieces[index].second,
                        .degrees = shapes[pick_shape(generator)],
                        .submesh = split[index].submesh,
                        .device_offset = split[index].device_offset,
                    });
                }
                if (stages.size() != pieces.size()) {
                    continue;
                }

                Plan::ExecutionPlan plan(mesh, std::move(stages), micro);
                if (Plan::is_feasible(plan, spec) && seen.insert(plan.signature()).second) {
                    plans.push_back(std::move(plan));
                }
            }
        }

        if (options.max_plans > 0 && plans.size() > options.max_plans) {
            std::vector<Plan::ExecutionPlan> kept;
            std::sample(plans.begin(), plans.end(), std::back_inserter(kept), options.max_plans, generator);
            plans = std::move(kept);
        }
        return plans;
    }
}

#endif // SKULD_PIPELINE_SAMPLING_HPP
