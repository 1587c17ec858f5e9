#ifndef SKULD_SEARCH_SPACE_HPP
#define SKULD_SEARCH_SPACE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../../plan/plan.hpp"

namespace Skuld::Search::Details {
    struct SearchSpaceOptions {
        std::size_t layer_groups{4};              // layers are cut into this many contiguous groups
        std::size_t max_stages{4};
        std::int64_t max_micro_batches{16};
        std::size_t splits_per_stage_count{0};    // 0 keeps every mesh tiling
    };

    class SearchSpace {
    public:
        SearchSpace() = default;

        // Stage partitions of layer groups x submesh tilings x micro batch counts x logical shapes.
        // Combinations that cannot satisfy the feasibility rules are counted as pruned and never evaluated.
        static SearchSpace enumerate(const Plan::ModelSpec& spec, const Plan::DeviceMesh& mesh, const SearchSpaceOptions& options = {})
        {
            SearchSpace space;
            const auto layer_count = spec.layers.size();
            if (layer_count == 0 || mesh.size() < 1) {
                return space;
            }

            const auto groups = std::clamp<std::size_t>(options.layer_groups, 1, layer_count);
            std::vector<std::pair<std::size_t, std::size_t>> bounds;
            for (std::size_t group = 0; group < groups; ++group) {
                bounds.emplace_back(group * layer_count / groups, (group + 1) * layer_count / groups - 1);
            }

            const auto micro_batches = Plan::micro_batch_choices(spec, options.max_micro_batches);
            const auto max_stages = std::min({std::max<std::size_t>(options.max_stages, 1), groups,
                                              static_cast<std::size_t>(mesh.size())});

            std::unordered_set<std::string> seen;
            for (std::size_t stages = 1; stages <= max_stages; ++stages) {
                const auto splits = Plan::mesh_splits(mesh, stages, options.splits_per_stage_count);
                for (const auto& partition : group_partitions(bounds, stages)) {
                    for (const auto& split : splits) {
                        for (const auto micro : micro_batches) {
                            space.expand(spec, mesh, partition, split, micro, seen);
                        }
                    }
                }
            }
            return space;
        }

        // Caller-supplied candidates, evaluated as given. Infeasible ones are reported as skipped.
        static SearchSpace from_plans(std::vector<Plan::ExecutionPlan> plans)
        {
            SearchSpace space;
            space.candidates_ = std::move(plans);
            return space;
        }

        [[nodiscard]] const std::vector<Plan::ExecutionPlan>& candidates() const noexcept { return candidates_; }
        [[nodiscard]] std::size_t size() const noexcept { return candidates_.size(); }
        [[nodiscard]] bool empty() const noexcept { return candidates_.empty(); }
        [[nodiscard]] std::size_t pruned() const noexcept { return pruned_; }

    private:
        using Interval = std::pair<std::size_t, std::size_t>;

        static std::vector<std::vector<Interval>> group_partitions(const std::vector<Interval>& bounds, std::size_t stages)
        {
            std::vector<std::vector<Interval>> partitions;
            std::vector<Interval> current;
            const auto descend = [&](const auto& self, std::size_t next_group) -> void {
                const auto remaining = stages - current.size();
                if (remaining == 0) {
                    if (next_group == bounds.size()) {
                        partitions.push_back(current);
                    }
                    return;
                }
                for (auto last_group = next_group; last_group + remaining <= bounds.size(); ++last_group) {
                    if (remaining == 1 && last_group + 1 != bounds.size()) {
                        continue;
                    }
                    current.emplace_back(bounds[next_group].first, bounds[last_group].second);
                    self(self, last_group + 1);
                    current.pop_back();
                }
            };
            descend(descend, 0);
            return partitions;
        }

        void expand(const Plan::ModelSpec& spec,
                    const Plan::DeviceMesh& mesh,
                    const std::vector<Interval>& partition,
                    const std::vector<Plan::Placement>& split,
                    std::int64_t micro,
                    std::unordered_set<std::string>& seen)
        {
            const auto pipeline = static_cast<std::int64_t>(partition.size());
            const auto micro_batch_size = spec.global_batch_size / micro;

            std::vector<std::vector<Plan::ParallelDegrees>> choices;
            choices.reserve(partition.size());
            for (const auto& placement : split) {
                choices.push_back(Plan::logical_shapes(mesh, placement.submesh, micro_batch_size, pipeline));
                if (choices.back().empty()) {
                    ++pruned_;
                    return;
                }
            }

            std::vector<std::size_t> cursor(partition.size(), 0);
            while (true) {
                std::vector<Plan::StageAssignment> stages;
                stages.reserve(partition.size());
                for (std::size_t index = 0; index < partition.size(); ++index) {
                    stages.push_back(Plan::StageAssignment{
                        .first_layer = partition[index].first,
                        .last_layer = partition[index].second,
                        .degrees = choices[index][cursor[index]],
                        .submesh = split[index].submesh,
                        .device_offset = split[index].device_offset,
                    });
                }
                Plan::ExecutionPlan plan(mesh, std::move(stages), micro);
                if (!Plan::is_feasible(plan, spec)) {
                    ++pruned_;
                } else if (seen.insert(plan.signature()).second) {
                    candidates_.push_back(std::move(plan));
                }

                std::size_t position = 0;
                while (position < cursor.size() && ++cursor[position] == choices[position].size()) {
                    cursor[position] = 0;
                    ++position;
                }
                if (position == cursor.size()) {
                    break;
                }
            }
        }

        std::vector<Plan::ExecutionPlan> candidates_{};
        std::size_t pruned_{0};
    };
}

#endif // SKULD_SEARCH_SPACE_HPP
