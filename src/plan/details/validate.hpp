#ifndef SKULD_PLAN_VALIDATE_HPP
#define SKULD_PLAN_VALIDATE_HPP

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../../common/error.hpp"
#include "model_spec.hpp"
#include "types.hpp"

namespace Skuld::Plan::Details {
    // Submesh shapes a stage may occupy: one host with a width dividing the host,
    // or a whole number of full hosts.
    [[nodiscard]] inline bool admissible_submesh(const DeviceMesh& mesh, const SubmeshShape& submesh) noexcept
    {
        if (submesh.hosts < 1 || submesh.devices_per_host < 1) {
            return false;
        }
        if (submesh.hosts == 1) {
            return submesh.devices_per_host <= mesh.devices_per_host
                && mesh.devices_per_host % submesh.devices_per_host == 0;
        }
        return submesh.devices_per_host == mesh.devices_per_host && submesh.hosts <= mesh.hosts;
    }

    [[nodiscard]] inline std::vector<SubmeshShape> admissible_submeshes(const DeviceMesh& mesh)
    {
        std::vector<SubmeshShape> shapes;
        for (std::int64_t width = 1; width <= mesh.devices_per_host; ++width) {
            if (mesh.devices_per_host % width == 0) {
                shapes.push_back({1, width});
            }
        }
        for (std::int64_t hosts = 2; hosts <= mesh.hosts; ++hosts) {
            shapes.push_back({hosts, mesh.devices_per_host});
        }
        return shapes;
    }

    // Offset placement: a partial-host submesh must fit inside one host, a full-host
    // submesh must start on a host boundary.
    [[nodiscard]] inline bool aligned_placement(const DeviceMesh& mesh, const SubmeshShape& submesh, std::int64_t offset) noexcept
    {
        if (offset < 0 || offset + submesh.size() > mesh.size()) {
            return false;
        }
        const auto column = offset % mesh.devices_per_host;
        if (submesh.hosts == 1 && submesh.devices_per_host < mesh.devices_per_host) {
            return column % submesh.devices_per_host == 0 && column + submesh.devices_per_host <= mesh.devices_per_host;
        }
        return column == 0;
    }

    // Throws Error::InvalidPlan on the first violated rule.
    inline void validate(const ExecutionPlan& plan, const ModelSpec& spec)
    {
        using Error::InvalidPlan;
        const auto& mesh = plan.mesh();
        if (mesh.hosts < 1 || mesh.devices_per_host < 1) {
            throw InvalidPlan("device mesh must have at least one host and one device per host.");
        }
        if (plan.stages().empty()) {
            throw InvalidPlan("plan has no stages.");
        }
        if (spec.layers.empty()) {
            throw InvalidPlan("model '" + spec.name + "' has no layers.");
        }
        if (plan.micro_batches() < 1) {
            throw InvalidPlan("micro batch count must be at least 1.");
        }
        if (spec.global_batch_size % plan.micro_batches() != 0) {
            throw InvalidPlan("micro batch count " + std::to_string(plan.micro_batches())
                              + " does not divide the global batch " + std::to_string(spec.global_batch_size) + ".");
        }
        const auto micro_batch_size = spec.global_batch_size / plan.micro_batches();
        const auto stage_count = static_cast<std::int64_t>(plan.stage_count());

        std::size_t expected_first = 0;
        std::vector<std::pair<std::int64_t, std::int64_t>> ranges;
        ranges.reserve(plan.stage_count());

        for (std::size_t index = 0; index < plan.stages().size(); ++index) {
            const auto& stage = plan.stages()[index];
            const auto where = "stage " + std::to_string(index) + ": ";

            if (stage.first_layer != expected_first || stage.last_layer < stage.first_layer) {
                throw InvalidPlan(where + "layer range [" + std::to_string(stage.first_layer) + ", "
                                  + std::to_string(stage.last_layer) + "] does not continue at layer "
                                  + std::to_string(expected_first) + ".");
            }
            if (stage.last_layer >= spec.layers.size()) {
                throw InvalidPlan(where + "layer " + std::to_string(stage.last_layer) + " is outside the model ("
                                  + std::to_string(spec.layers.size()) + " layers).");
            }
            expected_first = stage.last_layer + 1;

            const auto& degrees = stage.degrees;
            if (degrees.data < 1 || degrees.tensor < 1 || degrees.pipeline < 1) {
                throw InvalidPlan(where + "parallel degrees must each be at least 1.");
            }
            if (degrees.pipeline != stage_count) {
                throw InvalidPlan(where + "pipeline degree " + std::to_string(degrees.pipeline)
                                  + " differs from the stage count " + std::to_string(stage_count) + ".");
            }
            if (!admissible_submesh(mesh, stage.submesh)) {
                throw InvalidPlan(where + "submesh " + std::to_string(stage.submesh.hosts) + "x"
                                  + std::to_string(stage.submesh.devices_per_host) + " is not admissible on the mesh.");
            }
            if (degrees.data * degrees.tensor != stage.submesh.size()) {
                throw InvalidPlan(where + "data x tensor (" + std::to_string(degrees.data * degrees.tensor)
                                  + ") differs from the submesh size " + std::to_string(stage.submesh.size()) + ".");
            }
            if (mesh.devices_per_host % degrees.tensor != 0) {
                throw InvalidPlan(where + "tensor degree " + std::to_string(degrees.tensor)
                                  + " does not divide the mesh width " + std::to_string(mesh.devices_per_host) + ".");
            }
            if (micro_batch_size % degrees.data != 0) {
                throw InvalidPlan(where + "data degree " + std::to_string(degrees.data)
                                  + " does not divide the micro batch size " + std::to_string(micro_batch_size) + ".");
            }
            if (!aligned_placement(mesh, stage.submesh, stage.device_offset)) {
                throw InvalidPlan(where + "device offset " + std::to_string(stage.device_offset)
                                  + " does not place the submesh on the mesh.");
            }
            ranges.emplace_back(stage.device_offset, stage.device_offset + stage.submesh.size());
        }

        if (expected_first != spec.layers.size()) {
            throw InvalidPlan("stages cover layers [0, " + std::to_string(expected_first) + ") but the model has "
                              + std::to_string(spec.layers.size()) + " layers.");
        }

        std::sort(ranges.begin(), ranges.end());
        std::int64_t cursor = 0;
        for (const auto& [begin, end] : ranges) {
            if (begin != cursor) {
                throw InvalidPlan(begin < cursor ? "stage device ranges overlap."
                                                 : "stage device ranges leave devices unassigned.");
            }
            cursor = end;
        }
        if (cursor != mesh.size()) {
            throw InvalidPlan("stages use " + std::to_string(cursor) + " of " + std::to_string(mesh.size()) + " devices.");
        }
    }

    [[nodiscard]] inline bool is_feasible(const ExecutionPlan& plan, const ModelSpec& spec)
    {
        try {
            validate(plan, spec);
            return true;
        } catch (const Error::InvalidPlan&) {
            return false;
        }
    }
}

#endif // SKULD_PLAN_VALIDATE_HPP
