#ifndef SKULD_PLAN_SERIALIZE_HPP
#define SKULD_PLAN_SERIALIZE_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../../common/save_load.hpp"
#include "types.hpp"

namespace Skuld::Plan::Details {
    using Common::SaveLoad::PropertyTree;

    inline PropertyTree to_property_tree(const ExecutionPlan& plan)
    {
        PropertyTree tree;
        tree.put("mesh.hosts", plan.mesh().hosts);
        tree.put("mesh.devices_per_host", plan.mesh().devices_per_host);
        tree.put("micro_batches", plan.micro_batches());

        PropertyTree stages;
        for (const auto& stage : plan.stages()) {
            PropertyTree node;
            node.put("first_layer", stage.first_layer);
            node.put("last_layer", stage.last_layer);
            node.put("data", stage.degrees.data);
            node.put("tensor", stage.degrees.tensor);
            node.put("pipeline", stage.degrees.pipeline);
            node.put("submesh_hosts", stage.submesh.hosts);
            node.put("submesh_devices_per_host", stage.submesh.devices_per_host);
            node.put("device_offset", stage.device_offset);
            stages.push_back({"", node});
        }
        tree.add_child("stages", stages);
        return tree;
    }

    inline ExecutionPlan plan_from_property_tree(const PropertyTree& tree, const std::string& context)
    {
        using namespace Common::SaveLoad::Detail;

        const DeviceMesh mesh{
            get_numeric<std::int64_t>(tree, "mesh.hosts", context),
            get_numeric<std::int64_t>(tree, "mesh.devices_per_host", context),
        };
        const auto micro_batches = get_numeric<std::int64_t>(tree, "micro_batches", context);

        std::vector<StageAssignment> stages;
        for (const auto& [_, node] : get_child(tree, "stages", context)) {
            const auto stage_context = context + " stage " + std::to_string(stages.size());
            stages.push_back(StageAssignment{
                .first_layer = get_numeric<std::size_t>(node, "first_layer", stage_context),
                .last_layer = get_numeric<std::size_t>(node, "last_layer", stage_context),
                .degrees = {
                    get_numeric<std::int64_t>(node, "data", stage_context),
                    get_numeric<std::int64_t>(node, "tensor", stage_context),
                    get_numeric<std::int64_t>(node, "pipeline", stage_context),
                },
                .submesh = {
                    get_numeric<std::int64_t>(node, "submesh_hosts", stage_context),
                    get_numeric<std::int64_t>(node, "submesh_devices_per_host", stage_context),
                },
                .device_offset = get_numeric<std::int64_t>(node, "device_offset", stage_context),
            });
        }
        return ExecutionPlan(mesh, std::move(stages), micro_batches);
    }
}

#endif // SKULD_PLAN_SERIALIZE_HPP
