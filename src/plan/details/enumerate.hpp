#ifndef SKULD_PLAN_ENUMERATE_HPP
#define SKULD_PLAN_ENUMERATE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "model_spec.hpp"
#include "types.hpp"
#include "validate.hpp"

namespace Skuld::Plan::Details {
    struct Placement {
        SubmeshShape submesh{};
        std::int64_t device_offset{0};

        bool operator==(const Placement&) const = default;
    };

    // Ordered tilings of the mesh by `stage_count` admissible, aligned submeshes. Stage i always
    // sits before stage i + 1 in device order. `limit` caps the result (0 keeps everything).
    [[nodiscard]] inline std::vector<std::vector<Placement>> mesh_splits(const DeviceMesh& mesh,
                                                                         std::size_t stage_count,
                                                                         std::size_t limit = 0)
    {
        std::vector<std::vector<Placement>> splits;
        if (stage_count == 0 || static_cast<std::int64_t>(stage_count) > mesh.size()) {
            return splits;
        }
        const auto shapes = admissible_submeshes(mesh);
        std::vector<Placement> current;
        current.reserve(stage_count);

        const auto descend = [&](const auto& self, std::int64_t offset) -> void {
            if (limit > 0 && splits.size() >= limit) {
                return;
            }
            const auto remaining_stages = static_cast<std::int64_t>(stage_count - current.size());
            if (remaining_stages == 0) {
                if (offset == mesh.size()) {
                    splits.push_back(current);
                }
                return;
            }
            for (const auto& shape : shapes) {
                if (!aligned_placement(mesh, shape, offset)) {
                    continue;
                }
                if (mesh.size() - offset - shape.size() < remaining_stages - 1) {
                    continue;
                }
                current.push_back({shape, offset});
                self(self, offset + shape.size());
                current.pop_back();
            }
        };
        descend(descend, 0);
        return splits;
    }

    // (data, tensor) factorisations of a submesh that satisfy the divisibility rules.
    [[nodiscard]] inline std::vector<ParallelDegrees> logical_shapes(const DeviceMesh& mesh,
                                                                     const SubmeshShape& submesh,
                                                                     std::int64_t micro_batch_size,
                                                                     std::int64_t pipeline)
    {
        std::vector<ParallelDegrees> shapes;
        const auto devices = submesh.size();
        for (std::int64_t tensor = 1; tensor <= devices; ++tensor) {
            if (devices % tensor != 0 || mesh.devices_per_host % tensor != 0) {
                continue;
            }
            const auto data = devices / tensor;
            if (micro_batch_size % data != 0) {
                continue;
            }
            shapes.push_back({data, tensor, pipeline});
        }
        return shapes;
    }

    // Micro batch counts dividing the global batch, at most `maximum`.
    [[nodiscard]] inline std::vector<std::int64_t> micro_batch_choices(const ModelSpec& spec, std::int64_t maximum)
    {
        std::vector<std::int64_t> choices;
        for (std::int64_t count = 1; count <= std::min(maximum, spec.global_batch_size); ++count) {
            if (spec.global_batch_size % count == 0) {
                choices.push_back(count);
            }
        }
        return choices;
    }
}

#endif // SKULD_PLAN_ENUMERATE_HPP
