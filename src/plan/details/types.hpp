#ifndef SKULD_PLAN_TYPES_HPP
#define SKULD_PLAN_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace Skuld::Plan::Details {
    // Physical cluster: `hosts` machines with `devices_per_host` accelerators each.
    struct DeviceMesh {
        std::int64_t hosts{1};
        std::int64_t devices_per_host{1};

        [[nodiscard]] std::int64_t size() const noexcept { return hosts * devices_per_host; }
        bool operator==(const DeviceMesh&) const = default;
    };

    // Rectangular slice of the mesh assigned to one pipeline stage.
    struct SubmeshShape {
        std::int64_t hosts{1};
        std::int64_t devices_per_host{1};

        [[nodiscard]] std::int64_t size() const noexcept { return hosts * devices_per_host; }
        bool operator==(const SubmeshShape&) const = default;
    };

    struct ParallelDegrees {
        std::int64_t data{1};
        std::int64_t tensor{1};
        std::int64_t pipeline{1};

        bool operator==(const ParallelDegrees&) const = default;
    };

    struct StageAssignment {
        std::size_t first_layer{0};
        std::size_t last_layer{0};  // inclusive
        ParallelDegrees degrees{};
        SubmeshShape submesh{};
        std::int64_t device_offset{0};

        [[nodiscard]] std::size_t layer_count() const noexcept { return last_layer + 1 - first_layer; }
        bool operator==(const StageAssignment&) const = default;
    };

    class ExecutionPlan {
    public:
        ExecutionPlan() = default;
        ExecutionPlan(DeviceMesh mesh, std::vector<StageAssignment> stages, std::int64_t micro_batches)
            : mesh_(mesh), stages_(std::move(stages)), micro_batches_(micro_batches) {}

        [[nodiscard]] const DeviceMesh& mesh() const noexcept { return mesh_; }
        [[nodiscard]] const std::vector<StageAssignment>& stages() const noexcept { return stages_; }
        [[nodiscard]] std::int64_t micro_batches() const noexcept { return micro_batches_; }
        [[nodiscard]] std::size_t stage_count() const noexcept { return stages_.size(); }

        // Canonical text form, also used as dedup / cache key.
        [[nodiscard]] std::string signature() const
        {
            std::ostringstream stream;
            stream << "mesh=" << mesh_.hosts << 'x' << mesh_.devices_per_host << ";mb=" << micro_batches_;
            for (std::size_t index = 0; index < stages_.size(); ++index) {
                const auto& stage = stages_[index];
                stream << ";s" << index << "=[" << stage.first_layer << '-' << stage.last_layer
                       << "|dp" << stage.degrees.data << "tp" << stage.degrees.tensor << "pp" << stage.degrees.pipeline
                       << '|' << stage.submesh.hosts << 'x' << stage.submesh.devices_per_host
                       << '@' << stage.device_offset << ']';
            }
            return stream.str();
        }

        bool operator==(const ExecutionPlan&) const = default;

    private:
        DeviceMesh mesh_{};
        std::vector<StageAssignment> stages_{};
        std::int64_t micro_batches_{1};
    };
}

template <>
struct std::hash<Skuld::Plan::Details::ExecutionPlan> {
    std::size_t operator()(const Skuld::Plan::Details::ExecutionPlan& plan) const
    {
        return std::hash<std::string>{}(plan.signature());
    }
};

#endif // SKULD_PLAN_TYPES_HPP
