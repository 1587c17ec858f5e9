#ifndef SKULD_ENCODING_FEATURES_HPP
#define SKULD_ENCODING_FEATURES_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "../../graph/graph.hpp"

namespace Skuld::Encoding::Details {
    // Bump whenever the feature layout below changes; stored artifacts carry it.
    inline constexpr std::string_view kSchemaVersion = "v2";

    namespace Layout {
        inline constexpr std::size_t kKind = 0;
        inline constexpr std::size_t kOp = kKind + Graph::kNodeKindCount;
        inline constexpr std::size_t kCollective = kOp + Plan::Details::kOpTypeCount;
        inline constexpr std::size_t kComputeCost = kCollective + Graph::kCollectiveCount;
        inline constexpr std::size_t kVolume = kComputeCost + 1;
        inline constexpr std::size_t kDegrees = kVolume + 1;         // data, tensor, pipeline
        inline constexpr std::size_t kStage = kDegrees + 3;
        inline constexpr std::size_t kDepth = kStage + 1;
        inline constexpr std::size_t kShape = kDepth + 1;            // up to three dims
        inline constexpr std::size_t kFanIn = kShape + 3;
        inline constexpr std::size_t kFanOut = kFanIn + 1;
        inline constexpr std::size_t kWidth = kFanOut + 1;
    }

    inline constexpr std::size_t kFeatureWidth = Layout::kWidth;

    using FeatureRow = std::array<float, kFeatureWidth>;

    struct NodeContext {
        std::size_t depth{0};
        std::size_t max_depth{0};
        std::size_t stage_count{1};
    };

    inline FeatureRow node_features(const Graph::GraphNode& node, const NodeContext& context)
    {
        FeatureRow row{};
        row[Layout::kKind + static_cast<std::size_t>(node.kind)] = 1.0F;
        if (node.op) {
            row[Layout::kOp + static_cast<std::size_t>(*node.op)] = 1.0F;
        }
        row[Layout::kCollective + static_cast<std::size_t>(node.collective)] = 1.0F;

        row[Layout::kComputeCost] = static_cast<float>(std::log1p(std::max(node.compute_cost, 0.0) * 1.0e6));
        row[Layout::kVolume] = static_cast<float>(std::log1p(std::max(node.volume_bytes, 0.0) / (1024.0 * 1024.0)));

        row[Layout::kDegrees + 0] = static_cast<float>(std::log2(static_cast<double>(std::max<std::int64_t>(node.degrees.data, 1))));
        row[Layout::kDegrees + 1] = static_cast<float>(std::log2(static_cast<double>(std::max<std::int64_t>(node.degrees.tensor, 1))));
        row[Layout::kDegrees + 2] = static_cast<float>(std::log2(static_cast<double>(std::max<std::int64_t>(node.degrees.pipeline, 1))));

        const auto last_stage = context.stage_count > 1 ? context.stage_count - 1 : 1;
        row[Layout::kStage] = static_cast<float>(static_cast<double>(node.stage) / static_cast<double>(last_stage));
        row[Layout::kDepth] = context.max_depth == 0
            ? 0.0F
            : static_cast<float>(static_cast<double>(context.depth) / static_cast<double>(context.max_depth));

        const auto dims = std::min<std::size_t>(node.shape.size(), 3);
        for (std::size_t index = 0; index < dims; ++index) {
            row[Layout::kShape + index] = static_cast<float>(std::log1p(static_cast<double>(std::max<std::int64_t>(node.shape[index], 0))));
        }

        row[Layout::kFanIn] = static_cast<float>(node.inputs.size());
        row[Layout::kFanOut] = static_cast<float>(node.outputs.size());
        return row;
    }
}

#endif // SKULD_ENCODING_FEATURES_HPP
