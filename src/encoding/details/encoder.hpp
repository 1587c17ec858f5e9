#ifndef SKULD_ENCODING_ENCODER_HPP
#define SKULD_ENCODING_ENCODER_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "../../graph/graph.hpp"
#include "features.hpp"

namespace Skuld::Encoding::Details {
    enum class AttentionPolicy {
        DependencyMasked,   // a node sees only itself and its ancestors
        Bidirectional,      // every pair, penalized by depth distance
    };

    struct EncoderOptions {
        std::size_t max_nodes{1024};
        AttentionPolicy policy{AttentionPolicy::DependencyMasked};
        double depth_bias_scale{1.0};
    };

    struct EncodedGraph {
        torch::Tensor features{};   // [N, kFeatureWidth] float32
        torch::Tensor bias{};       // [N, N] float32, added to attention scores
        torch::Tensor depth{};      // [N] int64
        std::size_t root_index{0};
        std::string schema_version{};
        std::string signature{};
        double communication_volume{0.0};

        [[nodiscard]] std::size_t node_count() const
        {
            return features.defined() ? static_cast<std::size_t>(features.size(0)) : 0;
        }
        [[nodiscard]] std::int64_t feature_width() const
        {
            return features.defined() ? features.size(1) : 0;
        }
    };

    class GraphEncoder {
    public:
        GraphEncoder() = default;
        explicit GraphEncoder(EncoderOptions options) : options_(options) {}

        [[nodiscard]] const EncoderOptions& options() const noexcept { return options_; }
        [[nodiscard]] static std::string schema_version() { return std::string(kSchemaVersion); }
        [[nodiscard]] static constexpr std::size_t feature_width() noexcept { return kFeatureWidth; }

        // Pure function of the graph: identical graphs give bit-identical tensors.
        [[nodiscard]] EncodedGraph encode(const Graph::PlanGraph& graph) const
        {
            const auto count = graph.size();
            if (count > options_.max_nodes) {
                throw Error::GraphTooLarge(count, options_.max_nodes);
            }
            if (count == 0) {
                throw std::invalid_argument("Cannot encode an empty plan graph.");
            }

            const auto order = graph.topological_order();
            std::vector<std::size_t> position(count, 0);
            for (std::size_t rank = 0; rank < count; ++rank) {
                position[order[rank]] = rank;
            }

            // Longest path from an input, and ancestor sets, both in encoded positions.
            std::vector<std::size_t> depth(count, 0);
            std::vector<std::vector<bool>> ancestors(count, std::vector<bool>(count, false));
            for (std::size_t rank = 0; rank < count; ++rank) {
                const auto& node = graph.node(order[rank]);
                auto& own = ancestors[rank];
                for (const auto parent : node.inputs) {
                    const auto parent_rank = position[parent];
                    depth[rank] = std::max(depth[rank], depth[parent_rank] + 1);
                    own[parent_rank] = true;
                    const auto& inherited = ancestors[parent_rank];
                    for (std::size_t other = 0; other < parent_rank; ++other) {
                        if (inherited[other]) {
                            own[other] = true;
                        }
                    }
                }
            }
            const auto max_depth = *std::max_element(depth.begin(), depth.end());

            const auto rows = static_cast<std::int64_t>(count);
            auto features = torch::zeros({rows, static_cast<std::int64_t>(kFeatureWidth)}, torch::kFloat32);
            auto depth_tensor = torch::zeros({rows}, torch::kInt64);
            auto bias = torch::zeros({rows, rows}, torch::kFloat32);

            auto features_access = features.accessor<float, 2>();
            auto depth_access = depth_tensor.accessor<std::int64_t, 1>();
            auto bias_access = bias.accessor<float, 2>();
            constexpr auto kBlocked = -std::numeric_limits<float>::infinity();

            for (std::size_t rank = 0; rank < count; ++rank) {
                const NodeContext context{depth[rank], max_depth, std::max<std::size_t>(graph.stage_count(), 1)};
                const auto row = node_features(graph.node(order[rank]), context);
                const auto r = static_cast<std::int64_t>(rank);
                for (std::size_t column = 0; column < kFeatureWidth; ++column) {
                    features_access[r][static_cast<std::int64_t>(column)] = row[column];
                }
                depth_access[r] = static_cast<std::int64_t>(depth[rank]);

                for (std::size_t other = 0; other < count; ++other) {
                    const auto o = static_cast<std::int64_t>(other);
                    if (options_.policy == AttentionPolicy::DependencyMasked) {
                        bias_access[r][o] = (other == rank || ancestors[rank][other]) ? 0.0F : kBlocked;
                    } else {
                        const auto distance = std::abs(static_cast<double>(depth[rank]) - static_cast<double>(depth[other]));
                        bias_access[r][o] = static_cast<float>(-options_.depth_bias_scale * distance);
                    }
                }
            }

            const auto root = graph.root();
            if (!root) {
                throw std::invalid_argument("Plan graph '" + graph.signature() + "' has no completion root.");
            }

            return EncodedGraph{
                .features = features,
                .bias = bias,
                .depth = depth_tensor,
                .root_index = position[*root],
                .schema_version = schema_version(),
                .signature = graph.signature(),
                .communication_volume = graph.total_communication_volume(),
            };
        }

    private:
        EncoderOptions options_{};
    };
}

#endif // SKULD_ENCODING_ENCODER_HPP
