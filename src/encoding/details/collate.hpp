#ifndef SKULD_ENCODING_COLLATE_HPP
#define SKULD_ENCODING_COLLATE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "encoder.hpp"

namespace Skuld::Encoding::Details {
    struct Batch {
        torch::Tensor features{};      // [B, N, F]
        torch::Tensor bias{};          // [B, N, N]
        torch::Tensor depth{};         // [B, N]
        torch::Tensor padding_mask{};  // [B, N] bool, true on padded slots
        torch::Tensor root_index{};    // [B] int64

        [[nodiscard]] std::int64_t size() const { return features.defined() ? features.size(0) : 0; }

        [[nodiscard]] Batch to(const torch::Device& device) const
        {
            return Batch{
                .features = features.to(device),
                .bias = bias.to(device),
                .depth = depth.to(device),
                .padding_mask = padding_mask.to(device),
                .root_index = root_index.to(device),
            };
        }
    };

    // Pads every graph to the largest one. Padded query rows keep a finite bias so their
    // softmax stays defined; padded keys are hidden from real rows.
    inline Batch collate(const std::vector<const EncodedGraph*>& graphs)
    {
        if (graphs.empty()) {
            throw std::invalid_argument("collate requires at least one encoded graph.");
        }
        std::int64_t longest = 0;
        const auto width = graphs.front()->feature_width();
        for (const auto* graph : graphs) {
            if (graph == nullptr || !graph->features.defined()) {
                throw std::invalid_argument("collate received an empty encoded graph.");
            }
            if (graph->feature_width() != width) {
                throw std::invalid_argument("collate received graphs with feature widths "
                                            + std::to_string(width) + " and " + std::to_string(graph->feature_width()) + ".");
            }
            longest = std::max<std::int64_t>(longest, static_cast<std::int64_t>(graph->node_count()));
        }

        const auto batch = static_cast<std::int64_t>(graphs.size());
        auto features = torch::zeros({batch, longest, width}, torch::kFloat32);
        auto bias = torch::zeros({batch, longest, longest}, torch::kFloat32);
        auto depth = torch::zeros({batch, longest}, torch::kInt64);
        auto padding = torch::ones({batch, longest}, torch::kBool);
        auto roots = torch::zeros({batch}, torch::kInt64);

        using torch::indexing::Slice;
        for (std::int64_t index = 0; index < batch; ++index) {
            const auto& graph = *graphs[static_cast<std::size_t>(index)];
            const auto nodes = static_cast<std::int64_t>(graph.node_count());
            features.index_put_({index, Slice(0, nodes)}, graph.features);
            bias.index_put_({index, Slice(0, nodes), Slice(0, nodes)}, graph.bias);
            if (nodes < longest) {
                bias.index_put_({index, Slice(0, nodes), Slice(nodes, longest)},
                                -std::numeric_limits<float>::infinity());
            }
            depth.index_put_({index, Slice(0, nodes)}, graph.depth);
            padding.index_put_({index, Slice(0, nodes)}, false);
            roots.index_put_({index}, static_cast<std::int64_t>(graph.root_index));
        }

        return Batch{
            .features = features,
            .bias = bias,
            .depth = depth,
            .padding_mask = padding,
            .root_index = roots,
        };
    }

    inline Batch collate(const std::vector<EncodedGraph>& graphs)
    {
        std::vector<const EncodedGraph*> pointers;
        pointers.reserve(graphs.size());
        for (const auto& graph : graphs) {
            pointers.push_back(&graph);
        }
        return collate(pointers);
    }
}

#endif // SKULD_ENCODING_COLLATE_HPP
