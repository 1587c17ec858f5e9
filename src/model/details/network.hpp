#ifndef SKULD_MODEL_NETWORK_HPP
#define SKULD_MODEL_NETWORK_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <torch/torch.h>

#include "../../block/block.hpp"
#include "../../common/save_load.hpp"
#include "../../encoding/encoding.hpp"
#include "../../layer/layer.hpp"

namespace Skuld::Model::Details {
    struct NetworkOptions {
        std::int64_t embed_dim{64};
        std::int64_t num_heads{4};
        std::size_t layers{3};
        double mlp_ratio{2.0};
        double dropout{0.0};
        std::int64_t readout_hidden{64};
        Layer::PositionalEncodingType positional_encoding{Layer::PositionalEncodingType::Sinusoidal};
        std::size_t max_depth{2048};

        bool operator==(const NetworkOptions&) const = default;
    };

    inline Common::SaveLoad::PropertyTree to_property_tree(const NetworkOptions& options)
    {
        Common::SaveLoad::PropertyTree tree;
        tree.put("embed_dim", options.embed_dim);
        tree.put("num_heads", options.num_heads);
        tree.put("layers", options.layers);
        tree.put("mlp_ratio", options.mlp_ratio);
        tree.put("dropout", options.dropout);
        tree.put("readout_hidden", options.readout_hidden);
        tree.put("positional_encoding", Layer::to_string(options.positional_encoding));
        tree.put("max_depth", options.max_depth);
        return tree;
    }

    // Missing keys keep their defaults.
    inline NetworkOptions network_options_from(const Common::SaveLoad::PropertyTree& tree, const std::string& context)
    {
        using Common::SaveLoad::Detail::read_optional;
        NetworkOptions options{};
        read_optional(tree, "embed_dim", options.embed_dim, context);
        read_optional(tree, "num_heads", options.num_heads, context);
        read_optional(tree, "layers", options.layers, context);
        read_optional(tree, "mlp_ratio", options.mlp_ratio, context);
        read_optional(tree, "dropout", options.dropout, context);
        read_optional(tree, "readout_hidden", options.readout_hidden, context);
        read_optional(tree, "max_depth", options.max_depth, context);
        if (const auto encoding = tree.get_optional<std::string>("positional_encoding")) {
            options.positional_encoding = Layer::parse_positional_encoding(*encoding);
        }
        return options;
    }

    // features -> projection -> depth encoding + biased encoder layers -> [root | masked mean] -> MLP -> scalar.
    class LatencyNetworkImpl : public torch::nn::Module {
    public:
        LatencyNetworkImpl(std::int64_t feature_width, NetworkOptions options)
            : feature_width_(feature_width), options_(std::move(options))
        {
            if (feature_width_ <= 0) {
                throw std::invalid_argument("Latency network requires a positive feature width.");
            }

            input_projection_ = register_module("input_projection", torch::nn::Linear(feature_width_, options_.embed_dim));
            encoder_ = register_module("encoder", Block::GraphEncoder(Block::EncoderOptions{
                .layers = options_.layers,
                .embed_dim = options_.embed_dim,
                .num_heads = options_.num_heads,
                .mlp_ratio = options_.mlp_ratio,
                .dropout = options_.dropout,
                .layer_norm = {},
                .positional_encoding = {
                    .type = options_.positional_encoding,
                    .dropout = 0.0,
                    .max_depth = options_.max_depth,
                },
            }));
            readout_hidden_ = register_module("readout_hidden", torch::nn::Linear(2 * options_.embed_dim, options_.readout_hidden));
            readout_output_ = register_module("readout_output", torch::nn::Linear(options_.readout_hidden, 1));
        }

        // Returns one normalized latency per graph, shape [B].
        torch::Tensor forward(const Encoding::Batch& batch)
        {
            auto hidden = input_projection_->forward(batch.features);
            hidden = encoder_->forward(hidden, batch.depth, batch.bias, batch.padding_mask);

            const auto batch_size = hidden.size(0);
            auto root_index = batch.root_index.view({batch_size, 1, 1}).expand({batch_size, 1, hidden.size(2)});
            auto root = hidden.gather(1, root_index).squeeze(1);

            auto valid = (~batch.padding_mask).to(hidden.dtype()).unsqueeze(-1);
            auto mean = (hidden * valid).sum(1) / valid.sum(1).clamp_min(1.0);

            auto pooled = torch::cat({root, mean}, -1);
            auto output = readout_output_->forward(torch::gelu(readout_hidden_->forward(pooled)));
            return output.squeeze(-1);
        }

        [[nodiscard]] std::int64_t feature_width() const noexcept { return feature_width_; }
        [[nodiscard]] const NetworkOptions& options() const noexcept { return options_; }

    private:
        std::int64_t feature_width_{};
        NetworkOptions options_{};
        torch::nn::Linear input_projection_{nullptr};
        Block::GraphEncoder encoder_{nullptr};
        torch::nn::Linear readout_hidden_{nullptr};
        torch::nn::Linear readout_output_{nullptr};
    };

    TORCH_MODULE(LatencyNetwork);
}

#endif // SKULD_MODEL_NETWORK_HPP
