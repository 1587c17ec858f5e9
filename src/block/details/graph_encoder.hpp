#ifndef SKULD_BLOCK_GRAPH_ENCODER_HPP
#define SKULD_BLOCK_GRAPH_ENCODER_HPP

// Pre-norm transformer encoder ("Attention Is All You Need", arXiv:1706.03762) run over
// plan-graph nodes. Attention scores receive the structural bias produced by the graph
// encoder and positions come from node depth.

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../attention/attention.hpp"
#include "../../layer/details/positional_encoding.hpp"

namespace Skuld::Block::Details {
    using PositionalEncodingType = ::Skuld::Layer::Details::PositionalEncodingType;
    using PositionalEncodingOptions = ::Skuld::Layer::Details::PositionalEncodingOptions;

    struct LayerNormOptions {
        double eps{1e-5};
        bool elementwise_affine{true};
    };

    struct EncoderOptions {
        std::size_t layers{3};
        std::int64_t embed_dim{64};
        std::int64_t num_heads{4};
        double mlp_ratio{2.0};
        double dropout{0.0};
        LayerNormOptions layer_norm{};
        PositionalEncodingOptions positional_encoding{};
    };

    class EncoderLayerImpl : public torch::nn::Module {
    public:
        explicit EncoderLayerImpl(const EncoderOptions& options)
            : embed_dim_(options.embed_dim)
        {
            if (embed_dim_ <= 0) {
                throw std::invalid_argument("Encoder layer requires a positive embedding dimension.");
            }

            auto norm_options = torch::nn::LayerNormOptions(std::vector<int64_t>{embed_dim_})
                                     .eps(options.layer_norm.eps)
                                     .elementwise_affine(options.layer_norm.elementwise_affine);
            norm1_ = register_module("norm1", torch::nn::LayerNorm(norm_options));
            norm2_ = register_module("norm2", torch::nn::LayerNorm(norm_options));

            attention_ = register_module("self_attention", ::Skuld::Attention::MultiHeadAttention(
                ::Skuld::Attention::MultiHeadOptions{
                    .embed_dim = embed_dim_,
                    .num_heads = options.num_heads,
                    .dropout = options.dropout,
                    .bias = true,
                }));

            auto hidden_dim = static_cast<std::int64_t>(std::llround(options.mlp_ratio * static_cast<double>(embed_dim_)));
            if (hidden_dim <= 0) {
                hidden_dim = embed_dim_;
            }
            fc1_ = register_module("fc1", torch::nn::Linear(embed_dim_, hidden_dim));
            fc2_ = register_module("fc2", torch::nn::Linear(hidden_dim, embed_dim_));
            dropout_ = register_module("dropout", torch::nn::Dropout(torch::nn::DropoutOptions(options.dropout)));
        }

        torch::Tensor forward(torch::Tensor input,
                              const torch::Tensor& attn_bias = {},
                              const torch::Tensor& key_padding_mask = {})
        {
            auto residual = input;
            auto normalised = norm1_->forward(residual);
            auto output = residual + attention_->forward(normalised, attn_bias, key_padding_mask);

            residual = output;
            auto feed_forward = torch::gelu(fc1_->forward(norm2_->forward(output)));
            feed_forward = dropout_->forward(fc2_->forward(feed_forward));
            return residual + feed_forward;
        }

    private:
        std::int64_t embed_dim_{};
        ::Skuld::Attention::MultiHeadAttention attention_{nullptr};
        torch::nn::LayerNorm norm1_{nullptr};
        torch::nn::LayerNorm norm2_{nullptr};
        torch::nn::Linear fc1_{nullptr};
        torch::nn::Linear fc2_{nullptr};
        torch::nn::Dropout dropout_{nullptr};
    };

    TORCH_MODULE(EncoderLayer);

    class GraphEncoderImpl : public torch::nn::Module {
    public:
        explicit GraphEncoderImpl(EncoderOptions options)
            : options_(std::move(options))
        {
            if (options_.embed_dim <= 0) {
                throw std::invalid_argument("Graph encoder requires a positive embedding dimension.");
            }

            depth_encoding_ = register_module(
                "depth_encoding", ::Skuld::Layer::Details::DepthEncoding(options_.embed_dim, options_.positional_encoding));

            auto norm_options = torch::nn::LayerNormOptions(std::vector<int64_t>{options_.embed_dim})
                                     .eps(options_.layer_norm.eps)
                                     .elementwise_affine(options_.layer_norm.elementwise_affine);
            final_layer_norm_ = register_module("final_layer_norm", torch::nn::LayerNorm(norm_options));

            layers_.reserve(options_.layers);
            for (std::size_t index = 0; index < options_.layers; ++index) {
                layers_.push_back(register_module("layer_" + std::to_string(index), EncoderLayer(options_)));
            }
        }

        // input: [B, N, D] node embeddings; depth: [B, N]; attn_bias: [B, N, N].
        torch::Tensor forward(torch::Tensor input,
                              const torch::Tensor& depth,
                              const torch::Tensor& attn_bias = {},
                              const torch::Tensor& key_padding_mask = {})
        {
            auto output = depth_encoding_->forward(std::move(input), depth);
            for (auto& layer : layers_) {
                output = layer->forward(std::move(output), attn_bias, key_padding_mask);
            }
            return final_layer_norm_->forward(output);
        }

        [[nodiscard]] const EncoderOptions& options() const noexcept { return options_; }

    private:
        EncoderOptions options_{};
        ::Skuld::Layer::Details::DepthEncoding depth_encoding_{nullptr};
        std::vector<EncoderLayer> layers_{};
        torch::nn::LayerNorm final_layer_norm_{nullptr};
    };

    TORCH_MODULE(GraphEncoder);
}

#endif // SKULD_BLOCK_GRAPH_ENCODER_HPP
