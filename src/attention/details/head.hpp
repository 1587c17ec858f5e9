#ifndef SKULD_ATTENTION_HEAD_HPP
#define SKULD_ATTENTION_HEAD_HPP
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <torch/torch.h>

#include "kernel.hpp"

namespace Skuld::Attention::Details {
    struct MultiHeadOptions {
        std::int64_t embed_dim{};
        std::int64_t num_heads{1};
        double dropout{0.0};
        bool bias{true};
    };

    // Batch-first multi-head self attention over graph nodes with an additive structural bias.
    class MultiHeadAttentionImpl : public torch::nn::Module {
    public:
        explicit MultiHeadAttentionImpl(MultiHeadOptions options)
            : options_(std::move(options))
        {
            if (options_.num_heads <= 0) {
                throw std::invalid_argument("Multi-head attention requires a positive number of heads.");
            }
            if (options_.embed_dim <= 0) {
                throw std::invalid_argument("Multi-head attention requires a positive embedding dimension.");
            }
            if (options_.embed_dim % options_.num_heads != 0) {
                throw std::invalid_argument("Embedding dimension must be divisible by the number of heads.");
            }

            const auto embed_dim = options_.embed_dim;
            q_proj_ = register_module(
                "q_proj", torch::nn::Linear(torch::nn::LinearOptions(embed_dim, embed_dim).bias(options_.bias)));
            k_proj_ = register_module(
                "k_proj", torch::nn::Linear(torch::nn::LinearOptions(embed_dim, embed_dim).bias(options_.bias)));
            v_proj_ = register_module(
                "v_proj", torch::nn::Linear(torch::nn::LinearOptions(embed_dim, embed_dim).bias(options_.bias)));
            out_proj_ = register_module(
                "out_proj", torch::nn::Linear(torch::nn::LinearOptions(embed_dim, embed_dim).bias(options_.bias)));

            kernel_ = register_module("kernel", ScaledDotProductKernel(options_.dropout));
            dropout_ = register_module("dropout", torch::nn::Dropout(torch::nn::DropoutOptions(options_.dropout)));
        }

        // input: [B, N, D]; attn_bias: [B, N, N]; key_padding_mask: [B, N] (true = padded).
        torch::Tensor forward(const torch::Tensor& input,
                              const torch::Tensor& attn_bias = {},
                              const torch::Tensor& key_padding_mask = {})
        {
            const auto head_dim = options_.embed_dim / options_.num_heads;
            const auto batch_size = input.size(0);
            const auto length = input.size(1);

            const auto split_heads = [&](const torch::Tensor& tensor) {
                return tensor.contiguous()
                    .view({batch_size, length, options_.num_heads, head_dim})
                    .transpose(1, 2);
            };

            auto q = split_heads(q_proj_->forward(input));
            auto k = split_heads(k_proj_->forward(input));
            auto v = split_heads(v_proj_->forward(input));

            auto attn_output = kernel_->forward(q, k, v, attn_bias, key_padding_mask);
            attn_output = attn_output.transpose(1, 2).contiguous().view({batch_size, length, options_.embed_dim});
            auto output = out_proj_->forward(attn_output);
            return dropout_->forward(output);
        }

        [[nodiscard]] const MultiHeadOptions& options() const noexcept { return options_; }

    private:
        MultiHeadOptions options_{};
        ScaledDotProductKernel kernel_{nullptr};
        torch::nn::Linear q_proj_{nullptr};
        torch::nn::Linear k_proj_{nullptr};
        torch::nn::Linear v_proj_{nullptr};
        torch::nn::Linear out_proj_{nullptr};
        torch::nn::Dropout dropout_{nullptr};
    };

    TORCH_MODULE(MultiHeadAttention);
}
#endif // SKULD_ATTENTION_HEAD_HPP
