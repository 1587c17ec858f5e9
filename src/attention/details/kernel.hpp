#ifndef SKULD_ATTENTION_KERNEL_HPP
#define SKULD_ATTENTION_KERNEL_HPP
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Skuld::Attention::Details {
    // Folds the per-graph structural bias [B, N, N] and the key padding mask [B, N] into one
    // additive term shaped [B, 1, N, N] so every head sees the same graph structure.
    inline torch::Tensor structural_mask(const torch::Tensor& attn_bias,
                                         const torch::Tensor& key_padding_mask,
                                         std::int64_t batch_size,
                                         std::int64_t nodes,
                                         torch::ScalarType dtype)
    {
        torch::Tensor mask;
        if (attn_bias.defined() && attn_bias.numel() > 0) {
            if (attn_bias.dim() != 3 || attn_bias.size(0) != batch_size || attn_bias.size(1) != nodes
                || attn_bias.size(2) != nodes) {
                throw std::invalid_argument("Structural bias must be [batch=" + std::to_string(batch_size) + ", nodes="
                                            + std::to_string(nodes) + ", nodes=" + std::to_string(nodes) + "], got a "
                                            + std::to_string(attn_bias.dim()) + "D tensor.");
            }
            mask = attn_bias.to(dtype).unsqueeze(1);
        }
        if (key_padding_mask.defined() && key_padding_mask.numel() > 0) {
            if (key_padding_mask.dim() != 2 || key_padding_mask.size(0) != batch_size || key_padding_mask.size(1) != nodes) {
                throw std::invalid_argument("Padding mask must be [batch=" + std::to_string(batch_size) + ", nodes="
                                            + std::to_string(nodes) + "].");
            }
            const auto padded = torch::zeros({batch_size, 1, 1, nodes}, torch::TensorOptions().dtype(dtype).device(key_padding_mask.device()))
                                    .masked_fill(key_padding_mask.to(torch::kBool).view({batch_size, 1, 1, nodes}),
                                                 -std::numeric_limits<float>::infinity());
            mask = mask.defined() ? mask + padded : padded;
        }
        return mask;
    }

    // softmax(QK^T / sqrt(d) + mask) V over plan-graph nodes; -inf entries hide a node pair.
    class ScaledDotProductKernelImpl : public torch::nn::Module {
    public:
        explicit ScaledDotProductKernelImpl(double dropout = 0.0)
            : dropout_(register_module("dropout", torch::nn::Dropout(torch::nn::DropoutOptions(dropout)))) {}

        // query, key, value: [B, H, N, d].
        torch::Tensor forward(const torch::Tensor& query,
                              const torch::Tensor& key,
                              const torch::Tensor& value,
                              const torch::Tensor& attn_bias = {},
                              const torch::Tensor& key_padding_mask = {})
        {
            auto scores = torch::matmul(query, key.transpose(-2, -1)) / std::sqrt(static_cast<double>(query.size(-1)));
            const auto mask = structural_mask(attn_bias, key_padding_mask, scores.size(0), scores.size(2), scores.scalar_type());
            if (mask.defined()) {
                scores = scores + mask;
            }
            return torch::matmul(dropout_->forward(torch::softmax(scores, -1)), value);
        }

    private:
        torch::nn::Dropout dropout_{nullptr};
    };

    TORCH_MODULE(ScaledDotProductKernel);
}
#endif // SKULD_ATTENTION_KERNEL_HPP
