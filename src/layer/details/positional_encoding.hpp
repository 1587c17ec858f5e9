#ifndef SKULD_LAYER_POSITIONAL_ENCODING_HPP
#define SKULD_LAYER_POSITIONAL_ENCODING_HPP
// "Attention Is All You Need" (sinusoidal positional encoding) https://arxiv.org/pdf/1706.03762
// Positions are graph depths rather than sequence offsets, so nodes on the same
// dependency level share an encoding.

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

namespace Skuld::Layer::Details {
    enum class PositionalEncodingType {
        None,
        Sinusoidal,
        Learned,
    };

    inline std::string to_string(PositionalEncodingType type)
    {
        switch (type) {
            case PositionalEncodingType::None:       return "none";
            case PositionalEncodingType::Sinusoidal: return "sinusoidal";
            case PositionalEncodingType::Learned:    return "learned";
        }
        return "unknown";
    }

    inline PositionalEncodingType parse_positional_encoding(const std::string& value)
    {
        if (value == "none") return PositionalEncodingType::None;
        if (value == "sinusoidal") return PositionalEncodingType::Sinusoidal;
        if (value == "learned") return PositionalEncodingType::Learned;
        throw std::invalid_argument("Unknown positional encoding '" + value + "'.");
    }

    struct PositionalEncodingOptions {
        PositionalEncodingType type{PositionalEncodingType::Sinusoidal};
        double dropout{0.0};
        std::size_t max_depth{2048};
    };

    class DepthEncodingImpl : public torch::nn::Module {
    public:
        DepthEncodingImpl(std::int64_t embedding_dim, PositionalEncodingOptions options = {})
            : embedding_dim_(embedding_dim), options_(std::move(options))
        {
            if (embedding_dim_ <= 0) {
                throw std::invalid_argument("Depth encoding requires a positive embedding dimension.");
            }
            if (options_.max_depth == 0) {
                throw std::invalid_argument("Depth encoding requires a positive maximum depth.");
            }

            dropout_ = register_module("dropout", torch::nn::Dropout(torch::nn::DropoutOptions(options_.dropout)));
            const auto rows = static_cast<std::int64_t>(options_.max_depth);
            if (options_.type == PositionalEncodingType::Sinusoidal) {
                table_ = register_buffer("positional_encoding", build_encoding(options_.max_depth, embedding_dim_));
            } else if (options_.type == PositionalEncodingType::Learned) {
                table_ = register_parameter("positional_embedding", torch::empty({rows, embedding_dim_}));
                torch::nn::init::normal_(table_, 0.0, 0.02);
            }
        }

        [[nodiscard]] const PositionalEncodingOptions& options() const noexcept { return options_; }

        // input: [B, N, D], depth: [B, N] int64.
        torch::Tensor forward(torch::Tensor input, const torch::Tensor& depth)
        {
            if (options_.type == PositionalEncodingType::None) {
                return dropout_->forward(input);
            }
            if (depth.numel() > 0 && depth.max().item<std::int64_t>() >= static_cast<std::int64_t>(options_.max_depth)) {
                throw std::out_of_range("Graph depth exceeds the configured maximum of "
                                        + std::to_string(options_.max_depth) + " for the depth encoding.");
            }
            auto positional = table_.index_select(0, depth.reshape({-1}).to(table_.device()))
                                  .view({depth.size(0), depth.size(1), embedding_dim_});
            input = input + positional.to(input.device(), input.dtype());
            return dropout_->forward(input);
        }

    private:
        static torch::Tensor build_encoding(std::size_t length, std::int64_t embedding_dim)
        {
            auto position = torch::arange(static_cast<std::int64_t>(length), torch::TensorOptions().dtype(torch::kFloat32));
            auto div_term = torch::arange(0, embedding_dim, 2, torch::TensorOptions().dtype(torch::kFloat32));
            div_term = torch::exp(-div_term * (std::log(10000.0) / static_cast<double>(embedding_dim)));

            auto encoding = torch::zeros({static_cast<std::int64_t>(length), embedding_dim},
                                         torch::TensorOptions().dtype(torch::kFloat32));

            auto sin_terms = torch::sin(position.unsqueeze(1) * div_term);
            auto cos_terms = torch::cos(position.unsqueeze(1) * div_term);

            encoding.slice(1, 0, embedding_dim, 2).copy_(sin_terms);
            if (embedding_dim > 1) {
                encoding.slice(1, 1, embedding_dim, 2).copy_(cos_terms.narrow(1, 0, embedding_dim / 2));
            }
            return encoding;
        }

        std::int64_t embedding_dim_{};
        PositionalEncodingOptions options_{};
        torch::Tensor table_{};
        torch::nn::Dropout dropout_{nullptr};
    };

    TORCH_MODULE(DepthEncoding);
}

#endif // SKULD_LAYER_POSITIONAL_ENCODING_HPP
