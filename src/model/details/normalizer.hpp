#ifndef SKULD_MODEL_NORMALIZER_HPP
#define SKULD_MODEL_NORMALIZER_HPP

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/save_load.hpp"

namespace Skuld::Model::Details {
    // z = (log1p(latency_ms) - mean) / std. Latencies span orders of magnitude across plans,
    // regression happens in this space and predictions are mapped back before leaving the model.
    class LatencyNormalizer {
    public:
        // Keeps de-normalized latencies finite in float32 whatever the network outputs.
        static constexpr double kMaxLogMilliseconds = 40.0;

        LatencyNormalizer() = default;
        LatencyNormalizer(double mean, double stddev) : mean_(mean), std_(stddev), fitted_(true)
        {
            if (!(std_ > 0.0) || !std::isfinite(mean_)) {
                throw std::invalid_argument("Latency normalizer requires a finite mean and a positive deviation.");
            }
        }

        void fit(const std::vector<double>& latencies_seconds)
        {
            if (latencies_seconds.empty()) {
                throw std::invalid_argument("Latency normalizer cannot be fitted on an empty set.");
            }
            double sum = 0.0;
            for (const auto latency : latencies_seconds) {
                sum += log_space(latency);
            }
            mean_ = sum / static_cast<double>(latencies_seconds.size());

            double squared = 0.0;
            for (const auto latency : latencies_seconds) {
                const auto delta = log_space(latency) - mean_;
                squared += delta * delta;
            }
            std_ = std::sqrt(squared / static_cast<double>(latencies_seconds.size()));
            if (std_ < 1e-6) {
                std_ = 1.0;
            }
            fitted_ = true;
        }

        [[nodiscard]] double normalize(double latency_seconds) const
        {
            return (log_space(latency_seconds) - mean_) / std_;
        }

        [[nodiscard]] double denormalize(double z) const
        {
            const auto milliseconds = std::expm1(std::min(z * std_ + mean_, kMaxLogMilliseconds));
            return milliseconds > 0.0 ? milliseconds / 1000.0 : 0.0;
        }

        // Differentiable counterpart used by losses on de-normalized latency.
        [[nodiscard]] torch::Tensor denormalize(const torch::Tensor& z) const
        {
            return torch::expm1((z * std_ + mean_).clamp_max(kMaxLogMilliseconds)).clamp_min(0.0) / 1000.0;
        }

        [[nodiscard]] double mean() const noexcept { return mean_; }
        [[nodiscard]] double stddev() const noexcept { return std_; }
        [[nodiscard]] bool fitted() const noexcept { return fitted_; }

        [[nodiscard]] Common::SaveLoad::PropertyTree to_property_tree() const
        {
            Common::SaveLoad::PropertyTree tree;
            tree.put("mean", mean_);
            tree.put("std", std_);
            return tree;
        }

        static LatencyNormalizer from_property_tree(const Common::SaveLoad::PropertyTree& tree, const std::string& context)
        {
            using Common::SaveLoad::Detail::get_numeric;
            return LatencyNormalizer(get_numeric<double>(tree, "mean", context), get_numeric<double>(tree, "std", context));
        }

    private:
        static double log_space(double latency_seconds)
        {
            if (!std::isfinite(latency_seconds) || latency_seconds < 0.0) {
                throw std::invalid_argument("Latency must be finite and non-negative, got " + std::to_string(latency_seconds) + ".");
            }
            return std::log1p(latency_seconds * 1000.0);
        }

        double mean_{0.0};
        double std_{1.0};
        bool fitted_{false};
    };
}

#endif // SKULD_MODEL_NORMALIZER_HPP
