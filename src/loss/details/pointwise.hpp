#ifndef SKULD_LOSS_POINTWISE_HPP
#define SKULD_LOSS_POINTWISE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

// Losses on normalized log-latency targets. Each returns the per-plan error before reduction
// so the relative loss can share the same reduction path.
namespace Skuld::Loss::Details {
    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    struct MAEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MAEDescriptor {
        MAEOptions options{};
    };

    struct SmoothL1Options {
        Reduction reduction{Reduction::Mean};
        double beta{1.0};   // quadratic below beta, linear above
    };

    struct SmoothL1Descriptor {
        SmoothL1Options options{};
    };

    inline torch::Tensor compute(const MSEDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target)
    {
        return apply_reduction((prediction - target).pow(2), descriptor.options.reduction);
    }

    inline torch::Tensor compute(const MAEDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target)
    {
        return apply_reduction((prediction - target).abs(), descriptor.options.reduction);
    }

    inline torch::Tensor compute(const SmoothL1Descriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target)
    {
        const auto beta = descriptor.options.beta;
        const auto error = (prediction - target).abs();
        if (beta <= 0.0) {
            return apply_reduction(error, descriptor.options.reduction);
        }
        const auto per_plan = torch::where(error < beta, 0.5 * error.pow(2) / beta, error - 0.5 * beta);
        return apply_reduction(per_plan, descriptor.options.reduction);
    }
}

#endif // SKULD_LOSS_POINTWISE_HPP
