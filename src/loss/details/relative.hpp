#ifndef SKULD_LOSS_RELATIVE_HPP
#define SKULD_LOSS_RELATIVE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Skuld::Loss::Details {
    struct RelativeErrorOptions {
        Reduction reduction{Reduction::Mean};
        double epsilon{1e-9};
    };

    struct RelativeErrorDescriptor {
        RelativeErrorOptions options{};
    };

    // |prediction - target| / target, on de-normalized latencies.
    inline torch::Tensor compute(const RelativeErrorDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target)
    {
        auto per_elem = (prediction - target).abs() / target.abs().clamp_min(descriptor.options.epsilon);
        return apply_reduction(per_elem, descriptor.options.reduction);
    }
}

#endif // SKULD_LOSS_RELATIVE_HPP
