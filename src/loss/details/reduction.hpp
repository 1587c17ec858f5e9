#ifndef SKULD_LOSS_REDUCTION_HPP
#define SKULD_LOSS_REDUCTION_HPP

#include <torch/torch.h>

namespace Skuld::Loss::Details {
    enum class Reduction { Mean, Sum, None };

    // Reduces a per-plan loss vector.
    inline torch::Tensor apply_reduction(const torch::Tensor& per_plan, Reduction reduction) {
        switch (reduction) {
            case Reduction::None: return per_plan;
            case Reduction::Sum:  return per_plan.sum();
            case Reduction::Mean: break;
        }
        return per_plan.mean();
    }
}

#endif // SKULD_LOSS_REDUCTION_HPP
