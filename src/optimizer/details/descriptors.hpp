#ifndef SKULD_OPTIMIZER_DESCRIPTORS_HPP
#define SKULD_OPTIMIZER_DESCRIPTORS_HPP

#include <tuple>
#include <variant>

#include <torch/torch.h>

// Defaults are tuned for the latency predictor: small transformers fit on a few hundred plans.
namespace Skuld::Optimizer::Details {
    struct AdamWOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{1e-4};
    };

    struct AdamWDescriptor {
        AdamWOptions options{};
    };

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    struct SGDOptions {
        double learning_rate{1e-2};
        double momentum{0.9};
        double weight_decay{0.0};
        bool nesterov{true};
    };

    struct SGDDescriptor {
        SGDOptions options{};
    };

    using Descriptor = std::variant<AdamWDescriptor, AdamDescriptor, SGDDescriptor>;

    inline torch::optim::AdamWOptions to_torch_options(const AdamWOptions& options) {
        return torch::optim::AdamWOptions(options.learning_rate)
            .betas(std::make_tuple(options.beta1, options.beta2))
            .eps(options.eps)
            .weight_decay(options.weight_decay);
    }

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        return torch::optim::AdamOptions(options.learning_rate)
            .betas(std::make_tuple(options.beta1, options.beta2))
            .eps(options.eps);
    }

    // Nesterov needs momentum and zero dampening, so dampening is never exposed.
    inline torch::optim::SGDOptions to_torch_options(const SGDOptions& options) {
        return torch::optim::SGDOptions(options.learning_rate)
            .momentum(options.momentum)
            .weight_decay(options.weight_decay)
            .nesterov(options.nesterov && options.momentum > 0.0);
    }
}

#endif // SKULD_OPTIMIZER_DESCRIPTORS_HPP
