#ifndef SKULD_OPTIMIZER_BUILD_HPP
#define SKULD_OPTIMIZER_BUILD_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "descriptors.hpp"

namespace Skuld::Optimizer::Details {
    using Parameters = std::vector<torch::Tensor>;

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(const Parameters& parameters, const Descriptor& descriptor) {
        return std::visit([&](const auto& concrete) -> std::unique_ptr<torch::optim::Optimizer> {
            using T = std::decay_t<decltype(concrete)>;
            if constexpr (std::is_same_v<T, AdamWDescriptor>) {
                return std::make_unique<torch::optim::AdamW>(parameters, to_torch_options(concrete.options));
            } else if constexpr (std::is_same_v<T, AdamDescriptor>) {
                return std::make_unique<torch::optim::Adam>(parameters, to_torch_options(concrete.options));
            } else {
                return std::make_unique<torch::optim::SGD>(parameters, to_torch_options(concrete.options));
            }
        }, descriptor);
    }

    inline std::string name_of(const Descriptor& descriptor) {
        switch (descriptor.index()) {
            case 0:  return "adamw";
            case 1:  return "adam";
            default: return "sgd";
        }
    }

    inline double learning_rate(const Descriptor& descriptor) {
        return std::visit([](const auto& concrete) { return concrete.options.learning_rate; }, descriptor);
    }

    // Named optimizer at the given learning rate; other hyper-parameters keep their defaults.
    inline Descriptor parse_descriptor(const std::string& name, double learning_rate) {
        if (!(learning_rate > 0.0)) {
            throw std::invalid_argument("Optimizer learning rate must be positive, got " + std::to_string(learning_rate) + ".");
        }
        if (name == "adamw") return AdamWDescriptor{{.learning_rate = learning_rate}};
        if (name == "adam") return AdamDescriptor{{.learning_rate = learning_rate}};
        if (name == "sgd") return SGDDescriptor{{.learning_rate = learning_rate}};
        throw std::invalid_argument("Unknown optimizer '" + name + "'. Expected adamw, adam or sgd.");
    }
}

#endif // SKULD_OPTIMIZER_BUILD_HPP
