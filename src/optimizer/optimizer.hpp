#ifndef SKULD_OPTIMIZER_HPP
#define SKULD_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/descriptors.hpp"
#include "details/build.hpp"

namespace Skuld::Optimizer {
    using AdamWOptions = Details::AdamWOptions;
    using AdamWDescriptor = Details::AdamWDescriptor;

    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;

    using Descriptor = Details::Descriptor;
    using Parameters = Details::Parameters;

    [[nodiscard]] inline constexpr auto AdamW(const AdamWOptions& options = {}) noexcept -> AdamWDescriptor {
        return AdamWDescriptor{.options = options};
    }

    [[nodiscard]] inline constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

    [[nodiscard]] inline constexpr auto SGD(const SGDOptions& options = {}) noexcept -> SGDDescriptor {
        return SGDDescriptor{.options = options};
    }

    using Details::name_of;
    using Details::learning_rate;
    using Details::parse_descriptor;

    inline auto build(const Parameters& parameters, const Descriptor& descriptor) {
        return Details::build_optimizer(parameters, descriptor);
    }
}

#endif // SKULD_OPTIMIZER_HPP
