#ifndef SKULD_LOSS_HPP
#define SKULD_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <string>
#include <variant>

#include "details/reduction.hpp"
#include "details/pointwise.hpp"
#include "details/relative.hpp"

namespace Skuld::Loss {
    using Reduction = Details::Reduction;

    using MSEOptions = Details::MSEOptions;
    using MAEOptions = Details::MAEOptions;
    using SmoothL1Options = Details::SmoothL1Options;
    using RelativeErrorOptions = Details::RelativeErrorOptions;

    using Descriptor = std::variant<
        Details::MSEDescriptor,
        Details::SmoothL1Descriptor,
        Details::MAEDescriptor,
        Details::RelativeErrorDescriptor>;

    [[nodiscard]] constexpr auto MSE(const Details::MSEOptions& options = {}) noexcept -> Details::MSEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto MAE(const Details::MAEOptions& options = {}) noexcept -> Details::MAEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto SmoothL1(const Details::SmoothL1Options& options = {}) noexcept -> Details::SmoothL1Descriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto RelativeError(const Details::RelativeErrorOptions& options = {}) noexcept -> Details::RelativeErrorDescriptor {
        return {options};
    }

    using Details::compute;
}

#include "details/descriptor_io.hpp"

#endif // SKULD_LOSS_HPP
