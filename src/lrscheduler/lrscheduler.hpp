#ifndef SKULD_LRSCHEDULER_HPP
#define SKULD_LRSCHEDULER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstddef>
#include <memory>
#include <variant>

#include "details/cosine.hpp"

namespace Skuld::LrScheduler {
    using Scheduler = Details::Scheduler;
    using CosineAnnealingOptions = Details::CosineAnnealingOptions;
    using CosineAnnealingDescriptor = Details::CosineAnnealingDescriptor;

    using Descriptor = std::variant<CosineAnnealingDescriptor>;

    [[nodiscard]] constexpr auto CosineAnnealing(const CosineAnnealingOptions& options = {}) noexcept
        -> CosineAnnealingDescriptor {
        return {options};
    }

    using Details::annealed_learning_rate;

    inline std::unique_ptr<Scheduler> build(torch::optim::Optimizer& optimizer, const Descriptor& descriptor, std::size_t total_steps) {
        return std::visit([&](const auto& concrete) { return Details::build_scheduler(optimizer, concrete, total_steps); },
                          descriptor);
    }
}

#endif // SKULD_LRSCHEDULER_HPP
