#ifndef SKULD_LOSS_DESCRIPTOR_IO_HPP
#define SKULD_LOSS_DESCRIPTOR_IO_HPP

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace Skuld::Loss {
    inline std::string name_of(const Descriptor& descriptor)
    {
        return std::visit([](const auto& concrete) -> std::string {
            using T = std::decay_t<decltype(concrete)>;
            if constexpr (std::is_same_v<T, Details::MSEDescriptor>) {
                return "mse";
            } else if constexpr (std::is_same_v<T, Details::SmoothL1Descriptor>) {
                return "smooth_l1";
            } else if constexpr (std::is_same_v<T, Details::MAEDescriptor>) {
                return "mae";
            } else {
                return "relative";
            }
        }, descriptor);
    }

    inline Descriptor parse_descriptor(const std::string& name)
    {
        if (name == "mse") return MSE();
        if (name == "smooth_l1") return SmoothL1();
        if (name == "mae") return MAE();
        if (name == "relative") return RelativeError();
        throw std::invalid_argument("Unknown loss '" + name + "'. Expected mse, smooth_l1, mae or relative.");
    }

    // Relative error compares de-normalized latencies; the others work on normalized targets.
    [[nodiscard]] inline bool operates_on_latency(const Descriptor& descriptor) noexcept
    {
        return std::holds_alternative<Details::RelativeErrorDescriptor>(descriptor);
    }
}

#endif // SKULD_LOSS_DESCRIPTOR_IO_HPP
