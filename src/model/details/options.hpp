#ifndef SKULD_MODEL_OPTIONS_HPP
#define SKULD_MODEL_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <ostream>

#include "../../common/cancellation.hpp"
#include "../../loss/loss.hpp"
#include "../../lrscheduler/lrscheduler.hpp"
#include "../../optimizer/optimizer.hpp"

namespace Skuld::Model::Details {
    struct EpochReport {
        std::size_t epoch{};
        std::size_t total_epochs{};
        double train_loss{};
        std::optional<double> validation_loss{};
        bool improved{false};
        double learning_rate{};
        double duration_seconds{};
    };

    struct FitOptions {
        std::size_t epochs{60};
        std::size_t batch_size{16};
        std::size_t min_examples{10};
        double validation_fraction{0.2};
        bool shuffle{true};
        bool restore_best_state{true};
        bool warm_start{false};
        std::uint64_t seed{42};
        double gradient_clip{1.0};     // <= 0 disables clipping
        Loss::Descriptor loss{Loss::MSE()};
        Optimizer::Descriptor optimizer{Optimizer::AdamW()};
        std::optional<LrScheduler::Descriptor> scheduler{};
        bool monitor{true};
        std::ostream* stream{&std::cout};
        Common::CancellationToken cancellation{};
        // Called at every epoch boundary, the only point where parameters are coherent.
        std::function<void(const EpochReport&)> on_epoch{};
    };

    struct FitReport {
        std::size_t examples{};
        std::size_t train_examples{};
        std::size_t validation_examples{};
        std::size_t epochs_completed{};
        double final_train_loss{};
        std::optional<double> best_validation_loss{};
        bool restored_best_state{false};
        bool cancelled{false};
    };
}

#endif // SKULD_MODEL_OPTIONS_HPP
