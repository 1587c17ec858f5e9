#ifndef SKULD_LRSCHEDULER_COSINE_HPP
#define SKULD_LRSCHEDULER_COSINE_HPP
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <vector>
// "SGDR: Stochastic Gradient Descent with Warm Restarts" (cosine annealing) https://arxiv.org/pdf/1608.03983
#include <torch/torch.h>

namespace Skuld::LrScheduler::Details {
    // Stepped once per optimizer step.
    class Scheduler {
    public:
        virtual ~Scheduler() = default;
        virtual void step() = 0;
        [[nodiscard]] virtual double current_lr() const = 0;
    };

    struct CosineAnnealingOptions {
        std::size_t T_max{0};              // 0: anneal over every step left after warmup
        double eta_min{0.0};
        std::size_t warmup_steps{0};
        double warmup_start_factor{0.0};   // warmup starts at base_lr * factor
    };

    struct CosineAnnealingDescriptor {
        CosineAnnealingOptions options{};
    };

    // Linear warmup, then a single cosine half-period from base_lr down to eta_min. Steps past
    // the period stay at eta_min.
    [[nodiscard]] inline double annealed_learning_rate(double base_lr, std::size_t step, const CosineAnnealingOptions& options)
    {
        if (step < options.warmup_steps) {
            const auto progress = static_cast<double>(step) / static_cast<double>(options.warmup_steps);
            return base_lr * (options.warmup_start_factor + (1.0 - options.warmup_start_factor) * progress);
        }
        const auto period = std::max<std::size_t>(options.T_max, 1);
        const auto position = static_cast<double>(std::min(step - options.warmup_steps, period)) / static_cast<double>(period);
        constexpr double kPi = 3.14159265358979323846;
        return options.eta_min + 0.5 * (base_lr - options.eta_min) * (1.0 + std::cos(kPi * position));
    }

    class CosineAnnealingScheduler final : public Scheduler {
    public:
        CosineAnnealingScheduler(torch::optim::Optimizer& optimizer, CosineAnnealingOptions options, std::size_t total_steps)
            : optimizer_(optimizer), options_(options) {
            if (options_.warmup_start_factor < 0.0 || options_.warmup_start_factor > 1.0) {
                throw std::invalid_argument("Cosine annealing warmup_start_factor must be within [0, 1].");
            }
            if (options_.eta_min < 0.0) {
                throw std::invalid_argument("Cosine annealing eta_min must be non-negative.");
            }
            if (options_.T_max == 0) {
                options_.T_max = total_steps > options_.warmup_steps ? total_steps - options_.warmup_steps : 1;
            }
            for (auto& group : optimizer_.param_groups()) {
                base_lrs_.push_back(group.options().get_lr());
            }
            apply();
        }

        void step() override {
            ++step_;
            apply();
        }

        [[nodiscard]] double current_lr() const override {
            return base_lrs_.empty() ? 0.0 : annealed_learning_rate(base_lrs_.front(), step_, options_);
        }

    private:
        void apply() {
            auto& groups = optimizer_.param_groups();
            for (std::size_t index = 0; index < groups.size() && index < base_lrs_.size(); ++index) {
                groups[index].options().set_lr(annealed_learning_rate(base_lrs_[index], step_, options_));
            }
        }

        torch::optim::Optimizer& optimizer_;
        CosineAnnealingOptions options_{};
        std::vector<double> base_lrs_{};
        std::size_t step_{0};
    };

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer,
                                                      const CosineAnnealingDescriptor& descriptor,
                                                      std::size_t total_steps) {
        return std::make_unique<CosineAnnealingScheduler>(optimizer, descriptor.options, total_steps);
    }
}

#endif // SKULD_LRSCHEDULER_COSINE_HPP
