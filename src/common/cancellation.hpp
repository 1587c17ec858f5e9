#ifndef SKULD_COMMON_CANCELLATION_HPP
#define SKULD_COMMON_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace Skuld::Common {
    // Cooperative cancellation flag. Copies share the same state; long-running loops poll
    // `cancelled()` between units of work and never stop mid-step.
    class CancellationToken {
    public:
        CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() noexcept { state_->store(true, std::memory_order_release); }
        void reset() noexcept { state_->store(false, std::memory_order_release); }

        [[nodiscard]] bool cancelled() const noexcept { return state_->load(std::memory_order_acquire); }

    private:
        std::shared_ptr<std::atomic<bool>> state_;
    };
}

#endif // SKULD_COMMON_CANCELLATION_HPP
