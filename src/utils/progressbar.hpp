#ifndef SKULD_UTILS_PROGRESSBAR_HPP
#define SKULD_UTILS_PROGRESSBAR_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace Skuld::Utils {
    // Single-line progress bar. `advance` may be called from several worker threads.
    class ProgressBar {
    public:
        ProgressBar(std::ostream* stream, std::int64_t total, std::string label, std::size_t width = 30)
            : stream_(stream),
              total_(std::max<std::int64_t>(total, 0)),
              label_(std::move(label)),
              width_(std::max<std::size_t>(width, static_cast<std::size_t>(1))) {}

        ProgressBar(const ProgressBar&) = delete;
        ProgressBar& operator=(const ProgressBar&) = delete;

        void advance(std::int64_t step = 1) {
            std::lock_guard<std::mutex> lock(mutex_);
            current_ = std::min(current_ + step, total_);
            render();
        }

        void complete() {
            std::lock_guard<std::mutex> lock(mutex_);
            current_ = total_;
            render();
            finish();
        }

        [[nodiscard]] std::int64_t total() const noexcept { return total_; }

    private:
        void render() {
            if (stream_ == nullptr || finished_ || total_ <= 0) {
                return;
            }

            const double ratio = static_cast<double>(current_) / static_cast<double>(total_);
            auto scaled_units = static_cast<std::int64_t>(std::round(ratio * static_cast<double>(width_) * 8.0));
            scaled_units = std::min<std::int64_t>(scaled_units, static_cast<std::int64_t>(width_) * 8);

            if (scaled_units == last_units_ && current_ != total_) {
                return;
            }
            last_units_ = scaled_units;

            const auto full_cells = static_cast<std::size_t>(scaled_units / 8);
            const auto partial_index = static_cast<std::size_t>(scaled_units % 8);

            std::ostringstream line;
            line << '\r' << label_ << " [";
            for (std::size_t i = 0; i < full_cells && i < width_; ++i) {
                line << "\xE2\x96\x88";
            }
            const bool has_partial_cell = partial_index > 0 && full_cells < width_;
            if (has_partial_cell) {
                line << PartialBlock(partial_index);
            }
            const std::size_t printed_cells = full_cells + (has_partial_cell ? 1 : 0);
            if (printed_cells < width_) {
                line << std::string(width_ - printed_cells, ' ');
            }
            line << "] " << std::setw(3) << static_cast<int>(std::round(ratio * 100.0)) << "% "
                 << '(' << current_ << '/' << total_ << ')';

            *stream_ << line.str() << std::flush;

            if (current_ == total_) {
                finish();
            }
        }

        static const char* PartialBlock(std::size_t index) {
            static constexpr const char* blocks[] = {
                "",
                "\xE2\x96\x8F",
                "\xE2\x96\x8E",
                "\xE2\x96\x8D",
                "\xE2\x96\x8C",
                "\xE2\x96\x8B",
                "\xE2\x96\x8A",
                "\xE2\x96\x89"
            };
            return blocks[std::min<std::size_t>(index, 7)];
        }

        void finish() {
            if (finished_) {
                return;
            }
            finished_ = true;
            if (stream_ != nullptr && total_ > 0) {
                *stream_ << '\n';
            }
        }

        std::ostream* stream_{nullptr};
        std::int64_t total_{};
        std::int64_t current_{};
        std::string label_{};
        std::size_t width_{};
        std::int64_t last_units_{-1};
        bool finished_{false};
        std::mutex mutex_{};
    };
}

#endif // SKULD_UTILS_PROGRESSBAR_HPP
