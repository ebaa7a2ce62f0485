#ifndef ROUNDWISE_UTILS_PROGRESSBAR_HPP
#define ROUNDWISE_UTILS_PROGRESSBAR_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace Roundwise::Utils {
    // Single-line iteration counter:
    //   conv2d_0 [██████▍      ]  52% (520/1000) 812 it/s eta 0:01 loss 0.0132
    class ProgressBar {
    public:
        using Clock = std::chrono::steady_clock;

        ProgressBar(std::int64_t total, std::string label, std::ostream& stream = std::cout, std::size_t width = 30)
            : total_(std::max<std::int64_t>(total, 0)),
              label_(std::move(label)),
              stream_(stream),
              width_(std::max<std::size_t>(width, 1)),
              started_(Clock::now()) {}

        ProgressBar(const ProgressBar&) = delete;
        ProgressBar& operator=(const ProgressBar&) = delete;

        ~ProgressBar() {
            if (drawn_ && !finished_) {
                stream_ << std::endl;
            }
        }

        void set_suffix(std::string suffix) {
            suffix_ = std::move(suffix);
        }

        void update(std::int64_t current) {
            if (finished_ || total_ == 0) {
                return;
            }
            current = std::clamp<std::int64_t>(current, 0, total_);

            // Redraw only when the bar moves by an eighth of a cell.
            const auto eighths = static_cast<std::int64_t>(width_ * 8 * current / total_);
            if (eighths == last_eighths_ && current != total_) {
                return;
            }
            last_eighths_ = eighths;
            drawn_ = true;

            stream_ << '\r' << render(current, eighths) << std::flush;
            if (current == total_) {
                finished_ = true;
                stream_ << std::endl;
            }
        }

        void complete() {
            update(total_);
        }

        [[nodiscard]] std::int64_t total() const noexcept { return total_; }

    private:
        [[nodiscard]] std::string render(std::int64_t current, std::int64_t eighths) const {
            std::ostringstream line;
            line << label_ << " [" << cells(eighths) << "] ";
            line << std::setw(3) << (current * 100 / total_) << "% (" << current << '/' << total_ << ')';

            const double seconds = std::chrono::duration<double>(Clock::now() - started_).count();
            if (seconds > 0.0 && current > 0) {
                const double rate = static_cast<double>(current) / seconds;
                line << ' ' << static_cast<std::int64_t>(std::round(rate)) << " it/s";
                if (current < total_) {
                    line << " eta " << clock_time(static_cast<double>(total_ - current) / rate);
                }
            }
            if (!suffix_.empty()) {
                line << ' ' << suffix_;
            }
            return line.str();
        }

        [[nodiscard]] std::string cells(std::int64_t eighths) const {
            // U+2588 full block, U+2589..U+258F seven to one eighths.
            static constexpr const char* kPartial[] = {
                "", "\xE2\x96\x8F", "\xE2\x96\x8E", "\xE2\x96\x8D",
                "\xE2\x96\x8C", "\xE2\x96\x8B", "\xE2\x96\x8A", "\xE2\x96\x89"};

            const auto full = static_cast<std::size_t>(eighths / 8);
            const auto partial = static_cast<std::size_t>(eighths % 8);
            std::string out;
            for (std::size_t cell = 0; cell < full; ++cell) {
                out += "\xE2\x96\x88";
            }
            std::size_t used = full;
            if (partial > 0 && full < width_) {
                out += kPartial[partial];
                ++used;
            }
            out.append(width_ - std::min(used, width_), ' ');
            return out;
        }

        [[nodiscard]] static std::string clock_time(double seconds) {
            const auto total = static_cast<std::int64_t>(std::ceil(seconds));
            std::ostringstream out;
            out << total / 60 << ':' << std::setw(2) << std::setfill('0') << total % 60;
            return out.str();
        }

        std::int64_t total_;
        std::string label_;
        std::ostream& stream_;
        std::size_t width_;
        Clock::time_point started_;
        std::string suffix_{};
        std::int64_t last_eighths_{-1};
        bool drawn_{false};
        bool finished_{false};
    };
}

#endif // ROUNDWISE_UTILS_PROGRESSBAR_HPP
