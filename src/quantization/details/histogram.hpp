#ifndef ROUNDWISE_QUANTIZATION_DETAILS_HISTOGRAM_HPP
#define ROUNDWISE_QUANTIZATION_DETAILS_HISTOGRAM_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "encoding.hpp"

namespace Roundwise::Quantization::Details {
    struct SqnrSearchOptions {
        std::int64_t num_bins{2048};
        int symmetric_delta_candidates{101};
        int asymmetric_delta_candidates{17};
        int offset_candidates{21};
        double gamma{3.0};
        double p{2.0};
    };

    // Running histogram. Widening the range re-bins the existing counts by
    // bin centre.
    class Histogram {
    public:
        explicit Histogram(std::int64_t num_bins = 2048) : counts_(static_cast<std::size_t>(num_bins), 0.0)
        {
            if (num_bins <= 0) {
                throw std::invalid_argument("Histogram requires a positive number of bins.");
            }
        }

        void reset()
        {
            std::fill(counts_.begin(), counts_.end(), 0.0);
            min_ = 0.0;
            max_ = 0.0;
            total_ = 0.0;
        }

        [[nodiscard]] bool valid() const noexcept { return total_ > 0.0; }
        [[nodiscard]] double min() const noexcept { return min_; }
        [[nodiscard]] double max() const noexcept { return max_; }
        [[nodiscard]] std::size_t bins() const noexcept { return counts_.size(); }
        [[nodiscard]] const std::vector<double>& counts() const noexcept { return counts_; }

        [[nodiscard]] double bin_width() const noexcept
        {
            return max_ > min_ ? (max_ - min_) / static_cast<double>(counts_.size()) : 1.0;
        }

        void collect(const torch::Tensor& tensor)
        {
            if (!tensor.defined() || tensor.numel() == 0) {
                return;
            }
            const auto values = tensor.detach().to(torch::kCPU, torch::kDouble).flatten();
            const double batch_min = values.min().item<double>();
            const double batch_max = values.max().item<double>();

            if (!valid()) {
                min_ = batch_min;
                max_ = std::max(batch_max, batch_min + kMinimumRange);
            } else if (batch_min < min_ || batch_max > max_) {
                rebin(std::min(min_, batch_min), std::max(max_, batch_max));
            }

            const auto hist = torch::histc(values, static_cast<std::int64_t>(counts_.size()), min_, max_);
            const auto accessor = hist.accessor<double, 1>();
            for (std::int64_t index = 0; index < accessor.size(0); ++index) {
                counts_[static_cast<std::size_t>(index)] += accessor[index];
            }
            total_ += static_cast<double>(values.numel());
        }

    private:
        void rebin(double new_min, double new_max)
        {
            const double old_width = bin_width();
            const double new_width = (new_max - new_min) / static_cast<double>(counts_.size());
            std::vector<double> rebinned(counts_.size(), 0.0);
            for (std::size_t index = 0; index < counts_.size(); ++index) {
                if (counts_[index] <= 0.0) {
                    continue;
                }
                const double centre = min_ + (static_cast<double>(index) + 0.5) * old_width;
                auto target = static_cast<std::int64_t>((centre - new_min) / new_width);
                target = std::clamp<std::int64_t>(target, 0, static_cast<std::int64_t>(counts_.size()) - 1);
                rebinned[static_cast<std::size_t>(target)] += counts_[index];
            }
            counts_ = std::move(rebinned);
            min_ = new_min;
            max_ = new_max;
        }

        std::vector<double> counts_;
        double min_{0.0};
        double max_{0.0};
        double total_{0.0};
    };

    // Clipping plus rounding noise of the grid (delta, offset) over the
    // histogram; clipped bins are weighted by gamma.
    [[nodiscard]] inline double estimate_noise(const Histogram& histogram, double delta, double offset,
                                               double steps, const SqnrSearchOptions& options)
    {
        if (delta <= 0.0) {
            return std::numeric_limits<double>::max();
        }
        const double width = histogram.bin_width();
        const auto& counts = histogram.counts();
        double noise = 0.0;
        for (std::size_t index = 0; index < counts.size(); ++index) {
            if (counts[index] <= 0.0) {
                continue;
            }
            const double x = histogram.min() + (static_cast<double>(index) + 0.5) * width;
            double q = std::round(x / delta - offset);
            const bool clipped = q < 0.0 || q > steps;
            q = std::clamp(q, 0.0, steps);
            double error = std::pow(std::abs((q + offset) * delta - x), options.p);
            if (clipped) {
                error *= options.gamma;
            }
            noise += error * counts[index];
        }
        return noise;
    }

    // SQNR-optimal grid over candidate deltas (and offsets, when asymmetric).
    [[nodiscard]] inline Encoding search_encoding(const Histogram& histogram, int bitwidth, bool symmetric,
                                                  const SqnrSearchOptions& options = {})
    {
        if (!histogram.valid()) {
            throw std::logic_error("Encoding search requires collected statistics.");
        }
        validate_bitwidth(bitwidth, "Encoding");

        const double steps = num_steps(bitwidth);
        const double min = std::min(histogram.min(), 0.0);
        const double max = std::max({histogram.max(), 0.0, min + kMinimumRange});

        double best_noise = std::numeric_limits<double>::max();
        Encoding best{};

        if (symmetric) {
            const double positive_steps = std::max(std::floor(steps / 2.0), 1.0);
            const double max_delta = std::max(std::abs(min), std::abs(max)) / positive_steps;
            const auto offset = -(std::int64_t{1} << (bitwidth - 1));
            for (int candidate = 1; candidate < options.symmetric_delta_candidates; ++candidate) {
                const double delta = max_delta * candidate / (options.symmetric_delta_candidates - 1);
                const double noise = estimate_noise(histogram, delta, static_cast<double>(offset), steps, options);
                if (noise < best_noise) {
                    best_noise = noise;
                    best = from_delta_offset(delta, offset, bitwidth);
                }
            }
            return best;
        }

        const double max_delta = (max - min) / steps;
        const int num_offsets = static_cast<int>(std::min<double>(steps + 2.0, options.offset_candidates));
        std::vector<double> offsets;
        offsets.reserve(static_cast<std::size_t>(num_offsets));
        const double offset_step = steps / std::max(num_offsets - 2, 1);
        for (int index = 0; index < num_offsets - 1; ++index) {
            offsets.push_back(std::round(-steps + index * offset_step));
        }
        offsets.push_back(std::round(min / max_delta));

        for (int candidate = 1; candidate < options.asymmetric_delta_candidates; ++candidate) {
            const double delta = max_delta * candidate / (options.asymmetric_delta_candidates - 1);
            for (const double offset : offsets) {
                const double test_min = std::max(min, delta * offset);
                const double test_max = std::min(max, test_min + delta * steps);
                const double clamped_delta = std::max((test_max - test_min) / steps, kMinimumRange / steps);
                const double clamped_offset = std::round(test_min / clamped_delta);
                const double noise = estimate_noise(histogram, clamped_delta, clamped_offset, steps, options);
                if (noise < best_noise) {
                    best_noise = noise;
                    best = from_delta_offset(clamped_delta, static_cast<std::int64_t>(clamped_offset), bitwidth);
                }
            }
        }
        return best;
    }
}

#endif // ROUNDWISE_QUANTIZATION_DETAILS_HISTOGRAM_HPP
