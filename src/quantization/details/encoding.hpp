#ifndef ROUNDWISE_QUANTIZATION_DETAILS_ENCODING_HPP
#define ROUNDWISE_QUANTIZATION_DETAILS_ENCODING_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <torch/torch.h>

namespace Roundwise::Quantization::Details {
    enum class QuantScheme {
        PostTrainingTF,
        PostTrainingTFEnhanced,
    };

    enum class DataType {
        Int,
        Float,
    };

    [[nodiscard]] constexpr std::string_view scheme_name(QuantScheme scheme) noexcept {
        switch (scheme) {
            case QuantScheme::PostTrainingTF:         return "post_training_tf";
            case QuantScheme::PostTrainingTFEnhanced: return "post_training_tf_enhanced";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr std::string_view dtype_name(DataType type) noexcept {
        return type == DataType::Int ? "int" : "float";
    }

    // Grid: x' = (q + offset) * delta, q in [0, 2^bitwidth - 1].
    struct Encoding {
        double min{0.0};
        double max{0.0};
        double delta{0.0};
        std::int64_t offset{0};
        int bitwidth{8};
    };

    inline constexpr int kMinBitwidth = 1;
    inline constexpr int kMaxBitwidth = 31;
    inline constexpr double kMinimumRange = 1e-5;

    inline void validate_bitwidth(int bitwidth, std::string_view context)
    {
        if (bitwidth < kMinBitwidth || bitwidth > kMaxBitwidth) {
            std::ostringstream message;
            message << context << " bitwidth must lie in [" << kMinBitwidth << ", " << kMaxBitwidth
                    << "], got " << bitwidth << '.';
            throw std::invalid_argument(message.str());
        }
    }

    [[nodiscard]] inline double num_steps(int bitwidth)
    {
        return static_cast<double>((std::int64_t{1} << bitwidth) - 1);
    }

    [[nodiscard]] inline Encoding from_delta_offset(double delta, std::int64_t offset, int bitwidth)
    {
        Encoding encoding{};
        encoding.bitwidth = bitwidth;
        encoding.delta = delta;
        encoding.offset = offset;
        encoding.min = static_cast<double>(offset) * delta;
        encoding.max = encoding.min + delta * num_steps(bitwidth);
        return encoding;
    }

    // Symmetric grids are centred on zero with offset -2^(b-1); asymmetric
    // grids always contain zero exactly.
    [[nodiscard]] inline Encoding from_range(double min, double max, int bitwidth, bool symmetric)
    {
        validate_bitwidth(bitwidth, "Encoding");
        if (!std::isfinite(min) || !std::isfinite(max) || min > max) {
            std::ostringstream message;
            message << "Invalid statistics range [" << min << ", " << max << "].";
            throw std::invalid_argument(message.str());
        }

        const double steps = num_steps(bitwidth);
        if (symmetric) {
            const double positive_steps = std::max(std::floor(steps / 2.0), 1.0);
            const double absmax = std::max({std::abs(min), std::abs(max), kMinimumRange});
            const double delta = absmax / positive_steps;
            return from_delta_offset(delta, -(std::int64_t{1} << (bitwidth - 1)), bitwidth);
        }

        min = std::min(min, 0.0);
        max = std::max(max, 0.0);
        max = std::max(max, min + kMinimumRange);
        const double delta = (max - min) / steps;
        const auto offset = static_cast<std::int64_t>(std::round(min / delta));
        return from_delta_offset(delta, offset, bitwidth);
    }

    // Integer grid index, clamp(round(x/delta) - offset, 0, 2^b - 1).
    [[nodiscard]] inline torch::Tensor quantize(const torch::Tensor& tensor, const Encoding& encoding)
    {
        return torch::clamp(torch::round(tensor / encoding.delta) - static_cast<double>(encoding.offset),
                            0.0, num_steps(encoding.bitwidth));
    }

    [[nodiscard]] inline torch::Tensor dequantize(const torch::Tensor& grid, const Encoding& encoding)
    {
        return (grid + static_cast<double>(encoding.offset)) * encoding.delta;
    }

    // Round-to-nearest fake quantization. The forward value is quantized, the
    // gradient passes straight through.
    [[nodiscard]] inline torch::Tensor quantize_dequantize(const torch::Tensor& tensor, const Encoding& encoding)
    {
        const auto fake = dequantize(quantize(tensor.detach(), encoding), encoding);
        if (!tensor.requires_grad()) {
            return fake;
        }
        return tensor + (fake - tensor).detach();
    }
}

#endif // ROUNDWISE_QUANTIZATION_DETAILS_ENCODING_HPP
