#ifndef ROUNDWISE_ADAROUND_DETAILS_TENSOR_QUANTIZER_HPP
#define ROUNDWISE_ADAROUND_DETAILS_TENSOR_QUANTIZER_HPP

#include <stdexcept>
#include <utility>

#include <torch/torch.h>

#include "../../quantization/quantization.hpp"

namespace Roundwise::Adaround::Details {
    /*
     * Learned rounding on top of a fixed weight grid.
     *
     * Each weight element carries a logit alpha. The rectified sigmoid
     *   h(alpha) = clamp(sigmoid(alpha) * (zeta - gamma) + gamma, 0, 1)
     * decides how far above floor(w / delta) the element lands:
     *   soft: q = clamp(floor(w / delta) + h(alpha) - offset, 0, 2^b - 1)
     *   hard: h(alpha) replaced by [alpha >= 0]
     * and w' = (q + offset) * delta.
     *
     * Ties go up: an element exactly halfway between two grid points starts
     * at alpha == 0 and rounds to the upper one. The static grid uses
     * torch::round (half to even), so the nearest-rounding reference here is
     * `nearest_quantize_dequantize`, not the static grid.
     *
     * "Up or Down? Adaptive Rounding for Post-Training Quantization" https://arxiv.org/abs/2004.10568
     */
    class AdaroundTensorQuantizer final : public ::Roundwise::Quantization::TensorQuantizer {
    public:
        static constexpr double kZeta = 1.1;
        static constexpr double kGamma = -0.1;

        // Takes over settings and encoding of the quantizer being replaced.
        explicit AdaroundTensorQuantizer(const ::Roundwise::Quantization::TensorQuantizer& source)
            : TensorQuantizer(source.settings())
        {
            if (!source.encoding().has_value()) {
                throw std::logic_error("Adaround requires a weight quantizer with a computed encoding.");
            }
            encoding_ = source.encoding();
        }

        // alpha = -log((zeta - gamma) / (r - gamma) - 1), r the fractional part
        // of w / delta, so that h(alpha) == r and the soft reconstruction
        // starts at the float weight.
        void initialize(const torch::Tensor& weight)
        {
            const auto& encoding = require_encoding();
            torch::NoGradGuard no_grad{};
            const auto scaled = weight.detach() / encoding.delta;
            const auto rest = (scaled - torch::floor(scaled)).to(torch::kDouble);
            auto alpha = -torch::log((kZeta - kGamma) / (rest - kGamma) - 1.0);
            alpha = torch::where(rest == 0.5, torch::zeros_like(alpha), alpha);
            alpha_ = alpha.to(weight.scalar_type()).clone().set_requires_grad(true);
        }

        [[nodiscard]] bool initialized() const noexcept { return alpha_.defined(); }

        [[nodiscard]] torch::Tensor& alpha()
        {
            require_alpha();
            return alpha_;
        }

        [[nodiscard]] torch::Tensor h() const
        {
            require_alpha();
            return torch::clamp(torch::sigmoid(alpha_) * (kZeta - kGamma) + kGamma, 0.0, 1.0);
        }

        [[nodiscard]] torch::Tensor soft_quantize_dequantize(const torch::Tensor& weight) const
        {
            return reconstruct(weight, h());
        }

        [[nodiscard]] torch::Tensor hard_quantize_dequantize(const torch::Tensor& weight) const
        {
            require_alpha();
            return reconstruct(weight, (alpha_.detach() >= 0).to(weight.scalar_type()));
        }

        // Round to nearest on this quantizer's grid, ties up.
        [[nodiscard]] torch::Tensor nearest_quantize_dequantize(const torch::Tensor& weight) const
        {
            const auto& encoding = require_encoding();
            const auto scaled = weight.detach() / encoding.delta;
            return reconstruct(weight, (scaled - torch::floor(scaled) >= 0.5).to(weight.scalar_type()));
        }

        torch::Tensor quantize_dequantize(const torch::Tensor& weight) override
        {
            if (!settings_.enabled) {
                return weight;
            }
            return soft_ ? soft_quantize_dequantize(weight) : hard_quantize_dequantize(weight);
        }

        [[nodiscard]] bool is_soft() const noexcept { return soft_; }
        [[nodiscard]] bool frozen() const noexcept { return frozen_; }

        // Final switch to hard rounding; alpha stops receiving gradients.
        void freeze()
        {
            if (frozen_) {
                throw std::logic_error("Adaround quantizer is already frozen.");
            }
            require_alpha();
            alpha_ = alpha_.detach();
            soft_ = false;
            frozen_ = true;
        }

    private:
        void require_alpha() const
        {
            if (!alpha_.defined()) {
                throw std::logic_error("Adaround quantizer used before initialize().");
            }
        }

        [[nodiscard]] torch::Tensor reconstruct(const torch::Tensor& weight, const torch::Tensor& rounding) const
        {
            const auto& encoding = require_encoding();
            const auto offset = static_cast<double>(encoding.offset);
            const auto base = torch::floor(weight.detach() / encoding.delta);
            const auto grid = torch::clamp(base + rounding - offset, 0.0,
                                           ::Roundwise::Quantization::Details::num_steps(encoding.bitwidth));
            return (grid + offset) * encoding.delta;
        }

        torch::Tensor alpha_{};
        bool soft_{true};
        bool frozen_{false};
    };
}

#endif // ROUNDWISE_ADAROUND_DETAILS_TENSOR_QUANTIZER_HPP
