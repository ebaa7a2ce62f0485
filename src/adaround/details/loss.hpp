#ifndef ROUNDWISE_ADAROUND_DETAILS_LOSS_HPP
#define ROUNDWISE_ADAROUND_DETAILS_LOSS_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>

#include <torch/torch.h>

#include "../../loss/loss.hpp"
#include "../../regularization/regularization.hpp"
#include "parameters.hpp"
#include "tensor_quantizer.hpp"

namespace Roundwise::Adaround::Details {
    struct LossTerms {
        torch::Tensor reconstruction{};
        torch::Tensor rounding{};
        torch::Tensor total{};
    };

    [[nodiscard]] inline double warm_start_iterations(const AdaroundParameters& params)
    {
        return params.warm_start * static_cast<double>(params.num_iterations);
    }

    [[nodiscard]] inline bool in_warm_start(const AdaroundParameters& params, std::int64_t iteration)
    {
        return static_cast<double>(iteration) < warm_start_iterations(params);
    }

    [[nodiscard]] inline Phase phase_at(const AdaroundParameters& params, std::int64_t iteration)
    {
        return in_warm_start(params, iteration) ? Phase::WarmStart : Phase::Annealing;
    }

    // Decays from beta_range.first at the end of the warm start towards
    // beta_range.second at the last iteration.
    [[nodiscard]] inline double compute_beta(const AdaroundParameters& params, std::int64_t iteration)
    {
        const auto [start, end] = params.beta_range;
        const double warm = warm_start_iterations(params);
        const double span = std::max(static_cast<double>(params.num_iterations) - warm, 1.0);
        const double relative = std::clamp((static_cast<double>(iteration) - warm) / span, 0.0, 1.0);

        if (params.beta_schedule == BetaSchedule::Linear) {
            return start + (end - start) * relative;
        }
        constexpr double kPi = 3.14159265358979323846;
        return end + 0.5 * (start - end) * (1.0 + std::cos(kPi * relative));
    }

    [[nodiscard]] inline torch::Tensor compute_recon_loss(const torch::Tensor& quantized_output, const torch::Tensor& float_output)
    {
        return ::Roundwise::Loss::Details::compute(::Roundwise::Loss::MSE(), quantized_output, float_output);
    }

    // Exactly zero during the warm start, whatever reg_param is.
    [[nodiscard]] inline torch::Tensor compute_round_loss(const AdaroundTensorQuantizer& quantizer,
                                                          const AdaroundParameters& params,
                                                          std::int64_t iteration)
    {
        const auto h = quantizer.h();
        if (in_warm_start(params, iteration)) {
            return torch::zeros({}, h.options());
        }
        const auto descriptor = ::Roundwise::Regularization::Rounding({params.reg_param});
        return ::Roundwise::Regularization::Details::penalty(descriptor, h, compute_beta(params, iteration));
    }

    [[nodiscard]] inline LossTerms compute_total_loss(const torch::Tensor& quantized_output,
                                                      const torch::Tensor& float_output,
                                                      const AdaroundTensorQuantizer& quantizer,
                                                      const AdaroundParameters& params,
                                                      std::int64_t iteration)
    {
        LossTerms terms{};
        terms.reconstruction = compute_recon_loss(quantized_output, float_output);
        terms.rounding = compute_round_loss(quantizer, params, iteration).to(terms.reconstruction.scalar_type());
        terms.total = terms.reconstruction + terms.rounding;
        return terms;
    }
}

#endif // ROUNDWISE_ADAROUND_DETAILS_LOSS_HPP
