#ifndef ROUNDWISE_REGULARIZATION_ROUNDING_HPP
#define ROUNDWISE_REGULARIZATION_ROUNDING_HPP

#include <stdexcept>

#include <torch/torch.h>

#include "common.hpp"

namespace Roundwise::Regularization::Details {

    struct RoundingOptions {
        double coefficient{0.01};
    };

    struct RoundingDescriptor {
        RoundingOptions options{};
    };

    // coefficient * sum(1 - |2h - 1|^beta) over the relaxed rounding values h
    // in [0, 1]. Zero for h in {0, 1}, maximal for h = 0.5; a large beta
    // flattens the penalty everywhere except near the two ends.
    [[nodiscard]] inline torch::Tensor penalty(const RoundingDescriptor& descriptor, const torch::Tensor& h, double beta) {
        const auto& options = descriptor.options;
        if (options.coefficient == 0.0) {
            return detail::zeros_like_optional(h);
        }
        if (!(beta > 0.0)) {
            throw std::invalid_argument("Rounding regularization requires a positive beta.");
        }

        auto penalty = (1.0 - (h * 2.0 - 1.0).abs().pow(beta)).sum();
        return penalty.mul(options.coefficient);
    }

}

#endif // ROUNDWISE_REGULARIZATION_ROUNDING_HPP
