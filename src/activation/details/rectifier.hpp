#ifndef ROUNDWISE_ACTIVATION_RECTIFIER_HPP
#define ROUNDWISE_ACTIVATION_RECTIFIER_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Roundwise::Activation::Details {
    struct ReLU {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::relu(std::move(input));
        }
    };

    // Clipped at 6, the usual pairing of depthwise/mobile convolutions.
    struct ReLU6 {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::clamp(std::move(input), 0.0, 6.0);
        }
    };

    struct LeakyReLU {
        double negative_slope{0.01};

        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::leaky_relu(std::move(input), negative_slope);
        }
    };
}

#endif //ROUNDWISE_ACTIVATION_RECTIFIER_HPP
