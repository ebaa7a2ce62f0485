#ifndef ROUNDWISE_ACTIVATION_SMOOTH_HPP
#define ROUNDWISE_ACTIVATION_SMOOTH_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Roundwise::Activation::Details {
    struct Sigmoid {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::sigmoid(std::move(input));
        }
    };

    struct Tanh {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::tanh(std::move(input));
        }
    };

    // "Gaussian Error Linear Units (GELUs)" https://arxiv.org/pdf/1606.08415
    struct GeLU {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::gelu(std::move(input));
        }
    };

    // "Searching for Activation Functions" https://arxiv.org/pdf/1710.05941
    struct SiLU {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::silu(std::move(input));
        }
    };
}

#endif //ROUNDWISE_ACTIVATION_SMOOTH_HPP
