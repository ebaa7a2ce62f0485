#ifndef ROUNDWISE_ACTIVATION_APPLY_HPP
#define ROUNDWISE_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <utility>

#include "activation.hpp"
#include "details/rectifier.hpp"
#include "details/smooth.hpp"

namespace Roundwise::Activation::Details {
    inline torch::Tensor apply(::Roundwise::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Roundwise::Activation::Type::ReLU:
                return ReLU{}(std::move(input));
            case ::Roundwise::Activation::Type::ReLU6:
                return ReLU6{}(std::move(input));
            case ::Roundwise::Activation::Type::LeakyReLU:
                return LeakyReLU{}(std::move(input));
            case ::Roundwise::Activation::Type::Sigmoid:
                return Sigmoid{}(std::move(input));
            case ::Roundwise::Activation::Type::Tanh:
                return Tanh{}(std::move(input));
            case ::Roundwise::Activation::Type::GeLU:
                return GeLU{}(std::move(input));
            case ::Roundwise::Activation::Type::SiLU:
                return SiLU{}(std::move(input));
            case ::Roundwise::Activation::Type::Identity:
            default:
                return input;
        }
    }
}
#endif // ROUNDWISE_ACTIVATION_APPLY_HPP
