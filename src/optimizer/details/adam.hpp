#ifndef ROUNDWISE_ADAM_HPP
#define ROUNDWISE_ADAM_HPP

#include <memory>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Roundwise::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    inline void validate(const AdamDescriptor& descriptor) {
        const auto& options = descriptor.options;
        if (!(options.learning_rate > 0.0)) {
            throw std::invalid_argument("Adam learning rate must be positive.");
        }
        if (options.beta1 < 0.0 || options.beta1 >= 1.0 || options.beta2 < 0.0 || options.beta2 >= 1.0) {
            throw std::invalid_argument("Adam betas must lie in [0, 1).");
        }
        if (options.eps < 0.0 || options.weight_decay < 0.0) {
            throw std::invalid_argument("Adam eps and weight decay must be non-negative.");
        }
    }

    [[nodiscard]] inline std::unique_ptr<torch::optim::Optimizer>
    build_optimizer(const AdamDescriptor& descriptor, std::vector<torch::Tensor> parameters) {
        validate(descriptor);
        return std::make_unique<torch::optim::Adam>(std::move(parameters), to_torch_options(descriptor.options));
    }

}

#endif // ROUNDWISE_ADAM_HPP
