#ifndef ROUNDWISE_LAYER_FC_HPP
#define ROUNDWISE_LAYER_FC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/nn/module.h>
#include <torch/nn/options/linear.h>
#include "../../activation/activation.hpp"
#include "../registry.hpp"


namespace Roundwise::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        bool bias{true};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Roundwise::Activation::Descriptor activation{::Roundwise::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FCDescriptor& descriptor, const std::string& key)
    {
        if (descriptor.options.in_features <= 0 || descriptor.options.out_features <= 0) {
            throw std::invalid_argument("Fully connected layers require positive in/out features.");
        }

        auto options = torch::nn::LinearOptions(descriptor.options.in_features, descriptor.options.out_features)
                            .bias(descriptor.options.bias);
        auto module = owner.register_module(key, torch::nn::Linear(options));

        RegisteredLayer registered_layer{};
        registered_layer.kind = Kind::Linear;
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.bind_module_forward(module.get());
        registered_layer.functional_forward = [](const torch::Tensor& input, const torch::Tensor& weight, const torch::Tensor& bias) {
            return torch::nn::functional::linear(input, weight, bias);
        };
        return registered_layer;
    }
}

#endif //ROUNDWISE_LAYER_FC_HPP
