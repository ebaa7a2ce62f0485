#ifndef ROUNDWISE_LAYER_FLATTEN_HPP
#define ROUNDWISE_LAYER_FLATTEN_HPP
#include <cstdint>
#include <string>
#include <utility>

#include <torch/torch.h>
#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Roundwise::Layer::Details {

    struct FlattenOptions {
        std::int64_t start_dim{1};
        std::int64_t end_dim{-1};
    };

    struct FlattenDescriptor {
        FlattenOptions options{};
        ::Roundwise::Activation::Descriptor activation{::Roundwise::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FlattenDescriptor& descriptor, const std::string& key)
    {
        const auto torch_options = torch::nn::FlattenOptions()
                                      .start_dim(descriptor.options.start_dim)
                                      .end_dim(descriptor.options.end_dim);
        auto module = owner.register_module(key, torch::nn::Flatten(torch_options));

        RegisteredLayer registered_layer{};
        registered_layer.kind = Kind::Flatten;
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.bind_module_forward(module.get());
        return registered_layer;
    }

}

#endif //ROUNDWISE_LAYER_FLATTEN_HPP
