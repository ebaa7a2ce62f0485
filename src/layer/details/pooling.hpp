#ifndef ROUNDWISE_LAYER_POOLING_HPP
#define ROUNDWISE_LAYER_POOLING_HPP
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Roundwise::Layer::Details {

    struct MaxPool2dOptions {
        std::vector<std::int64_t> kernel_size{2, 2};
        std::vector<std::int64_t> stride{};
        std::vector<std::int64_t> padding{0, 0};
        std::vector<std::int64_t> dilation{1, 1};
        bool ceil_mode{false};
    };

    struct AvgPool2dOptions {
        std::vector<std::int64_t> kernel_size{2, 2};
        std::vector<std::int64_t> stride{};
        std::vector<std::int64_t> padding{0, 0};
        bool ceil_mode{false};
        bool count_include_pad{false};
    };

    struct PoolingDescriptor {
        std::variant<MaxPool2dOptions, AvgPool2dOptions> options{MaxPool2dOptions{}};
        ::Roundwise::Activation::Descriptor activation{::Roundwise::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const PoolingDescriptor& descriptor, const std::string& key)
    {
        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;

        std::visit(
            [&](const auto& options) {
                using OptionsT = std::decay_t<decltype(options)>;
                // An empty stride means "same as the kernel", as in torch.
                const auto stride = options.stride.empty() ? options.kernel_size : options.stride;
                if constexpr (std::is_same_v<OptionsT, MaxPool2dOptions>) {
                    auto torch_options = torch::nn::MaxPool2dOptions(options.kernel_size)
                                             .stride(stride)
                                             .padding(options.padding)
                                             .dilation(options.dilation)
                                             .ceil_mode(options.ceil_mode);
                    auto module = owner.register_module(key, torch::nn::MaxPool2d(torch_options));
                    registered_layer.kind = Kind::MaxPool2d;
                    registered_layer.module = to_shared_module_ptr(module);
                    registered_layer.bind_module_forward(module.get());
                } else {
                    auto torch_options = torch::nn::AvgPool2dOptions(options.kernel_size)
                                             .stride(stride)
                                             .padding(options.padding)
                                             .ceil_mode(options.ceil_mode)
                                             .count_include_pad(options.count_include_pad);
                    auto module = owner.register_module(key, torch::nn::AvgPool2d(torch_options));
                    registered_layer.kind = Kind::AvgPool2d;
                    registered_layer.module = to_shared_module_ptr(module);
                    registered_layer.bind_module_forward(module.get());
                }
            },
            descriptor.options);

        return registered_layer;
    }
}

#endif //ROUNDWISE_LAYER_POOLING_HPP
