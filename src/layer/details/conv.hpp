#ifndef ROUNDWISE_LAYER_CONV_HPP
#define ROUNDWISE_LAYER_CONV_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Roundwise::Layer::Details {

    struct Conv2dOptions {
        std::int64_t in_channels{};
        std::int64_t out_channels{};
        std::vector<std::int64_t> kernel_size{3, 3};
        std::vector<std::int64_t> stride{1, 1};
        std::vector<std::int64_t> padding{0, 0};
        std::vector<std::int64_t> dilation{1, 1};
        std::int64_t groups{1};
        bool bias{true};
    };

    struct Conv2dDescriptor {
        Conv2dOptions options{};
        ::Roundwise::Activation::Descriptor activation{::Roundwise::Activation::Identity};
    };

    struct ConvTranspose2dOptions {
        std::int64_t in_channels{};
        std::int64_t out_channels{};
        std::vector<std::int64_t> kernel_size{3, 3};
        std::vector<std::int64_t> stride{1, 1};
        std::vector<std::int64_t> padding{0, 0};
        std::vector<std::int64_t> output_padding{0, 0};
        std::vector<std::int64_t> dilation{1, 1};
        std::int64_t groups{1};
        bool bias{true};
    };

    struct ConvTranspose2dDescriptor {
        ConvTranspose2dOptions options{};
        ::Roundwise::Activation::Descriptor activation{::Roundwise::Activation::Identity};
    };

    // torch expands a single value to both spatial dimensions; keep the same
    // convention so the functional path matches the module path.
    [[nodiscard]] inline std::vector<std::int64_t> expand_pair(const std::vector<std::int64_t>& values,
                                                               std::int64_t fallback)
    {
        if (values.empty()) {
            return {fallback, fallback};
        }
        if (values.size() == 1) {
            return {values.front(), values.front()};
        }
        if (values.size() != 2) {
            throw std::invalid_argument("2d layer options expect one or two values per spatial argument.");
        }
        return values;
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const Conv2dDescriptor& descriptor, const std::string& key)
    {
        const auto& opts = descriptor.options;
        if (opts.in_channels <= 0 || opts.out_channels <= 0) {
            throw std::invalid_argument("Conv2d layers require positive channel counts.");
        }
        if (opts.groups <= 0 || opts.in_channels % opts.groups != 0 || opts.out_channels % opts.groups != 0) {
            throw std::invalid_argument("Conv2d channel counts must be divisible by groups.");
        }

        const auto kernel = expand_pair(opts.kernel_size, 3);
        const auto stride = expand_pair(opts.stride, 1);
        const auto padding = expand_pair(opts.padding, 0);
        const auto dilation = expand_pair(opts.dilation, 1);

        auto options = torch::nn::Conv2dOptions(opts.in_channels, opts.out_channels, kernel)
                           .stride(stride)
                           .padding(padding)
                           .dilation(dilation)
                           .groups(opts.groups)
                           .bias(opts.bias);
        auto module = owner.register_module(key, torch::nn::Conv2d(options));

        RegisteredLayer registered_layer{};
        registered_layer.kind = Kind::Conv2d;
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.bind_module_forward(module.get());
        registered_layer.functional_forward =
            [stride, padding, dilation, groups = opts.groups](const torch::Tensor& input,
                                                              const torch::Tensor& weight,
                                                              const torch::Tensor& bias) {
                return torch::conv2d(input, weight, bias, stride, padding, dilation, groups);
            };
        return registered_layer;
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const ConvTranspose2dDescriptor& descriptor, const std::string& key)
    {
        const auto& opts = descriptor.options;
        if (opts.in_channels <= 0 || opts.out_channels <= 0) {
            throw std::invalid_argument("ConvTranspose2d layers require positive channel counts.");
        }
        if (opts.groups <= 0 || opts.in_channels % opts.groups != 0 || opts.out_channels % opts.groups != 0) {
            throw std::invalid_argument("ConvTranspose2d channel counts must be divisible by groups.");
        }

        const auto kernel = expand_pair(opts.kernel_size, 3);
        const auto stride = expand_pair(opts.stride, 1);
        const auto padding = expand_pair(opts.padding, 0);
        const auto output_padding = expand_pair(opts.output_padding, 0);
        const auto dilation = expand_pair(opts.dilation, 1);

        auto options = torch::nn::ConvTranspose2dOptions(opts.in_channels, opts.out_channels, kernel)
                           .stride(stride)
                           .padding(padding)
                           .output_padding(output_padding)
                           .dilation(dilation)
                           .groups(opts.groups)
                           .bias(opts.bias);
        auto module = owner.register_module(key, torch::nn::ConvTranspose2d(options));

        RegisteredLayer registered_layer{};
        registered_layer.kind = Kind::ConvTranspose2d;
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.functional_forward =
            [stride, padding, output_padding, dilation, groups = opts.groups](const torch::Tensor& input,
                                                                              const torch::Tensor& weight,
                                                                              const torch::Tensor& bias) {
                return torch::conv_transpose2d(input, weight, bias, stride, padding, output_padding, groups, dilation);
            };
        registered_layer.bind_module_forward(module.get());
        return registered_layer;
    }
}

#endif //ROUNDWISE_LAYER_CONV_HPP
