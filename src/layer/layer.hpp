#ifndef ROUNDWISE_LAYER_HPP
#define ROUNDWISE_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>
#include <utility>

#include "details/conv.hpp"
#include "details/fc.hpp"
#include "details/flatten.hpp"
#include "details/nonlinearity.hpp"
#include "details/pooling.hpp"

#include "registry.hpp"

namespace Roundwise::Layer {
    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using Conv2dOptions = Details::Conv2dOptions;
    using Conv2dDescriptor = Details::Conv2dDescriptor;

    using ConvTranspose2dOptions = Details::ConvTranspose2dOptions;
    using ConvTranspose2dDescriptor = Details::ConvTranspose2dDescriptor;

    using MaxPool2dOptions = Details::MaxPool2dOptions;
    using AvgPool2dOptions = Details::AvgPool2dOptions;
    using PoolingDescriptor = Details::PoolingDescriptor;

    using FlattenOptions = Details::FlattenOptions;
    using FlattenDescriptor = Details::FlattenDescriptor;

    using NonlinearityDescriptor = Details::NonlinearityDescriptor;

    using RegisteredLayer = Details::RegisteredLayer;
    using LayerWrapper = Details::LayerWrapper;

    using Descriptor = std::variant<FCDescriptor,
                                    Conv2dDescriptor,
                                    ConvTranspose2dDescriptor,
                                    PoolingDescriptor,
                                    FlattenDescriptor,
                                    NonlinearityDescriptor>;

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Roundwise::Activation::Descriptor activation = ::Roundwise::Activation::Identity) -> FCDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto Conv2d(const Conv2dOptions& options,
                                     ::Roundwise::Activation::Descriptor activation = ::Roundwise::Activation::Identity) -> Conv2dDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto ConvTranspose2d(const ConvTranspose2dOptions& options,
                                              ::Roundwise::Activation::Descriptor activation = ::Roundwise::Activation::Identity) -> ConvTranspose2dDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto MaxPool2d(const MaxPool2dOptions& options,
                                        ::Roundwise::Activation::Descriptor activation = ::Roundwise::Activation::Identity) -> PoolingDescriptor {
        PoolingDescriptor descriptor{};
        descriptor.options = options;
        descriptor.activation = activation;
        return descriptor;
    }

    [[nodiscard]] inline auto AvgPool2d(const AvgPool2dOptions& options,
                                        ::Roundwise::Activation::Descriptor activation = ::Roundwise::Activation::Identity) -> PoolingDescriptor {
        PoolingDescriptor descriptor{};
        descriptor.options = options;
        descriptor.activation = activation;
        return descriptor;
    }

    [[nodiscard]] inline auto Flatten(const FlattenOptions& options = {}) -> FlattenDescriptor {
        return {options, ::Roundwise::Activation::Identity};
    }

    [[nodiscard]] inline auto Nonlinearity(::Roundwise::Activation::Descriptor function) -> NonlinearityDescriptor {
        return {function};
    }
}

#endif //ROUNDWISE_LAYER_HPP
