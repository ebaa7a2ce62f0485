#ifndef ROUNDWISE_BLOCK_HPP
#define ROUNDWISE_BLOCK_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <initializer_list>
#include <utility>
#include <variant>
#include <vector>

#include "details/blocks/residual.hpp"
#include "details/blocks/sequential.hpp"

namespace Roundwise::Block {
    using SequentialDescriptor = Details::SequentialDescriptor;
    using ResidualDescriptor = Details::ResidualDescriptor;
    using ResidualSkipOptions = Details::ResidualSkipOptions;
    using ResidualOutputOptions = Details::ResidualOutputOptions;

    using Descriptor = std::variant<SequentialDescriptor, ResidualDescriptor>;

    [[nodiscard]] inline auto Sequential(std::initializer_list<::Roundwise::Layer::Descriptor> layers) -> SequentialDescriptor {
        SequentialDescriptor descriptor{};
        descriptor.layers.assign(layers.begin(), layers.end());
        return descriptor;
    }

    [[nodiscard]] inline auto Sequential(std::vector<::Roundwise::Layer::Descriptor> layers) -> SequentialDescriptor {
        SequentialDescriptor descriptor{};
        descriptor.layers = std::move(layers);
        return descriptor;
    }

    [[nodiscard]] inline auto Residual(std::initializer_list<::Roundwise::Layer::Descriptor> layers,
            ResidualSkipOptions skip = {}, ResidualOutputOptions output = {}) -> ResidualDescriptor {
        ResidualDescriptor descriptor{};
        descriptor.layers.assign(layers.begin(), layers.end());
        descriptor.skip = std::move(skip);
        descriptor.output = output;
        return descriptor;
    }

    [[nodiscard]] inline auto Residual(std::vector<::Roundwise::Layer::Descriptor> layers,
            ResidualSkipOptions skip = {}, ResidualOutputOptions output = {}) -> ResidualDescriptor {
        ResidualDescriptor descriptor{};
        descriptor.layers = std::move(layers);
        descriptor.skip = std::move(skip);
        descriptor.output = output;
        return descriptor;
    }
}

#endif //ROUNDWISE_BLOCK_HPP
