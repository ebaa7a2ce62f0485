#ifndef ROUNDWISE_BLOCK_DETAILS_RESIDUAL_HPP
#define ROUNDWISE_BLOCK_DETAILS_RESIDUAL_HPP

#include <optional>
#include <vector>

#include "../../../activation/activation.hpp"
#include "../../../layer/layer.hpp"

namespace Roundwise::Block::Details {
    struct ResidualSkipOptions {
        std::optional<::Roundwise::Layer::Descriptor> projection{};
    };

    struct ResidualOutputOptions {
        ::Roundwise::Activation::Descriptor final_activation{::Roundwise::Activation::Identity};
    };

    // output = final_activation(branch(x) + projection(x)), the projection
    // defaulting to identity. Branch layers are named "<block>.<position>",
    // the projection "<block>.projection".
    struct ResidualDescriptor {
        std::vector<::Roundwise::Layer::Descriptor> layers{};
        ResidualSkipOptions skip{};
        ResidualOutputOptions output{};
    };

}

#endif // ROUNDWISE_BLOCK_DETAILS_RESIDUAL_HPP
