#ifndef ROUNDWISE_BLOCK_DETAILS_SEQUENTIAL_HPP
#define ROUNDWISE_BLOCK_DETAILS_SEQUENTIAL_HPP

#include <vector>

#include "../../../layer/layer.hpp"

namespace Roundwise::Block::Details {

    // Layers named "<block>.<position>", executed in order.
    struct SequentialDescriptor {
        std::vector<::Roundwise::Layer::Descriptor> layers{};
    };

}

#endif // ROUNDWISE_BLOCK_DETAILS_SEQUENTIAL_HPP
