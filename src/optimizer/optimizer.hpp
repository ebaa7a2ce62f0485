#ifndef ROUNDWISE_OPTIMIZER_HPP
#define ROUNDWISE_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/adam.hpp"

namespace Roundwise::Optimizer {
    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    [[nodiscard]] inline auto Adam(const AdamOptions& options = {}) -> AdamDescriptor {
        return {options};
    }
}

#endif //ROUNDWISE_OPTIMIZER_HPP
