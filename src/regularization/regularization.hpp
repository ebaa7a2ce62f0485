#ifndef ROUNDWISE_REGULARIZATION_HPP
#define ROUNDWISE_REGULARIZATION_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/rounding.hpp"

namespace Roundwise::Regularization {

    using RoundingOptions = Details::RoundingOptions;
    using RoundingDescriptor = Details::RoundingDescriptor;

    [[nodiscard]] inline auto Rounding(const RoundingOptions& options = {}) -> RoundingDescriptor {
        return {options};
    }

}

#endif //ROUNDWISE_REGULARIZATION_HPP
