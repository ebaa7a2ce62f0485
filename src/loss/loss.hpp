#ifndef ROUNDWISE_LOSS_HPP
#define ROUNDWISE_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/mse.hpp"

namespace Roundwise::Loss {
    using MSEDescriptor = Details::MSEDescriptor;

    [[nodiscard]] constexpr auto MSE() noexcept -> Details::MSEDescriptor {
        return {};
    }
}

#endif //ROUNDWISE_LOSS_HPP
