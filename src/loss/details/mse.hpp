#ifndef ROUNDWISE_LOSS_MSE_HPP
#define ROUNDWISE_LOSS_MSE_HPP

#include <sstream>
#include <stdexcept>
#include <torch/torch.h>

namespace Roundwise::Loss::Details {

    struct MSEDescriptor {};

    // Mean squared error between two tensors of identical shape.
    inline torch::Tensor compute(const MSEDescriptor&,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        if (prediction.sizes() != target.sizes()) {
            std::ostringstream message;
            message << "MSE shape mismatch: prediction " << prediction.sizes() << " vs. target " << target.sizes() << '.';
            throw std::invalid_argument(message.str());
        }
        return torch::mse_loss(prediction, target, at::Reduction::Mean);
    }

}

#endif // ROUNDWISE_LOSS_MSE_HPP
