#ifndef ROUNDWISE_REGULARIZATION_DETAILS_COMMON_HPP
#define ROUNDWISE_REGULARIZATION_DETAILS_COMMON_HPP

#include <torch/torch.h>

namespace Roundwise::Regularization::Details::detail {

    [[nodiscard]] inline torch::Tensor zeros_like_optional(const torch::Tensor& reference)
    {
        if (reference.defined()) {
            return torch::zeros({}, reference.options());
        }
        return torch::zeros({}, torch::TensorOptions().dtype(torch::kFloat32));
    }

}

#endif // ROUNDWISE_REGULARIZATION_DETAILS_COMMON_HPP
