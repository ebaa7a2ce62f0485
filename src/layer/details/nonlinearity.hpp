#ifndef ROUNDWISE_LAYER_NONLINEARITY_HPP
#define ROUNDWISE_LAYER_NONLINEARITY_HPP

#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"
#include "../registry.hpp"

namespace Roundwise::Layer::Details {

    // Activation as a layer of its own, so a graph can pair it with the
    // producer of its input.
    class NonlinearityImpl : public torch::nn::Module {
    public:
        explicit NonlinearityImpl(::Roundwise::Activation::Type type) : type_(type) {}

        [[nodiscard]] torch::Tensor forward(torch::Tensor input)
        {
            return ::Roundwise::Activation::Details::apply(type_, std::move(input));
        }

        [[nodiscard]] ::Roundwise::Activation::Type type() const noexcept { return type_; }

    private:
        ::Roundwise::Activation::Type type_;
    };

    TORCH_MODULE(Nonlinearity);

    struct NonlinearityDescriptor {
        ::Roundwise::Activation::Descriptor function{::Roundwise::Activation::ReLU};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const NonlinearityDescriptor& descriptor, const std::string& key)
    {
        auto module = owner.register_module(key, Nonlinearity(descriptor.function.type));

        RegisteredLayer registered_layer{};
        registered_layer.kind = Kind::Nonlinearity;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.bind_module_forward(module.get());
        return registered_layer;
    }
}

#endif //ROUNDWISE_LAYER_NONLINEARITY_HPP
