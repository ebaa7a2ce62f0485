#ifndef ROUNDWISE_LAYER_REGISTRY_HPP
#define ROUNDWISE_LAYER_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "../activation/activation.hpp"

namespace Roundwise::Layer {
    enum class Kind {
        Linear,
        Conv2d,
        ConvTranspose2d,
        Flatten,
        MaxPool2d,
        AvgPool2d,
        Nonlinearity,
    };

    [[nodiscard]] constexpr std::string_view kind_name(Kind kind) noexcept {
        switch (kind) {
            case Kind::Linear:          return "Linear";
            case Kind::Conv2d:          return "Conv2d";
            case Kind::ConvTranspose2d: return "ConvTranspose2d";
            case Kind::Flatten:         return "Flatten";
            case Kind::MaxPool2d:       return "MaxPool2d";
            case Kind::AvgPool2d:       return "AvgPool2d";
            case Kind::Nonlinearity:    return "Nonlinearity";
        }
        return "Unknown";
    }

    // Layers whose weight rounding can be optimized.
    [[nodiscard]] constexpr bool is_weighted(Kind kind) noexcept {
        return kind == Kind::Linear || kind == Kind::Conv2d || kind == Kind::ConvTranspose2d;
    }
}

namespace Roundwise::Layer::Details {
    template <class Impl>
    [[nodiscard]] inline std::shared_ptr<torch::nn::Module>
    to_shared_module_ptr(const torch::nn::ModuleHolder<Impl>& holder)
    {
        static_assert(std::is_base_of_v<torch::nn::Module, Impl>, "ModuleHolder implementation must derive from torch::nn::Module.");
        return std::static_pointer_cast<torch::nn::Module>(holder.ptr());
    }

    struct RegisteredLayer;

    // Simulation hook installed on a layer. When present, the layer forward is
    // routed through it instead of the wrapped module.
    class LayerWrapper {
    public:
        virtual ~LayerWrapper() = default;
        virtual torch::Tensor forward(const RegisteredLayer& layer, const torch::Tensor& input) = 0;
    };

    struct RegisteredLayer {
        struct ForwardBinding {
            using Invoker = torch::Tensor (*)(void*, torch::Tensor);

            Invoker invoke{nullptr};
            void* context{nullptr};

            [[nodiscard]] explicit operator bool() const noexcept { return invoke != nullptr; }

            torch::Tensor operator()(torch::Tensor input) const
            {
                if (!invoke) {
                    throw std::logic_error("Attempted to invoke an empty forward binding.");
                }
                return invoke(context, std::move(input));
            }
        };

        // Same computation as the module forward but with caller supplied
        // parameters (used to run a layer with quantized or rounded weights).
        using FunctionalForward = std::function<torch::Tensor(const torch::Tensor& input,
                                                              const torch::Tensor& weight,
                                                              const torch::Tensor& bias)>;

        template <class Module>
        void bind_module_forward(Module* module)
        {
            forward = ForwardBinding{&dispatch_module<Module>, module};
        }

        [[nodiscard]] torch::Tensor operator()(const torch::Tensor& input) const
        {
            if (wrapper) {
                return wrapper->forward(*this, input);
            }
            return forward(input);
        }

        [[nodiscard]] torch::Tensor functional(const torch::Tensor& input,
                                               const torch::Tensor& weight,
                                               const torch::Tensor& bias) const
        {
            if (!functional_forward) {
                throw std::logic_error("Layer '" + name + "' has no parameterized forward.");
            }
            return functional_forward(input, weight, bias);
        }

        [[nodiscard]] torch::Tensor parameter(const std::string& key) const
        {
            if (!module) {
                return {};
            }
            auto parameters = module->named_parameters(/*recurse=*/false);
            if (const auto* found = parameters.find(key)) {
                return *found;
            }
            return {};
        }

        [[nodiscard]] torch::Tensor weight() const { return parameter("weight"); }
        [[nodiscard]] torch::Tensor bias() const { return parameter("bias"); }

        [[nodiscard]] bool is_weighted() const noexcept { return ::Roundwise::Layer::is_weighted(kind); }

        ForwardBinding forward{};
        FunctionalForward functional_forward{};
        ::Roundwise::Layer::Kind kind{::Roundwise::Layer::Kind::Nonlinearity};
        ::Roundwise::Activation::Type activation{::Roundwise::Activation::Type::Identity};
        std::shared_ptr<torch::nn::Module> module{};
        std::shared_ptr<LayerWrapper> wrapper{};
        std::string name{};
        std::size_t index{0};

    private:
        template <class Module>
        static torch::Tensor dispatch_module(void* context, torch::Tensor input)
        {
            auto* module = static_cast<Module*>(context);
            return module->forward(std::move(input));
        }
    };

    template <class Owner, class Descriptor>
    RegisteredLayer build_registered_layer(Owner&, const Descriptor&, const std::string&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported layer descriptor provided to build_registered_layer.");
        return {};
    }

    template <class Owner, class... DescriptorTypes>
    RegisteredLayer build_registered_layer(Owner& owner, const std::variant<DescriptorTypes...>& descriptor, const std::string& key) {
        return std::visit(
            [&](const auto& concrete_descriptor) {
                return build_registered_layer(owner, concrete_descriptor, key);
            },
            descriptor);
    }
}
#endif // ROUNDWISE_LAYER_REGISTRY_HPP
