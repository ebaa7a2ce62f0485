#ifndef ROUNDWISE_ACTIVATION_HPP
#define ROUNDWISE_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <string_view>

namespace Roundwise::Activation {
    enum class Type {
        Identity,
        ReLU,
        ReLU6,
        LeakyReLU,
        Sigmoid,
        Tanh,
        GeLU,
        SiLU,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor ReLU6{Type::ReLU6};
    inline constexpr Descriptor LeakyReLU{Type::LeakyReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor GeLU{Type::GeLU};
    inline constexpr Descriptor SiLU{Type::SiLU};

    [[nodiscard]] constexpr std::string_view name(Type type) noexcept {
        switch (type) {
            case Type::ReLU:      return "ReLU";
            case Type::ReLU6:     return "ReLU6";
            case Type::LeakyReLU: return "LeakyReLU";
            case Type::Sigmoid:   return "Sigmoid";
            case Type::Tanh:      return "Tanh";
            case Type::GeLU:      return "GeLU";
            case Type::SiLU:      return "SiLU";
            case Type::Identity:
            default:              return "Identity";
        }
    }
}

#endif //ROUNDWISE_ACTIVATION_HPP
