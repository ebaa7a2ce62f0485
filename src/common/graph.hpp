#ifndef ROUNDWISE_COMMON_GRAPH_HPP
#define ROUNDWISE_COMMON_GRAPH_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <torch/torch.h>

#include "../activation/activation.hpp"
#include "../layer/details/nonlinearity.hpp"
#include "../network.hpp"
#include "../utils/log.hpp"

namespace Roundwise::Graph {
    // A weight-bearing layer as executed, with the activation that consumes
    // its output (if that activation is its only consumer).
    struct Node {
        const RegisteredLayer* layer{nullptr};
        std::optional<::Roundwise::Activation::Type> activation{};
    };

    using ModuleActivationMap = std::unordered_map<std::string, std::optional<::Roundwise::Activation::Type>>;

    namespace Details {
        struct LayerEvent {
            const RegisteredLayer* layer{nullptr};
            torch::Tensor input{};
            torch::Tensor output{};
        };

        // Keeps every recorded tensor alive for the duration of the trace so
        // storage identity can be used to connect producers and consumers.
        class Recorder final : public ForwardObserver {
        public:
            void on_layer(const RegisteredLayer& layer, const torch::Tensor& input, const torch::Tensor& output) override
            {
                events.push_back({&layer, input, output});
            }

            void on_merge(const torch::Tensor& branch, const torch::Tensor& skip, const torch::Tensor& output) override
            {
                merges.push_back({branch, skip, output});
            }

            struct MergeEvent {
                torch::Tensor branch{};
                torch::Tensor skip{};
                torch::Tensor output{};
            };

            std::vector<LayerEvent> events{};
            std::vector<MergeEvent> merges{};
        };

        [[nodiscard]] inline bool same_tensor(const torch::Tensor& lhs, const torch::Tensor& rhs)
        {
            return lhs.defined() && rhs.defined() && lhs.unsafeGetTensorImpl() == rhs.unsafeGetTensorImpl();
        }

        [[nodiscard]] inline std::optional<::Roundwise::Activation::Type> standalone_activation(const RegisteredLayer& layer)
        {
            if (layer.kind != ::Roundwise::Layer::Kind::Nonlinearity || !layer.module) {
                return std::nullopt;
            }
            const auto* impl = dynamic_cast<const ::Roundwise::Layer::Details::NonlinearityImpl*>(layer.module.get());
            if (impl == nullptr) {
                return std::nullopt;
            }
            return impl->type();
        }

        [[nodiscard]] inline std::optional<::Roundwise::Activation::Type>
        following_activation(const Recorder& recorder, std::size_t producer)
        {
            const auto& event = recorder.events[producer];
            if (event.layer->activation != ::Roundwise::Activation::Type::Identity) {
                return event.layer->activation;
            }

            std::size_t consumers = 0;
            const LayerEvent* consumer = nullptr;
            for (std::size_t index = producer + 1; index < recorder.events.size(); ++index) {
                if (same_tensor(recorder.events[index].input, event.output)) {
                    ++consumers;
                    consumer = &recorder.events[index];
                }
            }
            for (const auto& merge : recorder.merges) {
                if (same_tensor(merge.branch, event.output)) {
                    ++consumers;
                }
                if (same_tensor(merge.skip, event.output)) {
                    ++consumers;
                }
            }

            if (consumers != 1 || consumer == nullptr) {
                return std::nullopt;
            }
            return standalone_activation(*consumer->layer);
        }

        [[nodiscard]] inline Recorder record(Model& model, const torch::Tensor& dummy_input)
        {
            torch::NoGradGuard no_grad{};
            Recorder recorder{};
            const auto output = model.forward(dummy_input, &recorder);
            (void)output;
            return recorder;
        }
    }

    // Executed weight-bearing layers in execution order.
    [[nodiscard]] inline std::vector<Node> trace(Model& model, const torch::Tensor& dummy_input)
    {
        const auto recorder = Details::record(model, dummy_input);

        std::vector<Node> nodes;
        std::unordered_set<const RegisteredLayer*> seen;
        for (std::size_t index = 0; index < recorder.events.size(); ++index) {
            const auto* layer = recorder.events[index].layer;
            if (!layer->is_weighted() || !seen.insert(layer).second) {
                continue;
            }
            nodes.push_back({layer, Details::following_activation(recorder, index)});
        }

        ::Roundwise::Log::debug(::Roundwise::Log::Area::kGraph,
                                "Traced ", recorder.events.size(), " layer calls, ",
                                nodes.size(), " weighted layers in model '", model.name(), "'.");
        return nodes;
    }

    [[nodiscard]] inline std::vector<std::string> ordered_layers(Model& model, const torch::Tensor& dummy_input)
    {
        std::vector<std::string> names;
        for (const auto& node : trace(model, dummy_input)) {
            names.push_back(node.layer->name);
        }
        return names;
    }

    [[nodiscard]] inline ModuleActivationMap module_activation_pairs(Model& model, const torch::Tensor& dummy_input)
    {
        ModuleActivationMap pairs;
        for (const auto& node : trace(model, dummy_input)) {
            pairs.emplace(node.layer->name, node.activation);
        }
        return pairs;
    }
}

#endif // ROUNDWISE_COMMON_GRAPH_HPP
