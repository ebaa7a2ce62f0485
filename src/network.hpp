#ifndef ROUNDWISE_NETWORK_HPP
#define ROUNDWISE_NETWORK_HPP
/*
 * Model container.
 * ---------------------------------------------------------------------------
 *  - Layers and blocks are materialised from descriptors and registered as
 *    torch submodules; every layer carries a stable hierarchical name
 *    ("conv2d_0", "features.1", "stage.projection") and a name -> layer index
 *    built at insertion time.
 *  - forward() walks the stage list. An optional ForwardObserver sees every
 *    layer invocation (before it runs, then with its pre-activation output)
 *    and every residual merge, which is all graph tracing and activation
 *    sampling need. An observer may throw to cut the pass short.
 *  - A layer may carry a LayerWrapper (simulation hook); clone_model() always
 *    produces a plain copy without wrappers.
 *  - Auxiliary layers are registered (they own parameters) but never run.
 */

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "activation/apply.hpp"
#include "block/block.hpp"
#include "layer/layer.hpp"

namespace Roundwise {
    using RegisteredLayer = Layer::Details::RegisteredLayer;
    using LayerWrapper = Layer::Details::LayerWrapper;

    class ForwardObserver {
    public:
        virtual ~ForwardObserver() = default;

        virtual void on_enter(const RegisteredLayer& layer, const torch::Tensor& input)
        {
            (void)layer;
            (void)input;
        }

        // `output` is the layer result before its fused activation.
        virtual void on_layer(const RegisteredLayer& layer, const torch::Tensor& input, const torch::Tensor& output)
        {
            (void)layer;
            (void)input;
            (void)output;
        }

        virtual void on_merge(const torch::Tensor& branch, const torch::Tensor& skip, const torch::Tensor& output)
        {
            (void)branch;
            (void)skip;
            (void)output;
        }
    };

    class Model : public torch::nn::Module {
    public:
        explicit Model(std::string name = "model") : name_(std::move(name)) {}

        Model(const Model&) = delete;
        Model& operator=(const Model&) = delete;

        void add(const Layer::Descriptor& descriptor, std::string name = {})
        {
            auto resolved = resolve_name(std::move(name), descriptor);
            stages_.push_back(Stage::of_layer(append_layer(descriptor, resolved)));
            blueprint_.push_back({descriptor, std::move(resolved), false});
        }

        void add(const Block::Descriptor& descriptor, std::string name = {})
        {
            if (name.empty()) {
                name = "block_" + std::to_string(block_count_);
            }
            ensure_unique(name);
            ++block_count_;

            std::visit(
                [&](const auto& block) {
                    using BlockT = std::decay_t<decltype(block)>;
                    if (block.layers.empty()) {
                        throw std::invalid_argument("Block '" + name + "' requires at least one layer descriptor.");
                    }
                    if constexpr (std::is_same_v<BlockT, Block::SequentialDescriptor>) {
                        for (std::size_t position = 0; position < block.layers.size(); ++position) {
                            const auto layer_name = name + "." + std::to_string(position);
                            stages_.push_back(Stage::of_layer(append_layer(block.layers[position], layer_name)));
                        }
                    } else {
                        Stage residual{};
                        residual.type = Stage::Type::Residual;
                        residual.final_activation = block.output.final_activation.type;
                        for (std::size_t position = 0; position < block.layers.size(); ++position) {
                            const auto layer_name = name + "." + std::to_string(position);
                            residual.branch.push_back(Stage::of_layer(append_layer(block.layers[position], layer_name)));
                        }
                        if (block.skip.projection.has_value()) {
                            residual.projection = append_layer(*block.skip.projection, name + ".projection");
                        }
                        stages_.push_back(std::move(residual));
                    }
                },
                descriptor);
            block_names_.insert(name);
            blueprint_.push_back({descriptor, std::move(name), false});
        }

        // Registered and owning parameters, but not part of the forward pass.
        void add_auxiliary(const Layer::Descriptor& descriptor, std::string name = {})
        {
            auto resolved = resolve_name(std::move(name), descriptor);
            append_layer(descriptor, resolved);
            blueprint_.push_back({descriptor, std::move(resolved), true});
        }

        torch::Tensor forward(torch::Tensor input)
        {
            return forward(std::move(input), nullptr);
        }

        torch::Tensor forward(torch::Tensor input, ForwardObserver* observer)
        {
            auto output = std::move(input);
            for (const auto& stage : stages_) {
                output = run(stage, std::move(output), observer);
            }
            return output;
        }

        [[nodiscard]] RegisteredLayer* find(std::string_view name)
        {
            const auto it = index_.find(std::string(name));
            return it == index_.end() ? nullptr : layers_[it->second].get();
        }

        [[nodiscard]] const RegisteredLayer* find(std::string_view name) const
        {
            const auto it = index_.find(std::string(name));
            return it == index_.end() ? nullptr : layers_[it->second].get();
        }

        [[nodiscard]] RegisteredLayer& at(std::string_view name)
        {
            if (auto* layer = find(name)) {
                return *layer;
            }
            throw std::invalid_argument("Model '" + name_ + "' has no layer named '" + std::string(name) + "'.");
        }

        [[nodiscard]] const RegisteredLayer& at(std::string_view name) const
        {
            if (const auto* layer = find(name)) {
                return *layer;
            }
            throw std::invalid_argument("Model '" + name_ + "' has no layer named '" + std::string(name) + "'.");
        }

        // Declaration order, auxiliary layers included.
        [[nodiscard]] std::vector<RegisteredLayer*> layers()
        {
            std::vector<RegisteredLayer*> result;
            result.reserve(layers_.size());
            for (auto& layer : layers_) {
                result.push_back(layer.get());
            }
            return result;
        }

        [[nodiscard]] std::vector<const RegisteredLayer*> layers() const
        {
            std::vector<const RegisteredLayer*> result;
            result.reserve(layers_.size());
            for (const auto& layer : layers_) {
                result.push_back(layer.get());
            }
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept { return layers_.size(); }

        [[nodiscard]] bool has_wrappers() const noexcept { return wrapper_count() > 0; }

        [[nodiscard]] std::size_t wrapper_count() const noexcept
        {
            return static_cast<std::size_t>(std::count_if(layers_.begin(), layers_.end(), [](const auto& layer) {
                return static_cast<bool>(layer->wrapper);
            }));
        }

        [[nodiscard]] const std::string& name() const noexcept { return name_; }

        [[nodiscard]] torch::Device device() const
        {
            const auto parameters = this->parameters();
            return parameters.empty() ? torch::Device(torch::kCPU) : parameters.front().device();
        }

        // Deep copy: same structure, names and parameter values, no wrappers.
        [[nodiscard]] std::shared_ptr<Model> clone_model() const
        {
            auto copy = std::make_shared<Model>(name_);
            for (const auto& entry : blueprint_) {
                std::visit(
                    [&](const auto& descriptor) {
                        using DescriptorT = std::decay_t<decltype(descriptor)>;
                        if constexpr (std::is_same_v<DescriptorT, Layer::Descriptor>) {
                            if (entry.auxiliary) {
                                copy->add_auxiliary(descriptor, entry.name);
                            } else {
                                copy->add(descriptor, entry.name);
                            }
                        } else {
                            copy->add(descriptor, entry.name);
                        }
                    },
                    entry.descriptor);
            }
            copy->to(device());
            copy->train(is_training());

            torch::NoGradGuard no_grad{};
            const auto source_parameters = named_parameters(/*recurse=*/true);
            auto target_parameters = copy->named_parameters(/*recurse=*/true);
            for (const auto& item : source_parameters) {
                auto* target = target_parameters.find(item.key());
                if (target == nullptr) {
                    throw std::logic_error("Model clone is missing parameter '" + item.key() + "'.");
                }
                target->copy_(item.value());
            }
            const auto source_buffers = named_buffers(/*recurse=*/true);
            auto target_buffers = copy->named_buffers(/*recurse=*/true);
            for (const auto& item : source_buffers) {
                if (auto* target = target_buffers.find(item.key())) {
                    target->copy_(item.value());
                }
            }
            return copy;
        }

    private:
        struct Stage {
            enum class Type { Layer, Residual };

            Type type{Type::Layer};
            std::size_t layer{0};
            std::vector<Stage> branch{};
            std::optional<std::size_t> projection{};
            ::Roundwise::Activation::Type final_activation{::Roundwise::Activation::Type::Identity};

            static Stage of_layer(std::size_t index)
            {
                Stage stage{};
                stage.type = Type::Layer;
                stage.layer = index;
                return stage;
            }
        };

        struct BlueprintEntry {
            std::variant<Layer::Descriptor, Block::Descriptor> descriptor;
            std::string name;
            bool auxiliary{false};
        };

        [[nodiscard]] static std::string default_prefix(const Layer::Descriptor& descriptor)
        {
            return std::visit(
                [](const auto& concrete) -> std::string {
                    using DescriptorT = std::decay_t<decltype(concrete)>;
                    if constexpr (std::is_same_v<DescriptorT, Layer::FCDescriptor>) {
                        return "fc";
                    } else if constexpr (std::is_same_v<DescriptorT, Layer::Conv2dDescriptor>) {
                        return "conv2d";
                    } else if constexpr (std::is_same_v<DescriptorT, Layer::ConvTranspose2dDescriptor>) {
                        return "conv_transpose2d";
                    } else if constexpr (std::is_same_v<DescriptorT, Layer::PoolingDescriptor>) {
                        return "pool";
                    } else if constexpr (std::is_same_v<DescriptorT, Layer::FlattenDescriptor>) {
                        return "flatten";
                    } else {
                        return "activation";
                    }
                },
                descriptor);
        }

        std::string resolve_name(std::string name, const Layer::Descriptor& descriptor) const
        {
            if (name.empty()) {
                name = default_prefix(descriptor) + "_" + std::to_string(layers_.size());
            }
            return name;
        }

        void ensure_unique(const std::string& name) const
        {
            if (name.empty()) {
                throw std::invalid_argument("Layer names must not be empty.");
            }
            if (index_.count(name) != 0 || block_names_.count(name) != 0) {
                throw std::invalid_argument("Model '" + name_ + "' already contains an entry named '" + name + "'.");
            }
        }

        // Torch forbids '.' in submodule names.
        static std::string registration_key(const std::string& name)
        {
            auto key = name;
            std::replace(key.begin(), key.end(), '.', '_');
            return key;
        }

        std::size_t append_layer(const Layer::Descriptor& descriptor, const std::string& name)
        {
            ensure_unique(name);
            auto key = registration_key(name);
            if (registered_keys_.count(key) != 0) {
                key += "_" + std::to_string(layers_.size());
            }

            auto registered = Layer::Details::build_registered_layer(*this, descriptor, key);
            registered.name = name;
            registered.index = layers_.size();

            registered_keys_.insert(std::move(key));
            index_.emplace(name, layers_.size());
            layers_.push_back(std::make_unique<RegisteredLayer>(std::move(registered)));
            return layers_.size() - 1;
        }

        torch::Tensor run_layer(std::size_t index, torch::Tensor input, ForwardObserver* observer)
        {
            const auto& layer = *layers_[index];
            if (observer != nullptr) {
                observer->on_enter(layer, input);
            }
            auto output = layer(input);
            if (observer != nullptr) {
                observer->on_layer(layer, input, output);
            }
            return ::Roundwise::Activation::Details::apply(layer.activation, std::move(output));
        }

        torch::Tensor run(const Stage& stage, torch::Tensor input, ForwardObserver* observer)
        {
            if (stage.type == Stage::Type::Layer) {
                return run_layer(stage.layer, std::move(input), observer);
            }

            auto branch = input;
            for (const auto& inner : stage.branch) {
                branch = run(inner, std::move(branch), observer);
            }

            auto skip = input;
            if (stage.projection.has_value()) {
                skip = run_layer(*stage.projection, std::move(skip), observer);
            }

            if (branch.sizes() != skip.sizes()) {
                std::ostringstream message;
                message << "Residual block skip connection shape mismatch: branch output " << branch.sizes()
                        << " vs. skip connection " << skip.sizes()
                        << ". Consider providing a projection layer or adjusting the block configuration.";
                throw std::runtime_error(message.str());
            }

            auto output = branch + skip;
            if (observer != nullptr) {
                observer->on_merge(branch, skip, output);
            }
            return ::Roundwise::Activation::Details::apply(stage.final_activation, std::move(output));
        }

        std::string name_;
        std::vector<Stage> stages_{};
        std::vector<std::unique_ptr<RegisteredLayer>> layers_{};
        std::unordered_map<std::string, std::size_t> index_{};
        std::unordered_set<std::string> registered_keys_{};
        std::unordered_set<std::string> block_names_{};
        std::vector<BlueprintEntry> blueprint_{};
        std::size_t block_count_{0};
    };

    using ModelPtr = std::shared_ptr<Model>;
}

#endif // ROUNDWISE_NETWORK_HPP
