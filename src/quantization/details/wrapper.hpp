#ifndef ROUNDWISE_QUANTIZATION_DETAILS_WRAPPER_HPP
#define ROUNDWISE_QUANTIZATION_DETAILS_WRAPPER_HPP

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../layer/layer.hpp"
#include "tensor_quantizer.hpp"

namespace Roundwise::Quantization::Details {
    enum class WrapperMode {
        Passthrough,  // plain float forward
        Calibration,  // float forward, input/output statistics collected
        Active,       // fake-quantized forward
    };

    // Simulation hook around one layer: input and output quantizers plus one
    // quantizer per parameter ("weight", "bias").
    class QuantizeWrapper final : public ::Roundwise::Layer::LayerWrapper {
    public:
        using ParamQuantizers = std::map<std::string, std::shared_ptr<TensorQuantizer>>;

        QuantizeWrapper(QuantizerSettings input, QuantizerSettings output, ParamQuantizers params)
            : input_(input), output_(output), params_(std::move(params)) {}

        torch::Tensor forward(const ::Roundwise::Layer::RegisteredLayer& layer, const torch::Tensor& input) override
        {
            switch (mode_) {
                case WrapperMode::Passthrough:
                    return layer.forward(input);
                case WrapperMode::Calibration: {
                    if (input_.enabled()) {
                        input_.update_encoding_stats(input);
                    }
                    auto output = layer.forward(input);
                    if (output_.enabled()) {
                        output_.update_encoding_stats(output);
                    }
                    return output;
                }
                case WrapperMode::Active:
                default:
                    break;
            }

            const auto quantized_input = input_.quantize_dequantize(input);
            torch::Tensor output;
            if (layer.is_weighted()) {
                output = layer.functional(quantized_input, quantized_param(layer, "weight"), quantized_param(layer, "bias"));
            } else {
                output = layer.forward(quantized_input);
            }
            return output_.quantize_dequantize(output);
        }

        [[nodiscard]] WrapperMode mode() const noexcept { return mode_; }
        void set_mode(WrapperMode mode) noexcept { mode_ = mode; }

        [[nodiscard]] StaticGridTensorQuantizer& input_quantizer() noexcept { return input_; }
        [[nodiscard]] StaticGridTensorQuantizer& output_quantizer() noexcept { return output_; }

        [[nodiscard]] const ParamQuantizers& param_quantizers() const noexcept { return params_; }

        [[nodiscard]] TensorQuantizer* param_quantizer(const std::string& name) const
        {
            const auto it = params_.find(name);
            return it == params_.end() ? nullptr : it->second.get();
        }

        void set_param_quantizer(const std::string& name, std::shared_ptr<TensorQuantizer> quantizer)
        {
            if (params_.find(name) == params_.end()) {
                throw std::invalid_argument("Wrapper has no quantizer for parameter '" + name + "'.");
            }
            params_[name] = std::move(quantizer);
        }

        // Parameter encodings come from the parameter values alone.
        void compute_param_encodings(const ::Roundwise::Layer::RegisteredLayer& layer)
        {
            for (auto& [name, quantizer] : params_) {
                auto* grid = dynamic_cast<StaticGridTensorQuantizer*>(quantizer.get());
                const auto value = layer.parameter(name);
                if (grid == nullptr || !grid->enabled() || !value.defined()) {
                    continue;
                }
                grid->reset_encoding_stats();
                grid->update_encoding_stats(value);
                grid->compute_encoding();
            }
        }

    private:
        [[nodiscard]] torch::Tensor quantized_param(const ::Roundwise::Layer::RegisteredLayer& layer, const std::string& name) const
        {
            auto value = layer.parameter(name);
            auto* quantizer = param_quantizer(name);
            if (!value.defined() || quantizer == nullptr || !quantizer->enabled()) {
                return value;
            }
            return quantizer->quantize_dequantize(value);
        }

        StaticGridTensorQuantizer input_;
        StaticGridTensorQuantizer output_;
        ParamQuantizers params_;
        WrapperMode mode_{WrapperMode::Passthrough};
    };
}

#endif // ROUNDWISE_QUANTIZATION_DETAILS_WRAPPER_HPP
