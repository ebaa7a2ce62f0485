#ifndef ROUNDWISE_QUANTIZATION_DETAILS_QUANTSIM_HPP
#define ROUNDWISE_QUANTIZATION_DETAILS_QUANTSIM_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../network.hpp"
#include "../../utils/log.hpp"
#include "config.hpp"
#include "encoding.hpp"
#include "tensor_quantizer.hpp"
#include "wrapper.hpp"

namespace Roundwise::Quantization::Details {
    struct QuantSimOptions {
        QuantScheme quant_scheme{QuantScheme::PostTrainingTFEnhanced};
        int default_output_bw{8};
        int default_param_bw{8};
        std::optional<std::filesystem::path> config_file{};
    };

    /*
     * Simulation of a quantized model.
     * ---------------------------------------------------------------------------
     *  - Owns a deep copy of the float model; the original is never touched.
     *  - Every weighted layer and every standalone activation gets a
     *    QuantizeWrapper. Weighted layers carry one quantizer per parameter.
     *  - Encodings are computed by `compute_encodings`, which runs the caller's
     *    forward pass in calibration mode and then activates the wrappers.
     */
    class QuantizationSimModel {
    public:
        QuantizationSimModel(const Model& model, const torch::Tensor& dummy_input, QuantSimOptions options = {})
            : options_(std::move(options)),
              config_(options_.config_file ? load_config(*options_.config_file) : QuantConfig{}),
              model_(model.clone_model())
        {
            validate_bitwidth(options_.default_param_bw, "Parameter");
            validate_bitwidth(options_.default_output_bw, "Output");

            for (auto* layer : model_->layers()) {
                if (!layer->is_weighted() && layer->kind != ::Roundwise::Layer::Kind::Nonlinearity) {
                    continue;
                }
                layer->wrapper = make_wrapper(*layer);
            }

            {
                torch::NoGradGuard no_grad{};
                const auto output = model_->forward(dummy_input);
                (void)output;
            }
            ::Roundwise::Log::info(::Roundwise::Log::Area::kQuant,
                                   "Created quantization simulation of '", model_->name(), "' with ",
                                   model_->wrapper_count(), " wrappers (",
                                   scheme_name(options_.quant_scheme), ", param bw ", options_.default_param_bw,
                                   ", output bw ", options_.default_output_bw, ").");
        }

        QuantizationSimModel(const QuantizationSimModel&) = delete;
        QuantizationSimModel& operator=(const QuantizationSimModel&) = delete;

        [[nodiscard]] Model& model() noexcept { return *model_; }
        [[nodiscard]] const Model& model() const noexcept { return *model_; }
        [[nodiscard]] const QuantConfig& config() const noexcept { return config_; }
        [[nodiscard]] const QuantSimOptions& options() const noexcept { return options_; }

        [[nodiscard]] QuantizeWrapper* find_wrapper(std::string_view name) const
        {
            const auto* layer = static_cast<const Model&>(*model_).find(name);
            if (layer == nullptr) {
                return nullptr;
            }
            return dynamic_cast<QuantizeWrapper*>(layer->wrapper.get());
        }

        // Declaration order.
        [[nodiscard]] std::vector<std::pair<const RegisteredLayer*, QuantizeWrapper*>> wrappers() const
        {
            std::vector<std::pair<const RegisteredLayer*, QuantizeWrapper*>> result;
            for (const auto* layer : static_cast<const Model&>(*model_).layers()) {
                if (auto* wrapper = dynamic_cast<QuantizeWrapper*>(layer->wrapper.get())) {
                    result.emplace_back(layer, wrapper);
                }
            }
            return result;
        }

        void set_mode(WrapperMode mode)
        {
            for (auto& [layer, wrapper] : wrappers()) {
                (void)layer;
                wrapper->set_mode(mode);
            }
        }

        void compute_param_encodings()
        {
            for (auto& [layer, wrapper] : wrappers()) {
                wrapper->compute_param_encodings(*layer);
            }
        }

        // Parameter encodings from the weights, activation encodings from the
        // statistics gathered while `forward_pass` runs. Leaves every wrapper
        // active.
        void compute_encodings(const std::function<void(Model&)>& forward_pass)
        {
            for (auto& [layer, wrapper] : wrappers()) {
                (void)layer;
                wrapper->input_quantizer().reset_encoding_stats();
                wrapper->output_quantizer().reset_encoding_stats();
            }

            set_mode(WrapperMode::Calibration);
            {
                torch::NoGradGuard no_grad{};
                forward_pass(*model_);
            }

            compute_param_encodings();
            for (auto& [layer, wrapper] : wrappers()) {
                for (auto* quantizer : {&wrapper->input_quantizer(), &wrapper->output_quantizer()}) {
                    if (!quantizer->enabled()) {
                        continue;
                    }
                    quantizer->compute_encoding();
                    if (!quantizer->encoding().has_value()) {
                        ::Roundwise::Log::warning(::Roundwise::Log::Area::kQuant,
                                                  "No statistics reached '", layer->name,
                                                  "'; disabling its activation quantizer.");
                        quantizer->set_enabled(false);
                    }
                }
            }
            set_mode(WrapperMode::Active);
        }

        // Excluded layers run in float: their wrapper is removed.
        void exclude_layers_from_quantization(const std::vector<std::string>& names)
        {
            for (const auto& name : names) {
                auto& layer = model_->at(name);
                if (layer.wrapper) {
                    layer.wrapper.reset();
                    ::Roundwise::Log::info(::Roundwise::Log::Area::kQuant, "Excluded '", name, "' from quantization.");
                }
            }
        }

        // Returns the underlying model with every wrapper stripped.
        std::shared_ptr<Model> remove_wrappers()
        {
            for (auto* layer : model_->layers()) {
                layer->wrapper.reset();
            }
            return model_;
        }

    private:
        [[nodiscard]] std::shared_ptr<QuantizeWrapper> make_wrapper(const RegisteredLayer& layer) const
        {
            QuantizerSettings output{};
            output.bitwidth = options_.default_output_bw;
            output.scheme = options_.quant_scheme;
            output.symmetric = config_.output_symmetric;
            output.enabled = config_.output_quantized;

            QuantizerSettings input = output;
            input.enabled = false;

            QuantizeWrapper::ParamQuantizers params;
            if (layer.is_weighted() && layer.module) {
                for (const auto& item : layer.module->named_parameters(/*recurse=*/false)) {
                    QuantizerSettings settings{};
                    settings.bitwidth = options_.default_param_bw;
                    settings.scheme = options_.quant_scheme;
                    settings.symmetric = config_.is_param_symmetric(item.key());
                    settings.enabled = config_.is_param_quantized(item.key());
                    params.emplace(item.key(), std::make_shared<StaticGridTensorQuantizer>(settings));
                }
            }
            return std::make_shared<QuantizeWrapper>(input, output, std::move(params));
        }

        QuantSimOptions options_;
        QuantConfig config_;
        std::shared_ptr<Model> model_;
    };
}

#endif // ROUNDWISE_QUANTIZATION_DETAILS_QUANTSIM_HPP
