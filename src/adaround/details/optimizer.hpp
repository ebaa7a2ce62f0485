#ifndef ROUNDWISE_ADAROUND_DETAILS_OPTIMIZER_HPP
#define ROUNDWISE_ADAROUND_DETAILS_OPTIMIZER_HPP

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/apply.hpp"
#include "../../data/data.hpp"
#include "../../network.hpp"
#include "../../optimizer/optimizer.hpp"
#include "../../quantization/quantization.hpp"
#include "../../utils/log.hpp"
#include "../../utils/progressbar.hpp"
#include "loss.hpp"
#include "parameters.hpp"
#include "sampler.hpp"
#include "tensor_quantizer.hpp"

namespace Roundwise::Adaround::Details {
    struct LayerReport {
        std::string name{};
        int bitwidth{0};
        std::int64_t iterations{0};
        double reconstruction{0.0};
        double rounding{0.0};
        double flipped{0.0};  // share of elements rounded away from nearest
    };

    struct LayerContext {
        Model& float_model;
        Model& quant_model;
        const RegisteredLayer& quant_layer;
        ::Roundwise::Quantization::QuantizeWrapper& wrapper;
        std::optional<::Roundwise::Activation::Type> activation{};
    };

    [[nodiscard]] inline AdaroundTensorQuantizer& require_adaround_quantizer(::Roundwise::Quantization::QuantizeWrapper& wrapper,
                                                                            const std::string& name)
    {
        auto* quantizer = dynamic_cast<AdaroundTensorQuantizer*>(wrapper.param_quantizer("weight"));
        if (quantizer == nullptr) {
            throw std::logic_error("Weight quantizer of '" + name + "' is not an Adaround quantizer.");
        }
        if (!quantizer->encoding().has_value()) {
            throw std::logic_error("Weight quantizer of '" + name + "' has no encoding.");
        }
        if (quantizer->frozen()) {
            throw std::logic_error("Weight rounding of '" + name + "' is already frozen.");
        }
        return *quantizer;
    }

    [[nodiscard]] inline torch::Tensor apply_activation(const std::optional<::Roundwise::Activation::Type>& activation,
                                                        torch::Tensor tensor)
    {
        if (!activation.has_value()) {
            return tensor;
        }
        return ::Roundwise::Activation::Details::apply(*activation, std::move(tensor));
    }

    // Optimizes the rounding of one layer and freezes it. Earlier layers of
    // the quantized model already carry their frozen rounding.
    inline LayerReport optimize_layer(LayerContext context,
                                      const ::Roundwise::Data::CachedDataset& dataset,
                                      const AdaroundParameters& params)
    {
        const auto& name = context.quant_layer.name;
        auto& quantizer = require_adaround_quantizer(context.wrapper, name);

        const auto weight = context.quant_layer.weight().detach();
        auto bias = context.quant_layer.bias();
        if (bias.defined()) {
            bias = bias.detach();
        }
        if (!quantizer.initialized()) {
            quantizer.initialize(weight);
        }

        auto optimizer = ::Roundwise::Optimizer::Details::build_optimizer(params.optimizer, {quantizer.alpha()});
        ActivationSampler sampler(context.float_model, context.quant_model, name);
        std::vector<std::optional<std::pair<torch::Tensor, torch::Tensor>>> samples(dataset.size());

        std::unique_ptr<::Roundwise::Utils::ProgressBar> progress;
        if (params.show_progress) {
            progress = std::make_unique<::Roundwise::Utils::ProgressBar>(params.num_iterations, name, std::cout);
        }

        LayerReport report{};
        report.name = name;
        report.bitwidth = quantizer.bitwidth();
        report.iterations = params.num_iterations;

        std::optional<Phase> phase{};
        for (std::int64_t iteration = 0; iteration < params.num_iterations; ++iteration) {
            const auto current_phase = phase_at(params, iteration);
            if (phase != current_phase) {
                phase = current_phase;
                ::Roundwise::Log::info(::Roundwise::Log::Area::kQuant, "'", name, "' entering ",
                                       phase_name(current_phase), " at iteration ", iteration, '.');
            }

            const auto batch = static_cast<std::size_t>(iteration) % dataset.size();
            if (!samples[batch].has_value()) {
                samples[batch] = sampler.sample(dataset[batch]);
            }
            const auto& [input, target] = *samples[batch];

            auto quantized_output = context.quant_layer.functional(input, quantizer.soft_quantize_dequantize(weight), bias);
            quantized_output = apply_activation(context.activation, std::move(quantized_output));
            const auto float_output = apply_activation(context.activation, target);

            const auto terms = compute_total_loss(quantized_output, float_output, quantizer, params, iteration);
            optimizer->zero_grad();
            terms.total.backward();
            optimizer->step();

            report.reconstruction = terms.reconstruction.item<double>();
            report.rounding = terms.rounding.item<double>();

            if (iteration % 100 == 0) {
                ::Roundwise::Log::debug(::Roundwise::Log::Area::kQuant,
                                        "'", name, "' iteration ", iteration,
                                        ": recon ", report.reconstruction,
                                        ", round ", report.rounding,
                                        ", beta ", in_warm_start(params, iteration) ? 0.0 : compute_beta(params, iteration));
            }
            if (progress) {
                std::ostringstream suffix;
                suffix << "loss " << std::setprecision(4) << terms.total.item<double>();
                progress->set_suffix(suffix.str());
                progress->update(iteration + 1);
            }
        }

        quantizer.freeze();
        {
            torch::NoGradGuard no_grad{};
            const auto nearest = quantizer.nearest_quantize_dequantize(weight);
            report.flipped = quantizer.hard_quantize_dequantize(weight).ne(nearest).to(torch::kDouble).mean().item<double>();
        }
        ::Roundwise::Log::info(::Roundwise::Log::Area::kQuant, "'", name, "' ", phase_name(Phase::Converged),
                               ": recon ", report.reconstruction, ", ", std::fixed, std::setprecision(2),
                               report.flipped * 100.0, "% rounded away from nearest.");
        return report;
    }
}

#endif // ROUNDWISE_ADAROUND_DETAILS_OPTIMIZER_HPP
