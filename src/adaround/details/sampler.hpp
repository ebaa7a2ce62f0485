#ifndef ROUNDWISE_ADAROUND_DETAILS_SAMPLER_HPP
#define ROUNDWISE_ADAROUND_DETAILS_SAMPLER_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../network.hpp"

namespace Roundwise::Adaround::Details {
    // Thrown from inside a forward pass once the wanted tensor is captured.
    class StopForward final : public std::exception {
    public:
        [[nodiscard]] const char* what() const noexcept override { return "forward pass stopped"; }
    };

    namespace detail {
        class CaptureInput final : public ForwardObserver {
        public:
            explicit CaptureInput(const std::string& name) : name_(name) {}

            void on_enter(const RegisteredLayer& layer, const torch::Tensor& input) override
            {
                if (layer.name == name_) {
                    captured = input.detach();
                    throw StopForward{};
                }
            }

            torch::Tensor captured{};

        private:
            const std::string& name_;
        };

        class CaptureOutput final : public ForwardObserver {
        public:
            explicit CaptureOutput(const std::string& name) : name_(name) {}

            void on_layer(const RegisteredLayer& layer, const torch::Tensor& input, const torch::Tensor& output) override
            {
                (void)input;
                if (layer.name == name_) {
                    captured = output.detach();
                    throw StopForward{};
                }
            }

            torch::Tensor captured{};

        private:
            const std::string& name_;
        };
    }

    /*
     * Layer input from the quantization simulation and layer output (before
     * any activation) from the float model, for one calibration batch. Both
     * forward passes stop as soon as the layer is reached.
     */
    class ActivationSampler {
    public:
        ActivationSampler(Model& float_model, Model& quant_model, std::string layer_name)
            : float_model_(float_model), quant_model_(quant_model), layer_name_(std::move(layer_name)) {}

        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> sample(const torch::Tensor& batch)
        {
            torch::NoGradGuard no_grad{};

            detail::CaptureInput input_capture(layer_name_);
            run(quant_model_, batch, input_capture);
            if (!input_capture.captured.defined()) {
                throw std::runtime_error("Layer '" + layer_name_ + "' was not reached in the quantized model.");
            }

            detail::CaptureOutput output_capture(layer_name_);
            run(float_model_, batch, output_capture);
            if (!output_capture.captured.defined()) {
                throw std::runtime_error("Layer '" + layer_name_ + "' was not reached in the float model.");
            }

            return {std::move(input_capture.captured), std::move(output_capture.captured)};
        }

        [[nodiscard]] const std::string& layer_name() const noexcept { return layer_name_; }

    private:
        static void run(Model& model, const torch::Tensor& batch, ForwardObserver& observer)
        {
            try {
                const auto output = model.forward(batch.to(model.device()), &observer);
                (void)output;
            } catch (const StopForward&) {
                return;
            }
        }

        Model& float_model_;
        Model& quant_model_;
        std::string layer_name_;
    };
}

#endif // ROUNDWISE_ADAROUND_DETAILS_SAMPLER_HPP
