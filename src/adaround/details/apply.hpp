#ifndef ROUNDWISE_ADAROUND_DETAILS_APPLY_HPP
#define ROUNDWISE_ADAROUND_DETAILS_APPLY_HPP

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/graph.hpp"
#include "../../data/data.hpp"
#include "../../network.hpp"
#include "../../quantization/quantization.hpp"
#include "../../utils/log.hpp"
#include "../../utils/terminal.hpp"
#include "encodings.hpp"
#include "optimizer.hpp"
#include "parameters.hpp"
#include "tensor_quantizer.hpp"

namespace Roundwise::Adaround::Details {
    namespace detail {
        // True when `outer` is `inner` or one of its parent directories.
        [[nodiscard]] inline bool encloses(const std::filesystem::path& outer, const std::filesystem::path& inner)
        {
            auto normal = [](const std::filesystem::path& value) {
                auto result = std::filesystem::weakly_canonical(std::filesystem::absolute(value));
                return result.has_filename() ? result : result.parent_path();
            };
            const auto outer_path = normal(outer);
            const auto inner_path = normal(inner);
            return std::mismatch(outer_path.begin(), outer_path.end(), inner_path.begin(), inner_path.end()).first
                   == outer_path.end();
        }

        // Every name the caller refers to must exist before any work starts.
        inline void validate_request(const Model& model,
                                     const AdaroundParameters& params,
                                     const std::filesystem::path& path,
                                     const std::string& filename_prefix,
                                     const AdaroundOptions& options)
        {
            params.validate();
            validate_param_bitwidth(options.default_param_bw, "Default");

            if (filename_prefix.empty()) {
                throw std::invalid_argument("Encodings filename prefix must not be empty.");
            }
            if (!std::filesystem::is_directory(path)) {
                throw std::invalid_argument("Encodings output path '" + path.string() + "' is not a directory.");
            }
            const auto working_dir = params.resolved_working_dir();
            if (encloses(working_dir, path)) {
                throw std::invalid_argument("Working directory '" + working_dir.string()
                                            + "' must not be or contain the encodings output path '" + path.string() + "'.");
            }

            for (const auto& [name, bitwidth] : options.param_bw_overrides) {
                const auto* layer = model.find(name);
                if (layer == nullptr) {
                    throw std::invalid_argument("Bitwidth override names unknown layer '" + name + "'.");
                }
                if (!layer->is_weighted()) {
                    throw std::invalid_argument("Bitwidth override on '" + name + "' which is a "
                                                + std::string(::Roundwise::Layer::kind_name(layer->kind))
                                                + " layer; only Conv2d, ConvTranspose2d and Linear layers are supported.");
                }
                validate_param_bitwidth(bitwidth, "Override of '" + name + "':");
            }
            for (const auto& name : options.layers_to_exclude) {
                if (model.find(name) == nullptr) {
                    throw std::invalid_argument("Exclusion names unknown layer '" + name + "'.");
                }
            }
        }

        inline void override_param_bitwidths(::Roundwise::Quantization::QuantizationSimModel& sim,
                                             const AdaroundOptions& options)
        {
            for (const auto& [name, bitwidth] : options.param_bw_overrides) {
                auto* wrapper = sim.find_wrapper(name);
                if (wrapper == nullptr) {
                    continue;
                }
                // Only the weight; a quantized bias keeps the default bitwidth.
                auto* weight_quantizer = wrapper->param_quantizer("weight");
                if (weight_quantizer == nullptr) {
                    continue;
                }
                weight_quantizer->set_bitwidth(bitwidth);
                ::Roundwise::Log::info(::Roundwise::Log::Area::kQuant, "Weight bitwidth of '", name, "' set to ", bitwidth, '.');
            }
        }

        // Parameter encodings only; activations stay in float.
        inline void prepare_param_quantization(::Roundwise::Quantization::QuantizationSimModel& sim)
        {
            sim.compute_param_encodings();
            for (auto& [layer, wrapper] : sim.wrappers()) {
                (void)layer;
                wrapper->input_quantizer().set_enabled(false);
                wrapper->output_quantizer().set_enabled(false);
            }
            sim.set_mode(::Roundwise::Quantization::WrapperMode::Active);
        }

        // Hard-rounded weights written back with one assignment per layer.
        inline std::size_t commit_rounded_weights(::Roundwise::Quantization::QuantizationSimModel& sim)
        {
            torch::NoGradGuard no_grad{};
            std::size_t committed = 0;
            for (const auto& [layer, wrapper] : sim.wrappers()) {
                auto* quantizer = dynamic_cast<AdaroundTensorQuantizer*>(wrapper->param_quantizer("weight"));
                if (quantizer == nullptr || !quantizer->frozen()) {
                    continue;
                }
                auto weight = layer->weight();
                weight.set_data(quantizer->hard_quantize_dequantize(weight));
                ++committed;
            }
            return committed;
        }

        inline void log_summary(const std::vector<LayerReport>& reports)
        {
            if (reports.empty() || !::Roundwise::Log::enabled(::Roundwise::Log::Level::Info)) {
                return;
            }
            std::vector<std::vector<std::string>> rows;
            rows.reserve(reports.size());
            for (const auto& report : reports) {
                auto format = [](double value, int precision) {
                    std::ostringstream stream;
                    stream << std::setprecision(precision) << value;
                    return stream.str();
                };
                rows.push_back({report.name,
                                std::to_string(report.bitwidth),
                                std::to_string(report.iterations),
                                format(report.reconstruction, 5),
                                format(report.flipped * 100.0, 3) + "%"});
            }
            std::ostringstream table;
            for (const auto& line : ::Roundwise::Utils::Terminal::Table({"Layer", "Bits", "Iterations", "Recon MSE", "Flipped"}, rows)) {
                table << '\n' << line;
            }
            ::Roundwise::Log::info(::Roundwise::Log::Area::kQuant, "Adaround summary:", table.str());
        }
    }

    /*
     * Returns a copy of `model` whose Conv2d, ConvTranspose2d and Linear weights
     * carry optimized rounding, and writes their encodings to
     * "<path>/<filename_prefix>.encodings". `model` itself is left untouched.
     *
     * Layers are optimized in execution order: each layer sees inputs produced
     * by already rounded predecessors in the simulation and targets produced by
     * the float model. Excluded layers stay in float and have no entry in the
     * encodings file.
     */
    [[nodiscard]] inline std::shared_ptr<Model> apply_adaround(Model& model,
                                                               const torch::Tensor& dummy_input,
                                                               const AdaroundParameters& params,
                                                               const std::filesystem::path& path,
                                                               const std::string& filename_prefix,
                                                               const AdaroundOptions& options = {})
    {
        detail::validate_request(model, params, path, filename_prefix, options);

        ::Roundwise::Quantization::QuantSimOptions sim_options{};
        sim_options.quant_scheme = options.quant_scheme;
        sim_options.default_param_bw = options.default_param_bw;
        sim_options.config_file = options.config_file;
        ::Roundwise::Quantization::QuantizationSimModel sim(model, dummy_input, sim_options);

        detail::override_param_bitwidths(sim, options);
        sim.exclude_layers_from_quantization(options.layers_to_exclude);
        detail::prepare_param_quantization(sim);

        const auto nodes = ::Roundwise::Graph::trace(model, dummy_input);

        std::vector<LayerReport> reports;
        {
            ::Roundwise::Data::WorkingDirectory working_directory(params.resolved_working_dir());
            const ::Roundwise::Data::CachedDataset dataset(*params.data, params.num_batches, working_directory.path());

            for (const auto& node : nodes) {
                const auto& name = node.layer->name;
                auto* wrapper = sim.find_wrapper(name);
                if (wrapper == nullptr) {
                    ::Roundwise::Log::debug(::Roundwise::Log::Area::kQuant, "Skipping excluded layer '", name, "'.");
                    continue;
                }
                auto* weight_quantizer = wrapper->param_quantizer("weight");
                if (weight_quantizer == nullptr || !weight_quantizer->enabled()) {
                    ::Roundwise::Log::warning(::Roundwise::Log::Area::kQuant,
                                              "Weight of '", name, "' is not quantized; skipping.");
                    continue;
                }

                wrapper->set_param_quantizer("weight", std::make_shared<AdaroundTensorQuantizer>(*weight_quantizer));
                ::Roundwise::Log::info(::Roundwise::Log::Area::kQuant, "Started optimizing weight rounding of '", name, "'.");

                LayerContext context{model, sim.model(), sim.model().at(name), *wrapper, node.activation};
                reports.push_back(optimize_layer(context, dataset, params));
            }
        }

        const auto committed = detail::commit_rounded_weights(sim);
        export_encodings(path, filename_prefix, sim);
        detail::log_summary(reports);

        auto result = sim.remove_wrappers();
        ::Roundwise::Log::info(::Roundwise::Log::Area::kQuant, "Completed Adarounding model '", result->name(),
                               "' (", committed, " layers).");
        return result;
    }
}

#endif // ROUNDWISE_ADAROUND_DETAILS_APPLY_HPP
