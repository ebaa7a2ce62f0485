#ifndef ROUNDWISE_QUANTIZATION_DETAILS_TENSOR_QUANTIZER_HPP
#define ROUNDWISE_QUANTIZATION_DETAILS_TENSOR_QUANTIZER_HPP

#include <algorithm>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "encoding.hpp"
#include "histogram.hpp"

namespace Roundwise::Quantization::Details {
    struct QuantizerSettings {
        int bitwidth{8};
        QuantScheme scheme{QuantScheme::PostTrainingTFEnhanced};
        bool symmetric{false};
        bool enabled{true};
        DataType data_type{DataType::Int};
    };

    class TensorQuantizer {
    public:
        explicit TensorQuantizer(QuantizerSettings settings) : settings_(settings)
        {
            validate_bitwidth(settings_.bitwidth, "Quantizer");
        }

        virtual ~TensorQuantizer() = default;

        virtual torch::Tensor quantize_dequantize(const torch::Tensor& tensor) = 0;

        [[nodiscard]] const QuantizerSettings& settings() const noexcept { return settings_; }
        [[nodiscard]] int bitwidth() const noexcept { return settings_.bitwidth; }
        [[nodiscard]] QuantScheme scheme() const noexcept { return settings_.scheme; }
        [[nodiscard]] bool is_symmetric() const noexcept { return settings_.symmetric; }
        [[nodiscard]] bool enabled() const noexcept { return settings_.enabled; }
        [[nodiscard]] DataType data_type() const noexcept { return settings_.data_type; }
        [[nodiscard]] const std::optional<Encoding>& encoding() const noexcept { return encoding_; }

        // A new bitwidth or symmetry invalidates the current encoding.
        void set_bitwidth(int bitwidth)
        {
            validate_bitwidth(bitwidth, "Quantizer");
            settings_.bitwidth = bitwidth;
            encoding_.reset();
        }

        void set_symmetric(bool symmetric)
        {
            settings_.symmetric = symmetric;
            encoding_.reset();
        }

        void set_enabled(bool enabled) noexcept { settings_.enabled = enabled; }

        void set_encoding(const Encoding& encoding)
        {
            if (encoding.bitwidth != settings_.bitwidth) {
                throw std::invalid_argument("Encoding bitwidth " + std::to_string(encoding.bitwidth)
                                            + " does not match quantizer bitwidth " + std::to_string(settings_.bitwidth) + ".");
            }
            encoding_ = encoding;
        }

    protected:
        [[nodiscard]] const Encoding& require_encoding() const
        {
            if (!encoding_.has_value()) {
                throw std::logic_error("Quantizer is enabled but has no encoding; compute encodings first.");
            }
            return *encoding_;
        }

        QuantizerSettings settings_;
        std::optional<Encoding> encoding_{};
    };

    // Round-to-nearest quantizer whose grid is derived from observed tensor
    // statistics.
    class StaticGridTensorQuantizer final : public TensorQuantizer {
    public:
        explicit StaticGridTensorQuantizer(QuantizerSettings settings, SqnrSearchOptions search = {})
            : TensorQuantizer(settings), search_(search), histogram_(search.num_bins) {}

        void reset_encoding_stats()
        {
            histogram_.reset();
            min_ = std::numeric_limits<double>::max();
            max_ = std::numeric_limits<double>::lowest();
            observed_ = false;
        }

        void update_encoding_stats(const torch::Tensor& tensor)
        {
            if (!tensor.defined() || tensor.numel() == 0) {
                return;
            }
            torch::NoGradGuard no_grad{};
            if (settings_.scheme == QuantScheme::PostTrainingTFEnhanced) {
                histogram_.collect(tensor);
            }
            const auto values = tensor.detach();
            min_ = std::min(min_, values.min().item<double>());
            max_ = std::max(max_, values.max().item<double>());
            observed_ = true;
        }

        // Leaves the encoding untouched when no statistics were collected.
        void compute_encoding()
        {
            if (!observed_) {
                return;
            }
            if (settings_.scheme == QuantScheme::PostTrainingTFEnhanced) {
                encoding_ = search_encoding(histogram_, settings_.bitwidth, settings_.symmetric, search_);
            } else {
                encoding_ = from_range(min_, max_, settings_.bitwidth, settings_.symmetric);
            }
        }

        [[nodiscard]] bool has_stats() const noexcept { return observed_; }

        torch::Tensor quantize_dequantize(const torch::Tensor& tensor) override
        {
            if (!settings_.enabled) {
                return tensor;
            }
            return ::Roundwise::Quantization::Details::quantize_dequantize(tensor, require_encoding());
        }

    private:
        SqnrSearchOptions search_;
        Histogram histogram_;
        double min_{std::numeric_limits<double>::max()};
        double max_{std::numeric_limits<double>::lowest()};
        bool observed_{false};
    };
}

#endif // ROUNDWISE_QUANTIZATION_DETAILS_TENSOR_QUANTIZER_HPP
