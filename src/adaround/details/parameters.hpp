#ifndef ROUNDWISE_ADAROUND_DETAILS_PARAMETERS_HPP
#define ROUNDWISE_ADAROUND_DETAILS_PARAMETERS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../../data/data.hpp"
#include "../../optimizer/optimizer.hpp"
#include "../../quantization/quantization.hpp"

namespace Roundwise::Adaround::Details {
    enum class BetaSchedule {
        Cosine,
        Linear,
    };

    enum class Phase {
        WarmStart,
        Annealing,
        Converged,
    };

    [[nodiscard]] constexpr std::string_view phase_name(Phase phase) noexcept {
        switch (phase) {
            case Phase::WarmStart: return "warm start";
            case Phase::Annealing: return "annealing";
            case Phase::Converged: return "converged";
        }
        return "unknown";
    }

    inline constexpr int kMinParamBitwidth = 4;
    inline constexpr int kMaxParamBitwidth = 31;

    struct AdaroundParameters {
        std::shared_ptr<::Roundwise::Data::Source> data{};
        std::size_t num_batches{0};
        std::int64_t num_iterations{10000};
        double reg_param{0.01};
        std::pair<double, double> beta_range{20.0, 2.0};
        double warm_start{0.2};
        BetaSchedule beta_schedule{BetaSchedule::Cosine};
        ::Roundwise::Optimizer::AdamDescriptor optimizer{};
        std::optional<std::filesystem::path> working_dir{};
        bool show_progress{false};

        void validate() const
        {
            auto fail = [](const std::string& what) {
                throw std::invalid_argument("Invalid Adaround parameters: " + what);
            };
            if (!data) {
                fail("a calibration data source is required.");
            }
            if (num_batches == 0) {
                fail("num_batches must be positive.");
            }
            if (num_iterations <= 0) {
                fail("num_iterations must be positive.");
            }
            if (!(reg_param >= 0.0)) {
                fail("reg_param must be non-negative.");
            }
            if (!(warm_start >= 0.0 && warm_start < 1.0)) {
                std::ostringstream message;
                message << "warm_start must lie in [0, 1), got " << warm_start << '.';
                fail(message.str());
            }
            if (!(beta_range.second > 0.0 && beta_range.first >= beta_range.second)) {
                std::ostringstream message;
                message << "beta_range must satisfy start >= end > 0, got (" << beta_range.first << ", "
                        << beta_range.second << ").";
                fail(message.str());
            }
            ::Roundwise::Optimizer::Details::validate(optimizer);
        }

        [[nodiscard]] std::filesystem::path resolved_working_dir() const
        {
            if (working_dir.has_value()) {
                return *working_dir;
            }
            return std::filesystem::temp_directory_path() / "roundwise_adaround";
        }
    };

    // Orchestrator options: parameter bitwidths, exclusions and simulation
    // settings.
    struct AdaroundOptions {
        int default_param_bw{4};
        std::vector<std::pair<std::string, int>> param_bw_overrides{};
        std::vector<std::string> layers_to_exclude{};
        ::Roundwise::Quantization::QuantScheme quant_scheme{::Roundwise::Quantization::QuantScheme::PostTrainingTFEnhanced};
        std::optional<std::filesystem::path> config_file{};
    };

    inline void validate_param_bitwidth(int bitwidth, std::string_view context)
    {
        if (bitwidth < kMinParamBitwidth || bitwidth > kMaxParamBitwidth) {
            std::ostringstream message;
            message << context << " parameter bitwidth must lie in [" << kMinParamBitwidth << ", "
                    << kMaxParamBitwidth << "], got " << bitwidth << '.';
            throw std::invalid_argument(message.str());
        }
    }
}

#endif // ROUNDWISE_ADAROUND_DETAILS_PARAMETERS_HPP
