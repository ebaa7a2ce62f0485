#ifndef ROUNDWISE_ADAROUND_HPP
#define ROUNDWISE_ADAROUND_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/apply.hpp"
#include "details/encodings.hpp"
#include "details/loss.hpp"
#include "details/optimizer.hpp"
#include "details/parameters.hpp"
#include "details/sampler.hpp"
#include "details/tensor_quantizer.hpp"

namespace Roundwise::Adaround {
    using AdaroundParameters = Details::AdaroundParameters;
    using AdaroundOptions = Details::AdaroundOptions;
    using BetaSchedule = Details::BetaSchedule;
    using Phase = Details::Phase;

    using AdaroundTensorQuantizer = Details::AdaroundTensorQuantizer;
    using ActivationSampler = Details::ActivationSampler;
    using LossTerms = Details::LossTerms;
    using LayerReport = Details::LayerReport;
    using ParamEncoding = Details::ParamEncoding;
    using ParamEncodings = Details::ParamEncodings;

    using Details::apply_adaround;
    using Details::compute_beta;
    using Details::compute_recon_loss;
    using Details::compute_round_loss;
    using Details::compute_total_loss;
    using Details::encodings_path;
    using Details::load_encodings;
}

#endif //ROUNDWISE_ADAROUND_HPP
