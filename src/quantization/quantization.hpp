#ifndef ROUNDWISE_QUANTIZATION_HPP
#define ROUNDWISE_QUANTIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/config.hpp"
#include "details/encoding.hpp"
#include "details/histogram.hpp"
#include "details/quantsim.hpp"
#include "details/tensor_quantizer.hpp"
#include "details/wrapper.hpp"

namespace Roundwise::Quantization {
    using QuantScheme = Details::QuantScheme;
    using DataType = Details::DataType;
    using Encoding = Details::Encoding;

    using QuantizerSettings = Details::QuantizerSettings;
    using TensorQuantizer = Details::TensorQuantizer;
    using StaticGridTensorQuantizer = Details::StaticGridTensorQuantizer;
    using SqnrSearchOptions = Details::SqnrSearchOptions;

    using WrapperMode = Details::WrapperMode;
    using QuantizeWrapper = Details::QuantizeWrapper;

    using QuantConfig = Details::QuantConfig;
    using QuantSimOptions = Details::QuantSimOptions;
    using QuantizationSimModel = Details::QuantizationSimModel;

    using Details::dtype_name;
    using Details::from_range;
    using Details::load_config;
    using Details::parse_config;
    using Details::scheme_name;
}

#endif //ROUNDWISE_QUANTIZATION_HPP
