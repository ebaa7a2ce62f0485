#include <cmath>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support.hpp"

namespace Adaround = Roundwise::Adaround;
namespace Quantization = Roundwise::Quantization;

namespace {
    Quantization::StaticGridTensorQuantizer grid_quantizer(const Quantization::Encoding& encoding)
    {
        Quantization::QuantizerSettings settings{};
        settings.bitwidth = encoding.bitwidth;
        Quantization::StaticGridTensorQuantizer quantizer(settings);
        quantizer.set_encoding(encoding);
        return quantizer;
    }

    // Values a fixed fraction away from grid points, never close to a tie.
    torch::Tensor off_grid_weight(const Quantization::Encoding& encoding)
    {
        const auto grid = torch::tensor({-5.0, -2.0, 0.0, 3.0, 1.0, -1.0});
        const auto fraction = torch::tensor({0.2, 0.7, 0.3, 0.8, 0.45, 0.55});
        return ((grid + fraction) * encoding.delta).reshape({2, 3});
    }

    Adaround::AdaroundParameters loss_parameters(double reg_param)
    {
        Adaround::AdaroundParameters params{};
        params.num_iterations = 100;
        params.warm_start = 0.2;
        params.reg_param = reg_param;
        return params;
    }

    class AdaroundTest : public ::testing::Test {
    protected:
        Roundwise::Log::ScopedLevel quiet_{Roundwise::Log::Level::Error};
        RoundwiseTest::TemporaryDirectory directory_{};
    };
}

TEST(AdaroundTensorQuantizer, RequiresSourceEncoding) {
    Quantization::StaticGridTensorQuantizer source(Quantization::QuantizerSettings{});
    EXPECT_THROW(Adaround::AdaroundTensorQuantizer{source}, std::logic_error);
}

TEST(AdaroundTensorQuantizer, TakesOverSourceSettings) {
    auto encoding = Quantization::from_range(-1.0, 1.0, 4, true);
    Quantization::QuantizerSettings settings{};
    settings.bitwidth = 4;
    settings.symmetric = true;
    Quantization::StaticGridTensorQuantizer source(settings);
    source.set_encoding(encoding);

    const Adaround::AdaroundTensorQuantizer quantizer(source);
    EXPECT_EQ(quantizer.bitwidth(), 4);
    EXPECT_TRUE(quantizer.is_symmetric());
    EXPECT_EQ(quantizer.encoding()->offset, encoding.offset);
    EXPECT_FALSE(quantizer.initialized());
    EXPECT_TRUE(quantizer.is_soft());
    EXPECT_THROW((void)quantizer.h(), std::logic_error);
}

TEST(AdaroundTensorQuantizer, InitialSoftRoundingReproducesWeight) {
    const auto encoding = Quantization::from_range(-1.0, 1.0, 4, false);
    Adaround::AdaroundTensorQuantizer quantizer(grid_quantizer(encoding));
    const auto weight = off_grid_weight(encoding);
    quantizer.initialize(weight);

    EXPECT_EQ(quantizer.alpha().sizes().vec(), weight.sizes().vec());
    EXPECT_TRUE(quantizer.alpha().requires_grad());
    const auto expected = torch::clamp(weight, encoding.min, encoding.max);
    EXPECT_TRUE(torch::allclose(quantizer.soft_quantize_dequantize(weight), expected, 1e-5, 1e-5));
}

TEST(AdaroundTensorQuantizer, InitialHardRoundingIsRoundToNearest) {
    const auto encoding = Quantization::from_range(-1.0, 1.0, 4, false);
    Adaround::AdaroundTensorQuantizer quantizer(grid_quantizer(encoding));
    const auto weight = off_grid_weight(encoding);
    quantizer.initialize(weight);

    const auto nearest = Quantization::Details::quantize_dequantize(weight, encoding);
    EXPECT_TRUE(torch::allclose(quantizer.hard_quantize_dequantize(weight), nearest, 0.0, 1e-6));
}

TEST(AdaroundTensorQuantizer, ExactTiesRoundUp) {
    // delta = 1/8 keeps every value below exact in float.
    const auto encoding = Quantization::Details::from_delta_offset(0.125, -8, 4);
    Adaround::AdaroundTensorQuantizer quantizer(grid_quantizer(encoding));
    const auto weight = torch::tensor({-2.5, -0.5, 0.5, 2.5, 1.25}) * 0.125;
    quantizer.initialize(weight);

    const auto alpha = quantizer.alpha().detach();
    EXPECT_TRUE(torch::equal(alpha.slice(0, 0, 4), torch::zeros({4}, alpha.options())));
    EXPECT_LT(alpha[4].item<double>(), 0.0);
    const auto expected = torch::tensor({-2.0, 0.0, 1.0, 3.0, 1.0}) * 0.125;
    EXPECT_TRUE(torch::equal(quantizer.nearest_quantize_dequantize(weight), expected));
    EXPECT_TRUE(torch::equal(quantizer.hard_quantize_dequantize(weight), expected));
}

TEST(AdaroundTensorQuantizer, HardRoundingIsIdempotent) {
    torch::manual_seed(5);
    const auto encoding = Quantization::from_range(-0.6, 0.4, 4, false);
    Adaround::AdaroundTensorQuantizer quantizer(grid_quantizer(encoding));
    const auto weight = torch::randn({8, 4, 3, 3}) * 0.3;
    quantizer.initialize(weight);
    {
        torch::NoGradGuard no_grad{};
        quantizer.alpha().add_(torch::randn_like(quantizer.alpha()));
    }

    const auto first = quantizer.hard_quantize_dequantize(weight);
    const auto second = quantizer.hard_quantize_dequantize(weight);
    EXPECT_TRUE(torch::equal(first, second));

    const auto grid = first / encoding.delta;
    EXPECT_LT((grid - torch::round(grid)).abs().max().item<double>(), 1e-3);
    EXPECT_GE(first.min().item<double>(), encoding.min - 1e-6);
    EXPECT_LE(first.max().item<double>(), encoding.max + 1e-6);
}

TEST(AdaroundTensorQuantizer, SoftRoundingIsDifferentiableInAlpha) {
    const auto encoding = Quantization::from_range(-1.0, 1.0, 4, false);
    Adaround::AdaroundTensorQuantizer quantizer(grid_quantizer(encoding));
    const auto weight = off_grid_weight(encoding);
    quantizer.initialize(weight);

    quantizer.soft_quantize_dequantize(weight).sum().backward();
    ASSERT_TRUE(quantizer.alpha().grad().defined());
    EXPECT_GT(quantizer.alpha().grad().abs().sum().item<double>(), 0.0);
}

TEST(AdaroundTensorQuantizer, FreezeSwitchesToHardExactlyOnce) {
    const auto encoding = Quantization::from_range(-1.0, 1.0, 4, false);
    Adaround::AdaroundTensorQuantizer quantizer(grid_quantizer(encoding));
    const auto weight = off_grid_weight(encoding);
    quantizer.initialize(weight);

    quantizer.freeze();
    EXPECT_TRUE(quantizer.frozen());
    EXPECT_FALSE(quantizer.is_soft());
    EXPECT_FALSE(quantizer.alpha().requires_grad());
    EXPECT_TRUE(torch::equal(quantizer.quantize_dequantize(weight), quantizer.hard_quantize_dequantize(weight)));
    EXPECT_THROW(quantizer.freeze(), std::logic_error);
}

TEST(RoundingRegularizer, MaximalAtHalfAndZeroAtEnds) {
    const auto descriptor = Roundwise::Regularization::Rounding({1.0});
    for (const double beta : {2.0, 8.0, 20.0}) {
        const auto at = [&](double h) {
            return Roundwise::Regularization::Details::penalty(descriptor, torch::tensor({h}, torch::kDouble), beta).item<double>();
        };
        EXPECT_DOUBLE_EQ(at(0.0), 0.0);
        EXPECT_DOUBLE_EQ(at(1.0), 0.0);
        EXPECT_DOUBLE_EQ(at(0.5), 1.0);
        EXPECT_LT(at(0.3), at(0.5));
        EXPECT_LT(at(0.9), at(0.5));
    }
}

TEST(RoundingRegularizer, ScalesWithCoefficientAndRejectsBadBeta) {
    const auto h = torch::full({4}, 0.5, torch::kDouble);
    EXPECT_DOUBLE_EQ(Roundwise::Regularization::Details::penalty(Roundwise::Regularization::Rounding({0.25}), h, 2.0).item<double>(), 1.0);
    EXPECT_DOUBLE_EQ(Roundwise::Regularization::Details::penalty(Roundwise::Regularization::Rounding({0.0}), h, 2.0).item<double>(), 0.0);
    EXPECT_THROW((void)Roundwise::Regularization::Details::penalty(Roundwise::Regularization::Rounding({1.0}), h, 0.0),
                 std::invalid_argument);
}

TEST(BetaSchedule, CosineDecaysFromStartToEnd) {
    auto params = loss_parameters(0.01);
    EXPECT_DOUBLE_EQ(Adaround::compute_beta(params, 20), 20.0);
    EXPECT_NEAR(Adaround::compute_beta(params, 40), 2.0 + 9.0 * (1.0 + std::cos(std::numbers::pi / 4.0)), 1e-9);
    EXPECT_NEAR(Adaround::compute_beta(params, 60), 11.0, 1e-9);
    EXPECT_NEAR(Adaround::compute_beta(params, 100), 2.0, 1e-9);
    EXPECT_GT(Adaround::compute_beta(params, 30), Adaround::compute_beta(params, 70));
}

TEST(BetaSchedule, LinearDecaysFromStartToEnd) {
    auto params = loss_parameters(0.01);
    params.beta_schedule = Adaround::BetaSchedule::Linear;
    EXPECT_DOUBLE_EQ(Adaround::compute_beta(params, 20), 20.0);
    EXPECT_NEAR(Adaround::compute_beta(params, 40), 15.5, 1e-9);
    EXPECT_NEAR(Adaround::compute_beta(params, 100), 2.0, 1e-9);
}

TEST(AdaroundLoss, WarmStartIgnoresRegularizationWeight) {
    const auto encoding = Quantization::from_range(-1.0, 1.0, 4, false);
    Adaround::AdaroundTensorQuantizer quantizer(grid_quantizer(encoding));
    const auto weight = off_grid_weight(encoding);
    quantizer.initialize(weight);

    const auto quantized = quantizer.soft_quantize_dequantize(weight);
    const auto target = weight * 1.1;
    const auto light = loss_parameters(0.01);
    const auto heavy = loss_parameters(1000.0);

    for (const std::int64_t iteration : {0, 10, 19}) {
        const auto a = Adaround::compute_total_loss(quantized, target, quantizer, light, iteration);
        const auto b = Adaround::compute_total_loss(quantized, target, quantizer, heavy, iteration);
        EXPECT_EQ(a.rounding.item<double>(), 0.0);
        EXPECT_EQ(a.total.item<double>(), b.total.item<double>());
    }

    const auto a = Adaround::compute_total_loss(quantized, target, quantizer, light, 20);
    const auto b = Adaround::compute_total_loss(quantized, target, quantizer, heavy, 20);
    EXPECT_GT(a.rounding.item<double>(), 0.0);
    EXPECT_GT(b.total.item<double>(), a.total.item<double>());
}

TEST(AdaroundLoss, ReconstructionIsMeanSquaredError) {
    const auto prediction = torch::tensor({1.0, 2.0, 3.0});
    const auto target = torch::tensor({1.0, 0.0, 6.0});
    EXPECT_NEAR(Adaround::compute_recon_loss(prediction, target).item<double>(), (4.0 + 9.0) / 3.0, 1e-6);
    EXPECT_THROW((void)Adaround::compute_recon_loss(prediction, torch::zeros({2})), std::invalid_argument);
}

TEST(AdaroundParameters, ValidateRejectsBadValues) {
    auto params = RoundwiseTest::adaround_parameters(RoundwiseTest::image_batches(1, 1, 1, 2), 10, "unused");
    EXPECT_NO_THROW(params.validate());

    auto bad = params;
    bad.num_batches = 0;
    EXPECT_THROW(bad.validate(), std::invalid_argument);
    bad = params;
    bad.warm_start = 1.0;
    EXPECT_THROW(bad.validate(), std::invalid_argument);
    bad = params;
    bad.beta_range = {2.0, 20.0};
    EXPECT_THROW(bad.validate(), std::invalid_argument);
    bad = params;
    bad.reg_param = -1.0;
    EXPECT_THROW(bad.validate(), std::invalid_argument);
    bad = params;
    bad.data.reset();
    EXPECT_THROW(bad.validate(), std::invalid_argument);
    bad = params;
    bad.optimizer.options.learning_rate = 0.0;
    EXPECT_THROW(bad.validate(), std::invalid_argument);
}

TEST_F(AdaroundTest, SamplerCapturesQuantizedInputAndFloatOutput) {
    auto model = RoundwiseTest::two_conv_model();
    const auto batch = RoundwiseTest::image_batches(1, 2, 3, 8).front();
    Quantization::QuantizationSimModel sim(*model, batch);

    Adaround::ActivationSampler sampler(*model, sim.model(), "conv2d_1");
    const auto [input, target] = sampler.sample(batch);

    torch::NoGradGuard no_grad{};
    const auto& conv0 = model->at("conv2d_0");
    const auto expected_input = torch::relu(conv0(batch));
    const auto expected_target = model->at("conv2d_1")(expected_input);
    EXPECT_TRUE(torch::allclose(input, expected_input));
    EXPECT_TRUE(torch::allclose(target, expected_target));

    Adaround::ActivationSampler missing(*model, sim.model(), "nowhere");
    EXPECT_THROW((void)missing.sample(batch), std::runtime_error);
}

TEST_F(AdaroundTest, OptimizerRequiresAdaroundQuantizer) {
    auto model = RoundwiseTest::two_conv_model();
    const auto batches = RoundwiseTest::image_batches(2, 2, 3, 8);
    Quantization::QuantizationSimModel sim(*model, batches.front());
    sim.compute_param_encodings();
    sim.set_mode(Quantization::WrapperMode::Active);

    auto* wrapper = sim.find_wrapper("conv2d_0");
    ASSERT_NE(wrapper, nullptr);
    EXPECT_THROW((void)Adaround::Details::require_adaround_quantizer(*wrapper, "conv2d_0"), std::logic_error);

    Roundwise::Data::TensorSource source(batches);
    const Roundwise::Data::CachedDataset dataset(source, batches.size(), directory_.path());
    auto params = RoundwiseTest::adaround_parameters(batches, 5, directory_.path());
    Adaround::Details::LayerContext context{*model, sim.model(), sim.model().at("conv2d_0"), *wrapper, std::nullopt};
    EXPECT_THROW((void)Adaround::Details::optimize_layer(context, dataset, params), std::logic_error);
}

TEST_F(AdaroundTest, OptimizeLayerFreezesRoundingOnTheGrid) {
    auto model = RoundwiseTest::two_conv_model();
    const auto batches = RoundwiseTest::image_batches(2, 2, 3, 8);
    Quantization::QuantSimOptions options{};
    options.default_param_bw = 4;
    Quantization::QuantizationSimModel sim(*model, batches.front(), options);
    sim.compute_param_encodings();
    sim.set_mode(Quantization::WrapperMode::Active);

    auto* wrapper = sim.find_wrapper("conv2d_0");
    wrapper->set_param_quantizer("weight", std::make_shared<Adaround::AdaroundTensorQuantizer>(*wrapper->param_quantizer("weight")));

    Roundwise::Data::TensorSource source(batches);
    const Roundwise::Data::CachedDataset dataset(source, batches.size(), directory_.path());
    auto params = RoundwiseTest::adaround_parameters(batches, 20, directory_.path());
    Adaround::Details::LayerContext context{*model, sim.model(), sim.model().at("conv2d_0"), *wrapper, Roundwise::Activation::Type::ReLU};
    const auto report = Adaround::Details::optimize_layer(context, dataset, params);

    EXPECT_EQ(report.name, "conv2d_0");
    EXPECT_EQ(report.bitwidth, 4);
    EXPECT_EQ(report.iterations, 20);
    EXPECT_TRUE(std::isfinite(report.reconstruction));
    EXPECT_GE(report.flipped, 0.0);
    EXPECT_LE(report.flipped, 1.0);

    auto* quantizer = dynamic_cast<Adaround::AdaroundTensorQuantizer*>(wrapper->param_quantizer("weight"));
    ASSERT_NE(quantizer, nullptr);
    EXPECT_TRUE(quantizer->frozen());
    EXPECT_THROW((void)Adaround::Details::require_adaround_quantizer(*wrapper, "conv2d_0"), std::logic_error);

    const auto float_weight = model->at("conv2d_0").weight();
    EXPECT_TRUE(torch::equal(sim.model().at("conv2d_0").weight(), float_weight));
}
