#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support.hpp"

namespace Adaround = Roundwise::Adaround;

namespace {
    class ApplyAdaroundTest : public ::testing::Test {
    protected:
        [[nodiscard]] std::filesystem::path working_dir() const { return directory_.path() / "work"; }

        [[nodiscard]] std::vector<std::string> keys(const Adaround::ParamEncodings& encodings) const
        {
            std::vector<std::string> names;
            for (const auto& [name, entry] : encodings) {
                (void)entry;
                names.push_back(name);
            }
            return names;
        }

        Roundwise::Log::ScopedLevel quiet_{Roundwise::Log::Level::Error};
        RoundwiseTest::TemporaryDirectory directory_{};
    };

    // Source that hands out one batch whose channel count no model here
    // accepts.
    class MismatchedSource final : public Roundwise::Data::Source {
    public:
        std::optional<torch::Tensor> next() override { return torch::randn({8, 5, 32, 32}); }
    };
}

TEST_F(ApplyAdaroundTest, TwoConvModelEndToEnd) {
    auto model = RoundwiseTest::two_conv_model();
    const auto reference = model->clone_model();
    const auto batches = RoundwiseTest::image_batches(10);
    const auto params = RoundwiseTest::adaround_parameters(batches, 100, working_dir());

    Adaround::AdaroundOptions options{};
    options.default_param_bw = 4;
    const auto result = Adaround::apply_adaround(*model, batches.front(), params, directory_.path(), "two_conv", options);

    ASSERT_NE(result, nullptr);
    EXPECT_FALSE(result->has_wrappers());
    EXPECT_NE(result.get(), model.get());
    EXPECT_FALSE(std::filesystem::exists(working_dir()));

    const auto file = Adaround::encodings_path(directory_.path(), "two_conv");
    ASSERT_TRUE(std::filesystem::exists(file));
    const auto encodings = Adaround::load_encodings(file);
    EXPECT_EQ(keys(encodings), (std::vector<std::string>{"conv2d_0.weight", "conv2d_1.weight"}));
    for (const auto& [name, entry] : encodings) {
        EXPECT_EQ(entry.encoding.bitwidth, 4) << name;
        EXPECT_FALSE(entry.is_symmetric) << name;
        EXPECT_EQ(entry.dtype, Roundwise::Quantization::DataType::Int) << name;
        EXPECT_GT(entry.encoding.delta, 0.0) << name;
    }

    torch::NoGradGuard no_grad{};
    for (const std::string layer : {"conv2d_0", "conv2d_1"}) {
        const auto& encoding = encodings.at(layer + ".weight").encoding;
        const auto weight = result->at(layer).weight();
        const auto grid = weight / encoding.delta - static_cast<double>(encoding.offset);
        EXPECT_LT((grid - torch::round(grid)).abs().max().item<double>(), 1e-3) << layer;
        EXPECT_GE(torch::round(grid).min().item<double>(), 0.0) << layer;
        EXPECT_LE(torch::round(grid).max().item<double>(), 15.0) << layer;

        EXPECT_TRUE(torch::equal(model->at(layer).weight(), reference->at(layer).weight())) << layer;
        EXPECT_TRUE(torch::equal(result->at(layer).bias(), reference->at(layer).bias())) << layer;
    }
    EXPECT_FALSE(model->has_wrappers());

    const auto output = result->forward(batches.front());
    EXPECT_EQ(output.sizes().vec(), (std::vector<std::int64_t>{8, 4, 32, 32}));
}

TEST_F(ApplyAdaroundTest, ExcludedLayerKeepsFloatWeightAndHasNoEntry) {
    auto model = RoundwiseTest::three_conv_model();
    const auto batches = RoundwiseTest::image_batches(2, 2, 3, 8);
    const auto params = RoundwiseTest::adaround_parameters(batches, 10, working_dir());

    Adaround::AdaroundOptions options{};
    options.layers_to_exclude = {"conv2d_1"};
    const auto result = Adaround::apply_adaround(*model, batches.front(), params, directory_.path(), "excluded", options);

    const auto encodings = Adaround::load_encodings(Adaround::encodings_path(directory_.path(), "excluded"));
    EXPECT_EQ(keys(encodings), (std::vector<std::string>{"conv2d_0.weight", "conv2d_2.weight"}));
    EXPECT_EQ(encodings.count("conv2d_1.weight"), 0u);
    EXPECT_TRUE(torch::equal(result->at("conv2d_1").weight(), model->at("conv2d_1").weight()));
    EXPECT_FALSE(torch::equal(result->at("conv2d_0").weight(), model->at("conv2d_0").weight()));
}

TEST_F(ApplyAdaroundTest, BitwidthOverrideAppliesToNamedLayerOnly) {
    auto model = RoundwiseTest::three_conv_model();
    const auto batches = RoundwiseTest::image_batches(2, 2, 3, 8);
    const auto params = RoundwiseTest::adaround_parameters(batches, 10, working_dir());

    Adaround::AdaroundOptions options{};
    options.default_param_bw = 4;
    options.param_bw_overrides = {{"conv2d_2", 8}};
    const auto result = Adaround::apply_adaround(*model, batches.front(), params, directory_.path(), "override", options);
    ASSERT_NE(result, nullptr);

    const auto encodings = Adaround::load_encodings(Adaround::encodings_path(directory_.path(), "override"));
    ASSERT_EQ(encodings.size(), 3u);
    EXPECT_EQ(encodings.at("conv2d_0.weight").encoding.bitwidth, 4);
    EXPECT_EQ(encodings.at("conv2d_1.weight").encoding.bitwidth, 4);
    EXPECT_EQ(encodings.at("conv2d_2.weight").encoding.bitwidth, 8);
}

TEST_F(ApplyAdaroundTest, ConfigFileSelectsSymmetricWeights) {
    auto model = RoundwiseTest::two_conv_model();
    const auto batches = RoundwiseTest::image_batches(2, 2, 3, 8);
    const auto params = RoundwiseTest::adaround_parameters(batches, 5, working_dir());

    const auto config = directory_.path() / "config.json";
    {
        std::ofstream stream(config);
        stream << R"({"defaults": {"params": {"is_symmetric": "True"}}})";
    }
    Adaround::AdaroundOptions options{};
    options.config_file = config;
    const auto result = Adaround::apply_adaround(*model, batches.front(), params, directory_.path(), "symmetric", options);
    ASSERT_NE(result, nullptr);

    const auto encodings = Adaround::load_encodings(Adaround::encodings_path(directory_.path(), "symmetric"));
    for (const auto& [name, entry] : encodings) {
        EXPECT_TRUE(entry.is_symmetric) << name;
        EXPECT_EQ(entry.encoding.offset, -8) << name;
    }
}

TEST_F(ApplyAdaroundTest, InvalidRequestsFailBeforeAnyWork) {
    auto model = RoundwiseTest::two_conv_model();
    model->add(Roundwise::Layer::MaxPool2d({{2, 2}, {2, 2}}), "pool");
    const auto batches = RoundwiseTest::image_batches(2, 2, 3, 8);
    const auto params = RoundwiseTest::adaround_parameters(batches, 5, working_dir());
    const auto dummy = batches.front();

    Adaround::AdaroundOptions unknown_exclusion{};
    unknown_exclusion.layers_to_exclude = {"conv2d_9"};
    EXPECT_THROW((void)Adaround::apply_adaround(*model, dummy, params, directory_.path(), "m", unknown_exclusion),
                 std::invalid_argument);

    Adaround::AdaroundOptions unsupported_override{};
    unsupported_override.param_bw_overrides = {{"pool", 8}};
    EXPECT_THROW((void)Adaround::apply_adaround(*model, dummy, params, directory_.path(), "m", unsupported_override),
                 std::invalid_argument);

    Adaround::AdaroundOptions low_bitwidth{};
    low_bitwidth.default_param_bw = 3;
    EXPECT_THROW((void)Adaround::apply_adaround(*model, dummy, params, directory_.path(), "m", low_bitwidth),
                 std::invalid_argument);

    EXPECT_THROW((void)Adaround::apply_adaround(*model, dummy, params, directory_.path() / "absent", "m"),
                 std::invalid_argument);
    EXPECT_THROW((void)Adaround::apply_adaround(*model, dummy, params, directory_.path(), ""),
                 std::invalid_argument);

    EXPECT_FALSE(std::filesystem::exists(working_dir()));
    EXPECT_FALSE(std::filesystem::exists(Adaround::encodings_path(directory_.path(), "m")));
}

TEST_F(ApplyAdaroundTest, WorkingDirectoryRemovedWhenDataRunsShort) {
    auto model = RoundwiseTest::two_conv_model();
    const auto batches = RoundwiseTest::image_batches(2, 2, 3, 8);
    auto params = RoundwiseTest::adaround_parameters(batches, 5, working_dir());
    params.num_batches = 10;

    EXPECT_THROW((void)Adaround::apply_adaround(*model, batches.front(), params, directory_.path(), "short"),
                 std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(working_dir()));
    EXPECT_FALSE(std::filesystem::exists(Adaround::encodings_path(directory_.path(), "short")));
}

TEST_F(ApplyAdaroundTest, WorkingDirectoryRemovedWhenForwardFails) {
    auto model = RoundwiseTest::two_conv_model();
    const auto dummy = RoundwiseTest::image_batches(1).front();
    auto params = RoundwiseTest::adaround_parameters({}, 5, working_dir());
    params.data = std::make_shared<MismatchedSource>();
    params.num_batches = 1;

    EXPECT_THROW((void)Adaround::apply_adaround(*model, dummy, params, directory_.path(), "broken"), c10::Error);
    EXPECT_FALSE(std::filesystem::exists(working_dir()));
    EXPECT_FALSE(model->has_wrappers());
}

TEST_F(ApplyAdaroundTest, WorkingDirectoryMustNotEncloseOutputPath) {
    auto model = RoundwiseTest::two_conv_model();
    const auto batches = RoundwiseTest::image_batches(2, 2, 3, 8);
    const auto output = directory_.path() / "out";
    std::filesystem::create_directories(output);
    std::ofstream(output / "notes.txt") << "keep";

    const auto same = RoundwiseTest::adaround_parameters(batches, 5, output);
    EXPECT_THROW((void)Adaround::apply_adaround(*model, batches.front(), same, output, "same"), std::invalid_argument);

    const auto parent = RoundwiseTest::adaround_parameters(batches, 5, directory_.path());
    EXPECT_THROW((void)Adaround::apply_adaround(*model, batches.front(), parent, output, "parent"), std::invalid_argument);

    const auto trailing = RoundwiseTest::adaround_parameters(batches, 5, output / "");
    EXPECT_THROW((void)Adaround::apply_adaround(*model, batches.front(), trailing, output, "trailing"), std::invalid_argument);

    EXPECT_TRUE(std::filesystem::exists(output / "notes.txt"));
    EXPECT_FALSE(std::filesystem::exists(output / Roundwise::Data::WorkingDirectory::kMarker));
}

TEST_F(ApplyAdaroundTest, WorkingDirectoryInsideOutputPathIsAllowed) {
    auto model = RoundwiseTest::two_conv_model();
    const auto batches = RoundwiseTest::image_batches(2, 2, 3, 8);
    const auto params = RoundwiseTest::adaround_parameters(batches, 5, directory_.path() / "scratch");

    const auto result = Adaround::apply_adaround(*model, batches.front(), params, directory_.path(), "nested");
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(std::filesystem::exists(Adaround::encodings_path(directory_.path(), "nested")));
    EXPECT_FALSE(std::filesystem::exists(directory_.path() / "scratch"));
}

TEST_F(ApplyAdaroundTest, ForeignWorkingDirectoryIsLeftAlone) {
    auto model = RoundwiseTest::two_conv_model();
    const auto batches = RoundwiseTest::image_batches(2, 2, 3, 8);
    std::filesystem::create_directories(working_dir());
    std::ofstream(working_dir() / "dataset.bin") << "user data";
    const auto params = RoundwiseTest::adaround_parameters(batches, 5, working_dir());

    EXPECT_THROW((void)Adaround::apply_adaround(*model, batches.front(), params, directory_.path(), "foreign"),
                 std::invalid_argument);
    EXPECT_TRUE(std::filesystem::exists(working_dir() / "dataset.bin"));
    EXPECT_FALSE(std::filesystem::exists(Adaround::encodings_path(directory_.path(), "foreign")));
}

TEST_F(ApplyAdaroundTest, BitwidthOverrideLeavesQuantizedBiasAtDefault) {
    auto model = RoundwiseTest::three_conv_model();
    const auto dummy = RoundwiseTest::image_batches(1, 2, 3, 8).front();
    const auto config = directory_.path() / "bias.json";
    std::ofstream(config) << R"({"params": {"bias": {"is_quantized": "True"}}})";

    Roundwise::Quantization::QuantSimOptions sim_options{};
    sim_options.default_param_bw = 4;
    sim_options.config_file = config;
    Roundwise::Quantization::QuantizationSimModel sim(*model, dummy, sim_options);

    Adaround::AdaroundOptions options{};
    options.param_bw_overrides = {{"conv2d_2", 8}};
    Adaround::Details::detail::override_param_bitwidths(sim, options);

    for (const std::string layer : {"conv2d_0", "conv2d_2"}) {
        auto* wrapper = sim.find_wrapper(layer);
        ASSERT_NE(wrapper, nullptr) << layer;
        ASSERT_NE(wrapper->param_quantizer("bias"), nullptr) << layer;
        EXPECT_TRUE(wrapper->param_quantizer("bias")->enabled()) << layer;
        EXPECT_EQ(wrapper->param_quantizer("bias")->bitwidth(), 4) << layer;
    }
    EXPECT_EQ(sim.find_wrapper("conv2d_0")->param_quantizer("weight")->bitwidth(), 4);
    EXPECT_EQ(sim.find_wrapper("conv2d_2")->param_quantizer("weight")->bitwidth(), 8);
}

TEST_F(ApplyAdaroundTest, MixedLayerKindsAndUnreachedLayer) {
    torch::manual_seed(0);
    auto model = std::make_shared<Roundwise::Model>("mixed");
    model->add(Roundwise::Layer::Conv2d({3, 4, {3, 3}, {1, 1}, {1, 1}}, Roundwise::Activation::ReLU), "conv");
    model->add(Roundwise::Layer::ConvTranspose2d({4, 2, {2, 2}, {2, 2}}), "up");
    model->add(Roundwise::Layer::Flatten(), "flat");
    model->add(Roundwise::Layer::FC({2 * 16 * 16, 5}), "head");
    model->add_auxiliary(Roundwise::Layer::FC({7, 7}), "spare");

    const auto batches = RoundwiseTest::image_batches(3, 2, 3, 8);
    const auto params = RoundwiseTest::adaround_parameters(batches, 20, working_dir());
    const auto result = Adaround::apply_adaround(*model, batches.front(), params, directory_.path(), "mixed");
    ASSERT_NE(result, nullptr);
    EXPECT_FALSE(result->has_wrappers());

    const auto encodings = Adaround::load_encodings(Adaround::encodings_path(directory_.path(), "mixed"));
    EXPECT_EQ(keys(encodings), (std::vector<std::string>{"conv.weight", "head.weight", "up.weight"}));
    EXPECT_EQ(encodings.count("spare.weight"), 0u);

    torch::NoGradGuard no_grad{};
    for (const std::string layer : {"conv", "up", "head"}) {
        const auto& encoding = encodings.at(layer + ".weight").encoding;
        const auto grid = result->at(layer).weight() / encoding.delta - static_cast<double>(encoding.offset);
        EXPECT_LT((grid - torch::round(grid)).abs().max().item<double>(), 1e-3) << layer;
    }
    EXPECT_TRUE(torch::equal(result->at("spare").weight(), model->at("spare").weight()));
    EXPECT_TRUE(torch::equal(result->at("spare").bias(), model->at("spare").bias()));

    const auto output = result->forward(batches.front());
    EXPECT_EQ(output.sizes().vec(), (std::vector<std::int64_t>{2, 5}));
}
