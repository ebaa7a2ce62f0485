#ifndef ROUNDWISE_TEST_SUPPORT_HPP
#define ROUNDWISE_TEST_SUPPORT_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Roundwise.h"

namespace RoundwiseTest {
    // Scratch directory named after the running test, removed on scope exit.
    class TemporaryDirectory {
    public:
        TemporaryDirectory()
        {
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            std::string name = "roundwise_test";
            if (info != nullptr) {
                name += std::string("_") + info->test_suite_name() + "_" + info->name();
            }
            path_ = std::filesystem::temp_directory_path() / name;
            std::filesystem::remove_all(path_);
            std::filesystem::create_directories(path_);
        }

        ~TemporaryDirectory()
        {
            std::error_code error;
            std::filesystem::remove_all(path_, error);
        }

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    // conv(3 -> 8, ReLU) -> conv(8 -> 4); names "conv2d_0", "conv2d_1".
    inline std::shared_ptr<Roundwise::Model> two_conv_model()
    {
        torch::manual_seed(0);
        auto model = std::make_shared<Roundwise::Model>("two_conv");
        model->add(Roundwise::Layer::Conv2d({3, 8, {3, 3}, {1, 1}, {1, 1}}, Roundwise::Activation::ReLU));
        model->add(Roundwise::Layer::Conv2d({8, 4, {3, 3}, {1, 1}, {1, 1}}));
        return model;
    }

    // conv -> conv -> conv, all 3 -> 3 channels; names "conv2d_0".."conv2d_2".
    inline std::shared_ptr<Roundwise::Model> three_conv_model()
    {
        torch::manual_seed(0);
        auto model = std::make_shared<Roundwise::Model>("three_conv");
        model->add(Roundwise::Layer::Conv2d({3, 3, {3, 3}, {1, 1}, {1, 1}}, Roundwise::Activation::ReLU));
        model->add(Roundwise::Layer::Conv2d({3, 3, {3, 3}, {1, 1}, {1, 1}}, Roundwise::Activation::ReLU));
        model->add(Roundwise::Layer::Conv2d({3, 3, {3, 3}, {1, 1}, {1, 1}}));
        return model;
    }

    inline std::vector<torch::Tensor> image_batches(std::size_t count, std::int64_t batch_size = 8,
                                                    std::int64_t channels = 3, std::int64_t side = 32)
    {
        torch::manual_seed(1);
        std::vector<torch::Tensor> batches;
        for (std::size_t index = 0; index < count; ++index) {
            batches.push_back(torch::randn({batch_size, channels, side, side}));
        }
        return batches;
    }

    inline Roundwise::Adaround::AdaroundParameters adaround_parameters(std::vector<torch::Tensor> batches,
                                                                       std::int64_t iterations,
                                                                       const std::filesystem::path& working_dir)
    {
        Roundwise::Adaround::AdaroundParameters params{};
        params.num_batches = batches.size();
        params.data = std::make_shared<Roundwise::Data::TensorSource>(std::move(batches));
        params.num_iterations = iterations;
        params.working_dir = working_dir;
        return params;
    }
}

#endif // ROUNDWISE_TEST_SUPPORT_HPP
