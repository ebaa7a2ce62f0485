#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>

#include <torch/torch.h>

#include "../include/Roundwise.h"

int main() {
    torch::manual_seed(42);

    auto model = std::make_shared<Roundwise::Model>("SmallCNN");
    model->add(Roundwise::Block::Sequential({
        Roundwise::Layer::Conv2d({3, 16, {3, 3}, {1, 1}, {1, 1}}, Roundwise::Activation::ReLU),
        Roundwise::Layer::Conv2d({16, 16, {3, 3}, {1, 1}, {1, 1}}),
        Roundwise::Layer::Nonlinearity(Roundwise::Activation::ReLU),
        Roundwise::Layer::MaxPool2d({{2, 2}, {2, 2}})
    }), "stem");

    model->add(Roundwise::Block::Residual({
        Roundwise::Layer::Conv2d({16, 32, {3, 3}, {2, 2}, {1, 1}}, Roundwise::Activation::ReLU),
        Roundwise::Layer::Conv2d({32, 32, {3, 3}, {1, 1}, {1, 1}})
    }, {
        .projection = Roundwise::Layer::Conv2d({16, 32, {1, 1}, {2, 2}, {0, 0}})
    }, { .final_activation = Roundwise::Activation::ReLU }), "stage");

    model->add(Roundwise::Layer::AvgPool2d({{8, 8}, {8, 8}}));
    model->add(Roundwise::Layer::Flatten());
    model->add(Roundwise::Layer::FC({32, 10}), "head");

    const std::int64_t N = 512;
    const std::int64_t B = 32;
    const auto images = torch::randn({N, 3, 32, 32});

    Roundwise::Adaround::AdaroundParameters params{};
    params.data = std::make_shared<Roundwise::Data::SplitSource>(images, B);
    params.num_batches = static_cast<std::size_t>(N / B);
    params.num_iterations = 500;
    params.show_progress = true;

    Roundwise::Adaround::AdaroundOptions options{};
    options.default_param_bw = 4;
    options.param_bw_overrides = {{"head", 8}};

    const auto output_dir = std::filesystem::temp_directory_path() / "roundwise_example";
    std::filesystem::create_directories(output_dir);

    const auto dummy_input = torch::randn({1, 3, 32, 32});
    const auto rounded = Roundwise::Adaround::apply_adaround(*model, dummy_input, params, output_dir, "small_cnn", options);

    torch::NoGradGuard no_grad{};
    const auto sample = images.slice(0, 0, B);
    const auto drift = (rounded->forward(sample) - model->forward(sample)).pow(2).mean().item<double>();
    std::cout << "Output MSE after rounding: " << drift << std::endl;
    std::cout << "Encodings: " << Roundwise::Adaround::encodings_path(output_dir, "small_cnn").string() << std::endl;
    return 0;
}
