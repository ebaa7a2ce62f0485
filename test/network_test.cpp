#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support.hpp"

namespace {
    using Roundwise::Activation::Type;

    std::shared_ptr<Roundwise::Model> classifier()
    {
        torch::manual_seed(0);
        auto model = std::make_shared<Roundwise::Model>("classifier");
        model->add(Roundwise::Layer::Conv2d({3, 4, {3, 3}, {1, 1}, {1, 1}}, Roundwise::Activation::ReLU));
        model->add(Roundwise::Layer::Conv2d({4, 4, {3, 3}, {1, 1}, {1, 1}}));
        model->add(Roundwise::Layer::Nonlinearity(Roundwise::Activation::Sigmoid));
        model->add(Roundwise::Layer::AvgPool2d({{2, 2}, {2, 2}}));
        model->add(Roundwise::Layer::Flatten());
        model->add(Roundwise::Layer::FC({4 * 4 * 4, 5}));
        return model;
    }

    std::shared_ptr<Roundwise::Model> residual_model()
    {
        torch::manual_seed(0);
        auto model = std::make_shared<Roundwise::Model>("residual");
        model->add(Roundwise::Layer::Conv2d({3, 4, {3, 3}, {1, 1}, {1, 1}}), "stem");
        model->add(Roundwise::Block::Residual({
                       Roundwise::Layer::Conv2d({4, 4, {3, 3}, {1, 1}, {1, 1}}),
                       Roundwise::Layer::Nonlinearity(Roundwise::Activation::ReLU),
                       Roundwise::Layer::Conv2d({4, 4, {3, 3}, {1, 1}, {1, 1}}),
                   }, {}, {Roundwise::Activation::ReLU}),
                   "res");
        model->add(Roundwise::Layer::ConvTranspose2d({4, 2, {2, 2}, {2, 2}}), "up");
        return model;
    }
}

TEST(Model, DefaultNamesFollowKindAndPosition) {
    auto model = classifier();
    std::vector<std::string> names;
    for (const auto* layer : static_cast<const Roundwise::Model&>(*model).layers()) {
        names.push_back(layer->name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"conv2d_0", "conv2d_1", "activation_2", "pool_3", "flatten_4", "fc_5"}));
    EXPECT_EQ(model->at("fc_5").kind, Roundwise::Layer::Kind::Linear);
    EXPECT_TRUE(model->at("conv2d_0").is_weighted());
    EXPECT_FALSE(model->at("pool_3").is_weighted());
}

TEST(Model, BlockLayersAreNamedHierarchically) {
    auto model = std::make_shared<Roundwise::Model>();
    model->add(Roundwise::Block::Sequential({
                   Roundwise::Layer::FC({4, 8}, Roundwise::Activation::ReLU),
                   Roundwise::Layer::FC({8, 2}),
               }),
               "features");
    model->add(Roundwise::Block::Residual({Roundwise::Layer::FC({2, 3})},
                                          {Roundwise::Layer::FC({2, 3})}));

    EXPECT_NE(model->find("features.0"), nullptr);
    EXPECT_NE(model->find("features.1"), nullptr);
    EXPECT_NE(model->find("block_1.0"), nullptr);
    EXPECT_NE(model->find("block_1.projection"), nullptr);
    EXPECT_EQ(model->find("features"), nullptr);

    const auto output = model->forward(torch::randn({5, 4}));
    EXPECT_EQ(output.sizes().vec(), (std::vector<std::int64_t>{5, 3}));
}

TEST(Model, DuplicateAndUnknownNamesThrow) {
    auto model = std::make_shared<Roundwise::Model>();
    model->add(Roundwise::Layer::FC({4, 4}), "dense");
    EXPECT_THROW(model->add(Roundwise::Layer::FC({4, 4}), "dense"), std::invalid_argument);
    EXPECT_THROW(model->add(Roundwise::Block::Sequential({Roundwise::Layer::FC({4, 4})}), "dense"), std::invalid_argument);
    EXPECT_THROW((void)model->at("missing"), std::invalid_argument);
    EXPECT_EQ(model->find("missing"), nullptr);
}

TEST(Model, AuxiliaryLayersAreRegisteredButNotRun) {
    auto model = std::make_shared<Roundwise::Model>();
    model->add(Roundwise::Layer::FC({4, 2}), "head");
    model->add_auxiliary(Roundwise::Layer::FC({100, 100}), "unused");

    EXPECT_NE(model->find("unused"), nullptr);
    EXPECT_EQ(model->forward(torch::randn({3, 4})).size(1), 2);
    EXPECT_EQ(model->parameters().size(), 4u);
}

TEST(Model, ResidualShapeMismatchThrows) {
    auto model = std::make_shared<Roundwise::Model>();
    model->add(Roundwise::Block::Residual({Roundwise::Layer::FC({4, 3})}));
    EXPECT_THROW((void)model->forward(torch::randn({2, 4})), std::runtime_error);
}

TEST(Model, CloneCopiesValuesButNotStorage) {
    auto model = classifier();
    auto copy = model->clone_model();
    const auto input = torch::randn({2, 3, 8, 8});

    torch::NoGradGuard no_grad{};
    EXPECT_EQ(copy->name(), model->name());
    EXPECT_EQ(copy->size(), model->size());
    EXPECT_TRUE(torch::equal(copy->forward(input), model->forward(input)));

    copy->at("conv2d_0").weight().add_(1.0);
    EXPECT_FALSE(torch::equal(copy->at("conv2d_0").weight(), model->at("conv2d_0").weight()));
}

TEST(Model, CloneDropsWrappers) {
    class Doubling final : public Roundwise::LayerWrapper {
    public:
        torch::Tensor forward(const Roundwise::RegisteredLayer& layer, const torch::Tensor& input) override
        {
            return layer.forward(input) * 2.0;
        }
    };

    auto model = std::make_shared<Roundwise::Model>();
    model->add(Roundwise::Layer::FC({4, 2}), "head");
    const auto input = torch::randn({3, 4});
    torch::NoGradGuard no_grad{};
    const auto plain = model->forward(input);

    model->at("head").wrapper = std::make_shared<Doubling>();
    EXPECT_TRUE(model->has_wrappers());
    EXPECT_TRUE(torch::allclose(model->forward(input), plain * 2.0));

    const auto copy = model->clone_model();
    EXPECT_FALSE(copy->has_wrappers());
    EXPECT_TRUE(torch::allclose(copy->forward(input), plain));
}

TEST(Graph, ExecutionOrderListsWeightedLayersOnly) {
    auto model = classifier();
    const auto order = Roundwise::Graph::ordered_layers(*model, torch::randn({1, 3, 8, 8}));
    EXPECT_EQ(order, (std::vector<std::string>{"conv2d_0", "conv2d_1", "fc_5"}));
}

TEST(Graph, PairsFusedAndStandaloneActivations) {
    auto model = classifier();
    const auto pairs = Roundwise::Graph::module_activation_pairs(*model, torch::randn({1, 3, 8, 8}));

    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs.at("conv2d_0"), std::optional<Type>(Type::ReLU));
    EXPECT_EQ(pairs.at("conv2d_1"), std::optional<Type>(Type::Sigmoid));
    EXPECT_EQ(pairs.at("fc_5"), std::nullopt);
}

TEST(Graph, ResidualFanOutHasNoActivation) {
    auto model = residual_model();
    const auto input = torch::randn({1, 3, 8, 8});

    const auto order = Roundwise::Graph::ordered_layers(*model, input);
    EXPECT_EQ(order, (std::vector<std::string>{"stem", "res.0", "res.2", "up"}));

    const auto pairs = Roundwise::Graph::module_activation_pairs(*model, input);
    EXPECT_EQ(pairs.at("stem"), std::nullopt);
    EXPECT_EQ(pairs.at("res.0"), std::optional<Type>(Type::ReLU));
    EXPECT_EQ(pairs.at("res.2"), std::nullopt);
    EXPECT_EQ(pairs.at("up"), std::nullopt);
}

TEST(Graph, UnreachedLayersAreNotTraced) {
    auto model = std::make_shared<Roundwise::Model>();
    model->add(Roundwise::Layer::FC({4, 2}), "head");
    model->add_auxiliary(Roundwise::Layer::FC({4, 2}), "spare");
    const auto order = Roundwise::Graph::ordered_layers(*model, torch::randn({1, 4}));
    EXPECT_EQ(order, (std::vector<std::string>{"head"}));
}
