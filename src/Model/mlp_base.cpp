#include<cmath>
#include<stdexcept>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/mlp_base.hpp"
#include"../../include/Model/modelUtils.hpp"

namespace TrustRegion
{
    MlpBase::MlpBase(unsigned int numInputs,
                     const std::vector<unsigned int> &hiddenSizes,
                     const std::string &activation)
        : NNBase(numInputs, hiddenSizes.empty() ? numInputs : hiddenSizes.back()),
          layers(nullptr)
    {
        if (activation != "tanh" && activation != "relu")
        {
            throw std::invalid_argument("Unknown activation: " + activation);
        }

        layers = torch::nn::Sequential();
        auto inputSize = numInputs;
        for (auto hiddenSize : hiddenSizes)
        {
            if (hiddenSize == 0)
            {
                throw std::invalid_argument("Hidden layers need at least one unit");
            }
            layers->push_back(torch::nn::Linear(inputSize, hiddenSize));
            if (activation == "tanh")
            {
                layers->push_back(torch::nn::Functional(torch::tanh));
            }
            else
            {
                layers->push_back(torch::nn::Functional(torch::relu));
            }
            inputSize = hiddenSize;
        }
        register_module("layers", layers);

        initWeights(layers->named_parameters(), std::sqrt(2.), 0);

        train();
    }

    torch::Tensor MlpBase::forward(torch::Tensor inputs)
    {
        if (layers->is_empty())
        {
            return inputs;
        }
        return layers->forward(inputs);
    }

    TEST_CASE("MlpBase")
    {
        SUBCASE("Output has the width of the last hidden layer")
        {
            auto base = MlpBase(5, {16, 10});
            auto outputs = base.forward(torch::rand({4, 5}));

            CHECK(base.getNumInputs() == 5);
            CHECK(base.getOutputSize() == 10);
            CHECK(outputs.sizes().vec() == std::vector<int64_t>{4, 10});
        }

        SUBCASE("tanh activations are bounded")
        {
            auto base = MlpBase(3, {8}, "tanh");
            auto outputs = base.forward(torch::randn({32, 3}) * 100);
            CHECK(outputs.abs().max().item().toDouble() <= 1.0);
        }

        SUBCASE("relu activations are non-negative")
        {
            auto base = MlpBase(3, {8}, "relu");
            auto outputs = base.forward(torch::randn({32, 3}));
            CHECK(outputs.min().item().toDouble() >= 0.0);
        }

        SUBCASE("No hidden layers passes observations through")
        {
            auto base = MlpBase(3, {});
            auto inputs = torch::randn({2, 3});
            CHECK(base.getOutputSize() == 3);
            CHECK(torch::equal(base.forward(inputs), inputs));
        }

        SUBCASE("Unknown activation throws")
        {
            CHECK_THROWS_AS(MlpBase(3, {8}, "sigmoid"), std::invalid_argument);
        }
    }
}
