#include<memory>
#include<stdexcept>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/OutputLayers.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/Distribution/Categorical.hpp"
#include"../../include/Distribution/Normal.hpp"

namespace TrustRegion
{
    CategoricalOutput::CategoricalOutput(unsigned int numInputs, unsigned int numOutputs)
        : linear(numInputs, numOutputs),
          numOutputs(numOutputs)
    {
        register_module("linear", linear);
        initWeights(linear->named_parameters(), 0.01, 0);
    }

    std::unique_ptr<Distribution> CategoricalOutput::forward(torch::Tensor x)
    {
        x = linear(x);
        return std::make_unique<Categorical>(nullptr, &x);
    }

    std::unique_ptr<Distribution> CategoricalOutput::fromParameters(torch::Tensor parameters) const
    {
        if (parameters.size(-1) != static_cast<int64_t>(numOutputs))
        {
            throw std::invalid_argument("Categorical snapshot has " + std::to_string(parameters.size(-1)) +
                                        " columns, expected " + std::to_string(numOutputs));
        }
        return std::make_unique<Categorical>(nullptr, &parameters);
    }

    NormalOutput::NormalOutput(unsigned int numInputs, unsigned int numOutputs, double initialLogStd)
        : linearLoc(numInputs, numOutputs),
          numOutputs(numOutputs)
    {
        register_module("linearLoc", linearLoc);
        scaleLog = register_parameter("scaleLog", torch::full({numOutputs}, initialLogStd));
        initWeights(linearLoc->named_parameters(), 1, 0);
    }

    std::unique_ptr<Distribution> NormalOutput::forward(torch::Tensor x)
    {
        auto loc = linearLoc(x);
        auto scale = scaleLog.exp();
        return std::make_unique<Normal>(loc, scale);
    }

    std::unique_ptr<Distribution> NormalOutput::fromParameters(torch::Tensor parameters) const
    {
        if (parameters.size(-1) != 2 * static_cast<int64_t>(numOutputs))
        {
            throw std::invalid_argument("Normal snapshot has " + std::to_string(parameters.size(-1)) +
                                        " columns, expected " + std::to_string(2 * numOutputs));
        }
        return std::make_unique<Normal>(parameters.narrow(-1, 0, numOutputs),
                                        parameters.narrow(-1, numOutputs, numOutputs));
    }

    TEST_CASE("CategoricalOutput")
    {
        auto outputLayer = CategoricalOutput(3, 5);
        auto inputs = torch::rand({2, 3});
        auto dist = outputLayer.forward(inputs);

        SUBCASE("One sampled action per observation")
        {
            CHECK(dist->sample().sizes().vec() == std::vector<int64_t>{2});
        }

        SUBCASE("Snapshot round trip reproduces the distribution")
        {
            CHECK(outputLayer.numDistributionParameters() == 5);
            auto rebuilt = outputLayer.fromParameters(dist->flatParameters().detach());
            CHECK(rebuilt->klDivergence(*dist).abs().max().item().toDouble() < 1e-6);
        }

        SUBCASE("Wrong snapshot width throws")
        {
            CHECK_THROWS_AS(outputLayer.fromParameters(torch::zeros({2, 4})), std::invalid_argument);
        }
    }

    TEST_CASE("NormalOutput")
    {
        auto outputLayer = NormalOutput(3, 5, -0.5);
        auto inputs = torch::rand({2, 3});
        auto dist = outputLayer.forward(inputs);

        SUBCASE("Samples have the action dimensionality")
        {
            CHECK(dist->sample().sizes().vec() == std::vector<int64_t>{2, 5});
        }

        SUBCASE("Initial standard deviation follows the log std")
        {
            auto parameters = dist->flatParameters();
            CHECK(parameters.sizes().vec() == std::vector<int64_t>{2, 10});
            CHECK(parameters[0][7].item().toDouble() == doctest::Approx(std::exp(-0.5)));
        }

        SUBCASE("Snapshot round trip reproduces the distribution")
        {
            CHECK(outputLayer.numDistributionParameters() == 10);
            auto rebuilt = outputLayer.fromParameters(dist->flatParameters().detach());
            CHECK(rebuilt->klDivergence(*dist).abs().max().item().toDouble() < 1e-6);
        }
    }
}
