#include<memory>

#include<doctest/doctest.h>

#include"../../include/Model/ModelFactory.hpp"
#include"../../include/Model/mlp_base.hpp"

namespace TrustRegion
{
    Policy makePolicy(const ModelConfig &config, unsigned int observationSize, const ActionSpace &actionSpace)
    {
        auto base = std::make_shared<MlpBase>(observationSize, config.hiddenSizes, config.activation);
        return Policy(actionSpace, base);
    }

    ValueFunction makeValueFunction(const ModelConfig &config, unsigned int observationSize)
    {
        auto base = std::make_shared<MlpBase>(observationSize, config.hiddenSizes, config.activation);
        return ValueFunction(base);
    }

    TEST_CASE("Model factory")
    {
        ModelConfig config;
        config.hiddenSizes = {16};

        auto policy = makePolicy(config, 4, ActionSpace{"Discrete", {2}});
        auto valueFunction = makeValueFunction(config, 4);

        CHECK(policy->act(torch::rand({3, 4}))[0].sizes().vec() == std::vector<int64_t>{3, 1});
        CHECK(valueFunction->forward(torch::rand({3, 4})).sizes().vec() == std::vector<int64_t>{3, 1});

        SUBCASE("Policy and value function do not share parameters")
        {
            for (const auto &policyParameter : policy->parameters())
            {
                for (const auto &valueParameter : valueFunction->parameters())
                {
                    CHECK(!policyParameter.is_same(valueParameter));
                }
            }
        }
    }
}
