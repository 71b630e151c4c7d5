#include<stdexcept>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/policy.hpp"
#include"../../include/Model/mlp_base.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/Distribution/Categorical.hpp"

namespace TrustRegion
{
    PolicyImpl::PolicyImpl(ActionSpace actionSpace, std::shared_ptr<NNBase> base)
        : actionSpace(actionSpace),
          base(register_module("base", base))
    {
        if (actionSpace.shape.size() != 1 || actionSpace.shape[0] < 1)
        {
            throw std::invalid_argument("Action spaces must have exactly one positive dimension");
        }
        int numOutputs = actionSpace.shape[0];
        if (actionSpace.type == "Discrete")
        {
            outputLayer = std::make_shared<CategoricalOutput>(base->getOutputSize(), numOutputs);
        }
        else if (actionSpace.type == "Box")
        {
            outputLayer = std::make_shared<NormalOutput>(base->getOutputSize(), numOutputs);
        }
        else
        {
            throw std::invalid_argument("Unsupported action space type: " + actionSpace.type);
        }

        register_module("output", outputLayer);
    }

    std::unique_ptr<Distribution> PolicyImpl::distribution(torch::Tensor observations) const
    {
        auto features = base->forward(observations);
        return outputLayer->forward(features);
    }

    std::vector<torch::Tensor> PolicyImpl::act(torch::Tensor observations) const
    {
        auto dist = distribution(observations);

        auto action = dist->sample();
        if (actionSpace.type == "Discrete")
        {
            // Keep a trailing action dimension for both space types
            action = action.unsqueeze(-1);
        }
        auto actionLogProbs = logProbability(*dist, action);

        return {action,
                actionLogProbs,
                dist->flatParameters()};
    }

    std::vector<torch::Tensor> PolicyImpl::evaluateAction(torch::Tensor observations, torch::Tensor actions) const
    {
        auto dist = distribution(observations);
        auto actionLogProbs = logProbability(*dist, actions);
        auto entropy = dist->entropy().mean();

        return {actionLogProbs, entropy};
    }

    torch::Tensor PolicyImpl::logProbability(Distribution &dist, torch::Tensor actions) const
    {
        if (actionSpace.type == "Discrete")
        {
            return dist.logProbability(actions.squeeze(-1))
                .view({actions.size(0), -1})
                .sum(-1)
                .unsqueeze(-1);
        }
        return dist.logProbability(actions).sum(-1, true);
    }

    std::unique_ptr<Distribution> PolicyImpl::distributionFromParameters(torch::Tensor parameters) const
    {
        return outputLayer->fromParameters(parameters);
    }

    torch::Tensor PolicyImpl::getProbability(torch::Tensor observations) const
    {
        if (actionSpace.type != "Discrete")
        {
            throw std::runtime_error("Action probabilities are only defined for discrete action spaces");
        }
        auto dist = distribution(observations);
        return static_cast<Categorical *>(dist.get())->getProbability();
    }

    torch::Tensor PolicyImpl::flatParameters() const
    {
        return flattenParameters(parameters());
    }

    void PolicyImpl::setFlatParameters(const torch::Tensor &flat)
    {
        assignFlatParameters(parameters(), flat);
    }

    int64_t PolicyImpl::numParameters() const
    {
        int64_t total = 0;
        for (const auto &parameter : parameters())
        {
            total += parameter.numel();
        }
        return total;
    }

    TEST_CASE("Policy")
    {
        SUBCASE("Discrete action space")
        {
            auto base = std::make_shared<MlpBase>(3, std::vector<unsigned int>{10});
            ActionSpace space{"Discrete", {5}};
            Policy policy(space, base);
            auto observations = torch::rand({4, 3});

            SUBCASE("act() output tensors are correct shapes")
            {
                auto outputs = policy->act(observations);
                REQUIRE(outputs.size() == 3);

                CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{4, 1});
                CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{4, 1});
                CHECK(outputs[2].sizes().vec() == std::vector<int64_t>{4, 5});
                CHECK(policy->getNumDistributionParameters() == 5);
            }

            SUBCASE("evaluateAction() agrees with act()")
            {
                auto outputs = policy->act(observations);
                auto evaluated = policy->evaluateAction(observations, outputs[0]);

                CHECK(torch::allclose(evaluated[0], outputs[1]));
                CHECK(evaluated[1].dim() == 0);
            }

            SUBCASE("getProbability() sums to one")
            {
                auto probabilities = policy->getProbability(observations);
                CHECK(probabilities.sizes().vec() == std::vector<int64_t>{4, 5});
                CHECK(torch::allclose(probabilities.sum(-1), torch::ones({4})));
            }

            SUBCASE("Recorded parameters rebuild the acting distribution")
            {
                auto outputs = policy->act(observations);
                auto recorded = policy->distributionFromParameters(outputs[2]);
                auto logProbs = policy->logProbability(*recorded, outputs[0]);
                CHECK(torch::allclose(logProbs, outputs[1]));
            }
        }

        SUBCASE("Box action space")
        {
            auto base = std::make_shared<MlpBase>(3, std::vector<unsigned int>{10});
            ActionSpace space{"Box", {2}};
            Policy policy(space, base);
            auto observations = torch::rand({4, 3});

            SUBCASE("act() output tensors are correct shapes")
            {
                auto outputs = policy->act(observations);

                CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{4, 2});
                CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{4, 1});
                CHECK(outputs[2].sizes().vec() == std::vector<int64_t>{4, 4});
            }

            SUBCASE("getProbability() is rejected")
            {
                CHECK_THROWS(policy->getProbability(observations));
            }
        }

        SUBCASE("Flat parameters")
        {
            auto base = std::make_shared<MlpBase>(3, std::vector<unsigned int>{4});
            Policy policy(ActionSpace{"Discrete", {2}}, base);

            // 3*4 + 4 trunk, 4*2 + 2 head
            CHECK(policy->numParameters() == 26);

            auto flat = policy->flatParameters();
            CHECK(flat.sizes().vec() == std::vector<int64_t>{26});

            policy->setFlatParameters(torch::zeros({26}));
            CHECK(policy->flatParameters().abs().sum().item().toDouble() == 0);

            policy->setFlatParameters(flat);
            CHECK(torch::equal(policy->flatParameters(), flat));
        }

        SUBCASE("Unsupported action space throws")
        {
            auto base = std::make_shared<MlpBase>(3, std::vector<unsigned int>{4});
            CHECK_THROWS_AS(Policy(ActionSpace{"MultiBinary", {2}}, base), std::invalid_argument);
        }
    }
}
