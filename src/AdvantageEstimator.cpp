#include<stdexcept>
#include<string>
#include<vector>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/AdvantageEstimator.hpp"
#include"../include/Model/mlp_base.hpp"

namespace TrustRegion
{
    AdvantageEstimator::AdvantageEstimator(float gamma, float lambda, bool normalizeAdvantages, bool useGae)
        : gamma(gamma),
          lambda(lambda),
          normalizeAdvantages(normalizeAdvantages),
          useGae(useGae)
    {
        if (!(gamma > 0 && gamma < 1))
        {
            throw std::invalid_argument("gamma must lie in (0, 1), got " + std::to_string(gamma));
        }
        if (!(lambda >= 0 && lambda <= 1))
        {
            throw std::invalid_argument("lambda must lie in [0, 1], got " + std::to_string(lambda));
        }
    }

    TrainingBatch AdvantageEstimator::estimate(RolloutStorage &rollout, ValueFunction &valueFunction) const
    {
        const auto &observations = rollout.get_observations();
        int64_t numSteps = rollout.getNumSteps();
        int64_t numProcesses = rollout.getNumProcesses();

        auto observationShape = observations.sizes().vec();
        observationShape.erase(observationShape.begin());
        observationShape[0] = -1;

        torch::Tensor values;
        {
            torch::NoGradGuard noGrad;
            values = valueFunction->forward(observations.view(observationShape))
                         .view({numSteps + 1, numProcesses, 1});
        }
        rollout.set_value_predictions(values.clone());
        rollout.computeReturns(values[numSteps], useGae, gamma, lambda);

        observationShape = observations.sizes().vec();
        observationShape.erase(observationShape.begin());
        observationShape[0] = numSteps * numProcesses;

        TrainingBatch batch;
        batch.observations = observations.narrow(0, 0, numSteps).reshape(observationShape);
        batch.actions = rollout.get_actions().reshape({numSteps * numProcesses, -1});
        batch.distributionParameters = rollout.get_distribution_parameters()
                                           .reshape({numSteps * numProcesses, -1});
        batch.actionLogProbs = rollout.get_action_log_probs().reshape({-1, 1});
        batch.valuePredictions = rollout.get_value_predictions().narrow(0, 0, numSteps).reshape({-1, 1});
        batch.returns = rollout.get_returns().narrow(0, 0, numSteps).reshape({-1, 1});
        batch.advantages = rollout.get_advantages().reshape({-1, 1});

        if (normalizeAdvantages && batch.size() > 1)
        {
            batch.advantages = (batch.advantages - batch.advantages.mean()) / (batch.advantages.std() + 1e-8);
        }
        return batch;
    }

    TEST_CASE("AdvantageEstimator")
    {
        torch::manual_seed(0);
        const int64_t numSteps = 4;
        const int64_t numProcesses = 2;
        const float gamma = 0.9;

        ValueFunction valueFunction(std::make_shared<MlpBase>(1, std::vector<unsigned int>{}));
        RolloutStorage rollout(numSteps, numProcesses, {1}, ActionSpace{"Discrete", {2}}, 2);
        rollout.setFirstObservation(torch::rand({numProcesses, 1}));

        // Environment 1 finishes an episode after step 1
        std::vector<std::vector<float>> masks{{1, 1}, {1, 0}, {1, 1}, {1, 1}};
        for (int64_t t = 0; t < numSteps; ++t)
        {
            rollout.insert(torch::rand({numProcesses, 1}),
                           torch::zeros({numProcesses, 1}),
                           torch::zeros({numProcesses, 1}),
                           torch::zeros({numProcesses, 2}),
                           torch::rand({numProcesses, 1}),
                           torch::tensor(masks[t]).view({numProcesses, 1}));
        }

        torch::Tensor values;
        {
            torch::NoGradGuard noGrad;
            values = valueFunction->forward(rollout.get_observations().view({-1, 1}))
                         .view({numSteps + 1, numProcesses, 1});
        }
        auto rewards = rollout.get_rewards();
        auto rolloutMasks = rollout.get_masks();

        SUBCASE("lambda = 0 gives one-step TD advantages")
        {
            AdvantageEstimator estimator(gamma, 0, false);
            auto batch = estimator.estimate(rollout, valueFunction);

            auto expected = rewards + gamma * values.narrow(0, 1, numSteps) * rolloutMasks.narrow(0, 1, numSteps) -
                            values.narrow(0, 0, numSteps);
            CHECK(torch::allclose(batch.advantages, expected.reshape({-1, 1}), 1e-5, 1e-6));
            CHECK(torch::allclose(batch.returns, batch.advantages + batch.valuePredictions));
        }

        SUBCASE("lambda = 1 gives Monte-Carlo advantages")
        {
            AdvantageEstimator estimator(gamma, 1, false);
            auto batch = estimator.estimate(rollout, valueFunction);

            auto returns = torch::zeros({numSteps + 1, numProcesses, 1});
            returns[numSteps] = values[numSteps];
            for (int64_t t = numSteps - 1; t >= 0; --t)
            {
                returns[t] = rewards[t] + gamma * rolloutMasks[t + 1] * returns[t + 1];
            }
            auto expected = returns.narrow(0, 0, numSteps) - values.narrow(0, 0, numSteps);
            CHECK(torch::allclose(batch.advantages, expected.reshape({-1, 1}), 1e-5, 1e-5));
        }

        SUBCASE("The discounted-return path agrees with lambda = 1")
        {
            auto gae = AdvantageEstimator(gamma, 1, false).estimate(rollout, valueFunction);
            auto discounted = AdvantageEstimator(gamma, 0.5, false, false).estimate(rollout, valueFunction);
            CHECK(torch::allclose(gae.returns, discounted.returns, 1e-5, 1e-5));
        }

        SUBCASE("Batch is flattened time-major without the bootstrap row")
        {
            auto batch = AdvantageEstimator(gamma, 0.95, false).estimate(rollout, valueFunction);

            CHECK(batch.size() == numSteps * numProcesses);
            CHECK(batch.observations.sizes().vec() == std::vector<int64_t>{8, 1});
            CHECK(batch.actions.sizes().vec() == std::vector<int64_t>{8, 1});
            CHECK(batch.distributionParameters.sizes().vec() == std::vector<int64_t>{8, 2});
            CHECK(torch::equal(batch.observations[3], rollout.get_observations()[1][1]));
            CHECK(torch::allclose(batch.valuePredictions, values.narrow(0, 0, numSteps).reshape({-1, 1})));
        }

        SUBCASE("Normalized advantages have zero mean and unit deviation")
        {
            auto batch = AdvantageEstimator(gamma, 0.95, true).estimate(rollout, valueFunction);
            CHECK(batch.advantages.mean().item().toDouble() == doctest::Approx(0).epsilon(1e-5));
            CHECK(batch.advantages.std().item().toDouble() == doctest::Approx(1).epsilon(1e-4));
        }

        SUBCASE("Rejects out-of-range discount and trace parameters")
        {
            CHECK_THROWS_AS(AdvantageEstimator(1.0, 0.9, true), std::invalid_argument);
            CHECK_THROWS_AS(AdvantageEstimator(0.0, 0.9, true), std::invalid_argument);
            CHECK_THROWS_AS(AdvantageEstimator(0.99, 1.5, true), std::invalid_argument);
            CHECK_THROWS_AS(AdvantageEstimator(0.99, -0.1, true), std::invalid_argument);
        }
    }
}
