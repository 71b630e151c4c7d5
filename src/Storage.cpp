#include<stdexcept>
#include<string>
#include<vector>

#include<doctest/doctest.h>

#include"../include/Storage.hpp"
#include"../include/Space.hpp"

namespace TrustRegion
{
    RolloutStorage::RolloutStorage(int64_t numSteps,
                                   int64_t numProcesses,
                                   c10::ArrayRef<int64_t> observationShape,
                                   ActionSpace actionSpace,
                                   int64_t numDistributionParameters,
                                   torch::Device device)
        : device(device),
          numSteps(numSteps),
          step(0)
    {
        if (numSteps < 1 || numProcesses < 1)
        {
            throw std::invalid_argument("Rollout storage needs at least one step and one process");
        }
        std::vector<int64_t> fullObservationShape{numSteps + 1, numProcesses};
        fullObservationShape.insert(fullObservationShape.end(), observationShape.begin(), observationShape.end());

        auto options = torch::TensorOptions(device);
        observations = torch::zeros(fullObservationShape, options);
        rewards = torch::zeros({numSteps, numProcesses, 1}, options);
        valuePredictions = torch::zeros({numSteps + 1, numProcesses, 1}, options);
        returns = torch::zeros({numSteps + 1, numProcesses, 1}, options);
        advantages = torch::zeros({numSteps, numProcesses, 1}, options);
        actionLogProbs = torch::zeros({numSteps, numProcesses, 1}, options);
        distributionParameters = torch::zeros({numSteps, numProcesses, numDistributionParameters}, options);

        int64_t numActions = actionSpace.type == "Discrete" ? 1 : actionSpace.shape[0];
        actions = torch::zeros({numSteps, numProcesses, numActions}, options);
        if (actionSpace.type == "Discrete")
        {
            actions = actions.to(torch::kLong);
        }
        masks = torch::ones({numSteps + 1, numProcesses, 1}, options);
    }

    void RolloutStorage::setFirstObservation(torch::Tensor observation)
    {
        observations[0].copy_(observation);
    }

    void RolloutStorage::insert(torch::Tensor observation,
                                torch::Tensor action,
                                torch::Tensor actionLogProb,
                                torch::Tensor distributionParameter,
                                torch::Tensor reward,
                                torch::Tensor mask)
    {
        if (step >= numSteps)
        {
            throw std::out_of_range("Rollout storage already holds " + std::to_string(numSteps) + " steps");
        }
        observations[step + 1].copy_(observation);
        actions[step].copy_(action);
        actionLogProbs[step].copy_(actionLogProb);
        distributionParameters[step].copy_(distributionParameter);
        rewards[step].copy_(reward);
        masks[step + 1].copy_(mask);

        step++;
    }

    void RolloutStorage::computeReturns(torch::Tensor nextValue, bool useGae, float gamma, float tau)
    {
        valuePredictions[-1] = nextValue;
        if (useGae)
        {
            // Running advantage of every process, [N, 1]
            torch::Tensor gae = torch::zeros({rewards.size(1), 1}, torch::TensorOptions(device));

            for (int64_t t = rewards.size(0) - 1; t >= 0; --t)
            {
                auto delta = rewards[t] + gamma * valuePredictions[t + 1] * masks[t + 1] - valuePredictions[t];
                gae = delta + gamma * tau * masks[t + 1] * gae;
                advantages[t] = gae;
                returns[t] = gae + valuePredictions[t];
            }
            returns[-1] = nextValue;
        }
        else
        {
            returns[-1] = nextValue;
            for (int64_t t = rewards.size(0) - 1; t >= 0; --t)
            {
                returns[t] = returns[t + 1] * gamma * masks[t + 1] + rewards[t];
                advantages[t] = returns[t] - valuePredictions[t];
            }
        }
    }

    TEST_CASE("RolloutStorage")
    {
        SUBCASE("Initializes tensors to correct sizes")
        {
            RolloutStorage storage(3, 5, {5, 2}, ActionSpace{"Discrete", {3}}, 3);

            CHECK(storage.get_observations().sizes().vec() == std::vector<int64_t>{4, 5, 5, 2});
            CHECK(storage.get_rewards().sizes().vec() == std::vector<int64_t>{3, 5, 1});
            CHECK(storage.get_value_predictions().sizes().vec() == std::vector<int64_t>{4, 5, 1});
            CHECK(storage.get_returns().sizes().vec() == std::vector<int64_t>{4, 5, 1});
            CHECK(storage.get_advantages().sizes().vec() == std::vector<int64_t>{3, 5, 1});
            CHECK(storage.get_action_log_probs().sizes().vec() == std::vector<int64_t>{3, 5, 1});
            CHECK(storage.get_distribution_parameters().sizes().vec() == std::vector<int64_t>{3, 5, 3});
            CHECK(storage.get_actions().sizes().vec() == std::vector<int64_t>{3, 5, 1});
            CHECK(storage.get_masks().sizes().vec() == std::vector<int64_t>{4, 5, 1});
        }

        SUBCASE("Action type follows the action space")
        {
            RolloutStorage discrete(3, 5, {2}, ActionSpace{"Discrete", {3}}, 3);
            RolloutStorage box(3, 5, {2}, ActionSpace{"Box", {3}}, 6);

            CHECK(discrete.get_actions().dtype() == torch::kLong);
            CHECK(box.get_actions().dtype() == torch::kFloat);
            CHECK(box.get_actions().size(2) == 3);
        }

        SUBCASE("insert() writes one row and refuses to overflow")
        {
            RolloutStorage storage(2, 4, {5}, ActionSpace{"Discrete", {3}}, 3);
            storage.insert(torch::rand({4, 5}) + 1,
                           torch::randint(1, 3, {4, 1}),
                           torch::rand({4, 1}) + 1,
                           torch::rand({4, 3}) + 1,
                           torch::rand({4, 1}) + 1,
                           torch::zeros({4, 1}));

            INFO("Observations: \n" << storage.get_observations() << "\n");
            CHECK(storage.get_observations()[1][0][0].item().toDouble() != doctest::Approx(0));
            CHECK(storage.get_observations()[0][0][0].item().toDouble() == doctest::Approx(0));
            CHECK(storage.get_actions()[0][0][0].item().toInt() != 0);
            CHECK(storage.get_action_log_probs()[0][0][0].item().toDouble() != doctest::Approx(0));
            CHECK(storage.get_distribution_parameters()[0][3][2].item().toDouble() != doctest::Approx(0));
            CHECK(storage.get_rewards()[0][0][0].item().toDouble() != doctest::Approx(0));
            CHECK(storage.get_masks()[1][0][0].item().toInt() == 0);
            CHECK(!storage.isFull());

            storage.insert(torch::zeros({4, 5}), torch::zeros({4, 1}), torch::zeros({4, 1}),
                           torch::zeros({4, 3}), torch::zeros({4, 1}), torch::ones({4, 1}));
            CHECK(storage.isFull());
            CHECK_THROWS_AS(storage.insert(torch::zeros({4, 5}), torch::zeros({4, 1}), torch::zeros({4, 1}),
                                           torch::zeros({4, 3}), torch::zeros({4, 1}), torch::ones({4, 1})),
                            std::out_of_range);
        }

        SUBCASE("computeReturns()")
        {
            RolloutStorage storage(3, 2, {4}, ActionSpace{"Discrete", {3}}, 3);

            std::vector<float> rewards{0, 1};
            std::vector<float> masks{1, 1};
            storage.insert(torch::zeros({2, 4}), torch::zeros({2, 1}), torch::zeros({2, 1}), torch::zeros({2, 3}),
                           torch::from_blob(rewards.data(), {2, 1}),
                           torch::from_blob(masks.data(), {2, 1}));
            rewards = {1, 2};
            masks = {1, 0};
            storage.insert(torch::zeros({2, 4}), torch::zeros({2, 1}), torch::zeros({2, 1}), torch::zeros({2, 3}),
                           torch::from_blob(rewards.data(), {2, 1}),
                           torch::from_blob(masks.data(), {2, 1}));
            rewards = {2, 3};
            masks = {1, 1};
            storage.insert(torch::zeros({2, 4}), torch::zeros({2, 1}), torch::zeros({2, 1}), torch::zeros({2, 3}),
                           torch::from_blob(rewards.data(), {2, 1}),
                           torch::from_blob(masks.data(), {2, 1}));

            std::vector<float> values{0, 1, 1, 2, 2, 3, 0, 0};
            storage.set_value_predictions(torch::from_blob(values.data(), {4, 2, 1}).clone());
            std::vector<float> nextValues{0, 1};
            auto nextValue = torch::from_blob(nextValues.data(), {2, 1});

            SUBCASE("Discounted returns without GAE")
            {
                storage.computeReturns(nextValue, false, 0.6, 0.6);

                INFO("Returns: \n" << storage.get_returns() << "\n");
                auto returns = storage.get_returns();
                CHECK(returns[0][0].item().toDouble() == doctest::Approx(1.32));
                CHECK(returns[0][1].item().toDouble() == doctest::Approx(2.2));
                CHECK(returns[1][0].item().toDouble() == doctest::Approx(2.2));
                CHECK(returns[1][1].item().toDouble() == doctest::Approx(2));
                CHECK(returns[2][0].item().toDouble() == doctest::Approx(2));
                CHECK(returns[2][1].item().toDouble() == doctest::Approx(3.6));
                CHECK(returns[3][1].item().toDouble() == doctest::Approx(1));

                // Advantages are returns minus value predictions
                CHECK(storage.get_advantages()[0][0].item().toDouble() == doctest::Approx(1.32));
                CHECK(storage.get_advantages()[2][1].item().toDouble() == doctest::Approx(0.6));
            }

            SUBCASE("GAE returns")
            {
                storage.computeReturns(nextValue, true, 0.6, 0.6);

                INFO("Returns: \n" << storage.get_returns() << "\n");
                auto returns = storage.get_returns();
                CHECK(returns[0][0].item().toDouble() == doctest::Approx(1.032));
                CHECK(returns[0][1].item().toDouble() == doctest::Approx(2.2));
                CHECK(returns[1][0].item().toDouble() == doctest::Approx(2.2));
                CHECK(returns[1][1].item().toDouble() == doctest::Approx(2));
                CHECK(returns[2][0].item().toDouble() == doctest::Approx(2));
                CHECK(returns[2][1].item().toDouble() == doctest::Approx(3.6));

                CHECK(storage.get_advantages()[0][0].item().toDouble() == doctest::Approx(1.032));
                CHECK(storage.get_advantages()[1][1].item().toDouble() == doctest::Approx(0));
                CHECK(storage.get_value_predictions()[3][1].item().toDouble() == doctest::Approx(1));
            }
        }
    }
}
