#include<limits>
#include<numeric>
#include<stdexcept>
#include<vector>

#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../include/RolloutCollector.hpp"
#include"../include/Environment/MatchingEnvironment.hpp"
#include"../include/Environment/PendulumEnvironment.hpp"
#include"../include/Model/mlp_base.hpp"

namespace TrustRegion
{
    namespace
    {
        float windowMean(const std::deque<float> &window)
        {
            if (window.empty())
            {
                return std::numeric_limits<float>::quiet_NaN();
            }
            return std::accumulate(window.begin(), window.end(), 0.f) / window.size();
        }
    }

    float EpisodeStatistics::meanReturn() const
    {
        return windowMean(recentReturns);
    }

    float EpisodeStatistics::meanLength() const
    {
        return windowMean(recentLengths);
    }

    RolloutCollector::RolloutCollector(VectorEnvironment &environments, int64_t horizon, int rewardWindow)
        : environments(environments),
          horizon(horizon)
    {
        if (horizon < 1)
        {
            throw std::invalid_argument("The collection horizon must be at least one step");
        }
        if (rewardWindow < 1)
        {
            throw std::invalid_argument("The reward window must hold at least one episode");
        }
        this->rewardWindow = static_cast<size_t>(rewardWindow);
    }

    RolloutStorage RolloutCollector::collect(Policy &policy)
    {
        torch::NoGradGuard noGrad;

        if (!currentObservation.defined())
        {
            currentObservation = environments.reset();
        }

        RolloutStorage rollout(horizon,
                               environments.size(),
                               environments.observationShape(),
                               environments.actionSpace(),
                               policy->getNumDistributionParameters());
        rollout.setFirstObservation(currentObservation);

        for (int64_t step = 0; step < horizon; ++step)
        {
            auto actResult = policy->act(currentObservation);
            auto result = environments.step(actResult[0]);

            rollout.insert(result.observations,
                           actResult[0],
                           actResult[1],
                           actResult[2],
                           result.rewards,
                           1 - result.dones);

            recordEpisodes(result);
            currentObservation = result.observations;
        }
        statistics.totalSteps += horizon * environments.size();

        return rollout;
    }

    void RolloutCollector::restart()
    {
        currentObservation = torch::Tensor();
    }

    void RolloutCollector::recordEpisodes(const VectorStepResult &result)
    {
        for (const auto &info : result.infos)
        {
            auto episodeReturn = info.find("episode_return");
            if (episodeReturn == info.end())
            {
                continue;
            }
            statistics.totalEpisodes++;
            statistics.recentReturns.push_back(episodeReturn->second);
            auto episodeLength = info.find("episode_length");
            statistics.recentLengths.push_back(episodeLength == info.end() ? 0.f : episodeLength->second);
            if (statistics.recentReturns.size() > rewardWindow)
            {
                statistics.recentReturns.pop_front();
                statistics.recentLengths.pop_front();
            }
            spdlog::debug("Episode {} finished with return {:.3f}", statistics.totalEpisodes, episodeReturn->second);
        }
    }

    TEST_CASE("RolloutCollector")
    {
        std::vector<std::unique_ptr<Environment>> matching;
        for (int i = 0; i < 4; ++i)
        {
            matching.push_back(std::make_unique<MatchingEnvironment>(5, i % 2));
        }
        VectorEnvironment pool(std::move(matching));
        Policy policy(pool.actionSpace(), std::make_shared<MlpBase>(1, std::vector<unsigned int>{8}));

        SUBCASE("collect() fills every step of every environment")
        {
            RolloutCollector collector(pool, 10, 3);
            auto rollout = collector.collect(policy);

            CHECK(rollout.isFull());
            CHECK(rollout.get_observations().sizes().vec() == std::vector<int64_t>{11, 4, 1});
            CHECK(rollout.get_actions().sizes().vec() == std::vector<int64_t>{10, 4, 1});
            CHECK(rollout.get_distribution_parameters().sizes().vec() == std::vector<int64_t>{10, 4, 2});
            CHECK(!rollout.get_action_log_probs().requires_grad());

            // Matching rewards are +1 or -1
            CHECK(torch::all(rollout.get_rewards().abs() == 1).item().toBool());

            // Episodes of length 5 end at steps 4 and 9
            CHECK(rollout.get_masks()[5].sum().item().toInt() == 0);
            CHECK(rollout.get_masks()[10].sum().item().toInt() == 0);
            CHECK(rollout.get_masks()[3].sum().item().toInt() == 4);

            const auto &statistics = collector.getStatistics();
            CHECK(statistics.totalEpisodes == 8);
            CHECK(statistics.totalSteps == 40);
            CHECK(statistics.recentReturns.size() == 3);
            CHECK(statistics.meanLength() == doctest::Approx(5));
        }

        SUBCASE("Recorded log-probabilities match the recorded distributions")
        {
            RolloutCollector collector(pool, 6);
            auto rollout = collector.collect(policy);

            auto distribution = policy->distributionFromParameters(rollout.get_distribution_parameters().view({-1, 2}));
            auto logProbs = policy->logProbability(*distribution, rollout.get_actions().view({-1, 1}));
            CHECK(torch::allclose(logProbs, rollout.get_action_log_probs().view({-1, 1}), 1e-5, 1e-6));
        }

        SUBCASE("Consecutive calls continue the running episodes")
        {
            RolloutCollector collector(pool, 3);
            auto first = collector.collect(policy);
            auto second = collector.collect(policy);

            CHECK(torch::equal(second.get_observations()[0], first.get_observations()[3]));
            CHECK(collector.getStatistics().totalEpisodes == 4);

            collector.restart();
            auto third = collector.collect(policy);
            CHECK(torch::equal(third.get_observations()[0], first.get_observations()[0]));
        }

        SUBCASE("Sampling is reproducible under a fixed seed")
        {
            RolloutCollector collector(pool, 8);
            torch::manual_seed(7);
            auto first = collector.collect(policy);
            collector.restart();
            torch::manual_seed(7);
            auto second = collector.collect(policy);

            CHECK(torch::equal(first.get_actions(), second.get_actions()));
            CHECK(torch::equal(first.get_rewards(), second.get_rewards()));
        }

        SUBCASE("Continuous actions")
        {
            std::vector<std::unique_ptr<Environment>> pendulums;
            pendulums.push_back(std::make_unique<PendulumEnvironment>());
            pendulums.push_back(std::make_unique<PendulumEnvironment>());
            VectorEnvironment pendulumPool(std::move(pendulums), 1);
            Policy gaussianPolicy(pendulumPool.actionSpace(), std::make_shared<MlpBase>(3, std::vector<unsigned int>{8}));

            RolloutCollector collector(pendulumPool, 4);
            auto rollout = collector.collect(gaussianPolicy);
            CHECK(rollout.get_actions().sizes().vec() == std::vector<int64_t>{4, 2, 1});
            CHECK(rollout.get_distribution_parameters().sizes().vec() == std::vector<int64_t>{4, 2, 2});
        }

        SUBCASE("Rejects an empty horizon")
        {
            CHECK_THROWS_AS(RolloutCollector(pool, 0), std::invalid_argument);
        }
    }
}
