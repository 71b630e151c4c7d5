#include<atomic>
#include<exception>
#include<stdexcept>
#include<system_error>
#include<thread>

#include<fmt/ranges.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Environment/VectorEnvironment.hpp"
#include"../../include/Environment/MatchingEnvironment.hpp"
#include"../../include/Environment/CartPoleEnvironment.hpp"
#include"../../include/Errors.hpp"

namespace TrustRegion
{
    namespace
    {
        // Joins every started worker when the scope ends, also while unwinding
        class ThreadJoiner
        {
        private:
            std::vector<std::thread> &threads;

        public:
            explicit ThreadJoiner(std::vector<std::thread> &threads)
                : threads(threads)
            {
            }

            ~ThreadJoiner()
            {
                for (auto &thread : threads)
                {
                    if (thread.joinable())
                    {
                        thread.join();
                    }
                }
            }
        };
    }

    VectorEnvironment::VectorEnvironment(std::vector<std::unique_ptr<Environment>> environments,
                                         unsigned int numThreads)
        : environments(std::move(environments)),
          numThreads(numThreads)
    {
        if (this->environments.empty())
        {
            throw std::invalid_argument("A vector environment needs at least one environment");
        }
        observationDims = this->environments[0]->observationShape();
        space = this->environments[0]->actionSpace();
        for (size_t i = 1; i < this->environments.size(); ++i)
        {
            auto otherSpace = this->environments[i]->actionSpace();
            if (this->environments[i]->observationShape() != observationDims ||
                otherSpace.type != space.type || otherSpace.shape != space.shape)
            {
                throw std::invalid_argument("Environment " + std::to_string(i) +
                                            " does not match the spaces of environment 0");
            }
        }
        if (this->numThreads == 0 || this->numThreads > this->environments.size())
        {
            this->numThreads = static_cast<unsigned int>(this->environments.size());
        }
        episodeReturns.assign(this->environments.size(), 0.f);
        episodeLengths.assign(this->environments.size(), 0);

        spdlog::debug("Vector environment with {} environments on {} threads, observation shape {}",
                      this->environments.size(), this->numThreads, fmt::join(observationDims, "x"));
    }

    void VectorEnvironment::forEachEnvironment(const std::function<void(size_t)> &function)
    {
        const size_t count = environments.size();
        std::vector<std::exception_ptr> errors(count);
        std::atomic<size_t> next{0};

        auto workerLoop = [&]() {
            while (true)
            {
                const size_t i = next.fetch_add(1, std::memory_order_relaxed);
                if (i >= count)
                {
                    break;
                }
                try
                {
                    function(i);
                }
                catch (...)
                {
                    // Rethrown below once every worker has been joined
                    errors[i] = std::current_exception();
                }
            }
        };

        {
            std::vector<std::thread> threads;
            ThreadJoiner joiner(threads);
            threads.reserve(numThreads - 1);
            for (unsigned int t = 1; t < numThreads; ++t)
            {
                threads.emplace_back(workerLoop);
            }
            workerLoop();
        }

        for (size_t i = 0; i < count; ++i)
        {
            if (!errors[i])
            {
                continue;
            }
            try
            {
                std::rethrow_exception(errors[i]);
            }
            catch (const EnvironmentError &)
            {
                throw;
            }
            catch (const std::exception &error)
            {
                throw EnvironmentError("Environment " + std::to_string(i) + " failed: " + error.what());
            }
        }
    }

    void VectorEnvironment::checkObservation(size_t index, const torch::Tensor &observation) const
    {
        if (observation.sizes().vec() != observationDims)
        {
            throw EnvironmentError("Environment " + std::to_string(index) + " returned an observation of shape " +
                                   fmt::format("{}", fmt::join(observation.sizes().vec(), "x")) +
                                   ", expected " + fmt::format("{}", fmt::join(observationDims, "x")));
        }
    }

    torch::Tensor VectorEnvironment::reset()
    {
        std::vector<torch::Tensor> observations(environments.size());
        forEachEnvironment([&](size_t i) {
            observations[i] = environments[i]->reset();
            checkObservation(i, observations[i]);
            episodeReturns[i] = 0.f;
            episodeLengths[i] = 0;
        });
        return torch::stack(observations).to(torch::kFloat);
    }

    VectorStepResult VectorEnvironment::step(const torch::Tensor &actions)
    {
        if (actions.dim() < 1 || actions.size(0) != size())
        {
            throw std::invalid_argument("Expected one action row per environment (" + std::to_string(size()) + ")");
        }

        const size_t count = environments.size();
        std::vector<torch::Tensor> observations(count);
        std::vector<float> rewards(count);
        std::vector<float> dones(count);
        std::vector<std::map<std::string, float>> infos(count);

        forEachEnvironment([&](size_t i) {
            auto result = environments[i]->step(actions[i]);
            checkObservation(i, result.observation);

            episodeReturns[i] += result.reward;
            episodeLengths[i]++;
            infos[i] = std::move(result.info);
            if (result.done)
            {
                infos[i]["episode_return"] = episodeReturns[i];
                infos[i]["episode_length"] = static_cast<float>(episodeLengths[i]);
                episodeReturns[i] = 0.f;
                episodeLengths[i] = 0;

                result.observation = environments[i]->reset();
                checkObservation(i, result.observation);
            }
            observations[i] = result.observation;
            rewards[i] = result.reward;
            dones[i] = result.done ? 1.f : 0.f;
        });

        return {torch::stack(observations).to(torch::kFloat),
                torch::tensor(rewards).unsqueeze(-1),
                torch::tensor(dones).unsqueeze(-1),
                std::move(infos)};
    }

    void VectorEnvironment::seed(uint64_t base)
    {
        for (size_t i = 0; i < environments.size(); ++i)
        {
            environments[i]->seed(base + i);
        }
    }

    namespace
    {
        class FailingEnvironment : public MatchingEnvironment
        {
        public:
            StepResult step(const torch::Tensor &) override
            {
                throw std::runtime_error("simulator crashed");
            }
        };

        class MisshapenEnvironment : public MatchingEnvironment
        {
        public:
            StepResult step(const torch::Tensor &action) override
            {
                auto result = MatchingEnvironment::step(action);
                result.observation = torch::zeros({2});
                return result;
            }
        };

        std::vector<std::unique_ptr<Environment>> matchingEnvironments(int count, int episodeLength)
        {
            std::vector<std::unique_ptr<Environment>> environments;
            for (int i = 0; i < count; ++i)
            {
                environments.push_back(std::make_unique<MatchingEnvironment>(episodeLength, i % 2));
            }
            return environments;
        }
    }

    TEST_CASE("ThreadJoiner")
    {
        std::atomic<int> finished{0};
        std::vector<std::thread> threads;

        SUBCASE("Started workers are joined when spawning fails part way")
        {
            auto spawn = [&]() {
                ThreadJoiner joiner(threads);
                for (int t = 0; t < 2; ++t)
                {
                    threads.emplace_back([&finished]() { ++finished; });
                }
                throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
            };
            CHECK_THROWS_AS(spawn(), std::system_error);
            CHECK(finished == 2);
            for (const auto &thread : threads)
            {
                CHECK(!thread.joinable());
            }
        }
    }

    TEST_CASE("VectorEnvironment")
    {
        SUBCASE("reset() stacks one observation per environment")
        {
            VectorEnvironment pool(matchingEnvironments(4, 5));
            auto observations = pool.reset();

            CHECK(observations.sizes().vec() == std::vector<int64_t>{4, 1});
            CHECK(observations[1][0].item<float>() == 1);
        }

        SUBCASE("step() returns batched tensors")
        {
            VectorEnvironment pool(matchingEnvironments(3, 5), 2);
            pool.reset();
            auto result = pool.step(torch::zeros({3, 1}, torch::kLong));

            CHECK(result.observations.sizes().vec() == std::vector<int64_t>{3, 1});
            CHECK(result.rewards.sizes().vec() == std::vector<int64_t>{3, 1});
            CHECK(result.dones.sizes().vec() == std::vector<int64_t>{3, 1});
            CHECK(result.infos.size() == 3);
            // Environment 0 starts at observation 0, environment 1 at 1
            CHECK(result.rewards[0][0].item<float>() == 1);
            CHECK(result.rewards[1][0].item<float>() == -1);
        }

        SUBCASE("Finished episodes are reset automatically")
        {
            VectorEnvironment pool(matchingEnvironments(2, 2), 1);
            pool.reset();
            auto first = pool.step(torch::zeros({2, 1}, torch::kLong));
            CHECK(first.dones.sum().item<float>() == 0);

            auto second = pool.step(torch::zeros({2, 1}, torch::kLong));
            CHECK(second.dones.sum().item<float>() == 2);
            // First observation of the next episode
            CHECK(second.observations[0][0].item<float>() == 0);
            CHECK(second.observations[1][0].item<float>() == 1);
            CHECK(second.infos[0].at("episode_length") == 2);
            // Environment 0 saw 0 then 1, environment 1 saw 1 then 0
            CHECK(second.infos[0].at("episode_return") == 0);
            CHECK(second.infos[1].at("episode_return") == 0);

            auto third = pool.step(torch::ones({2, 1}, torch::kLong));
            CHECK(third.infos[0].count("episode_return") == 0);
        }

        SUBCASE("Worker exceptions surface as EnvironmentError")
        {
            auto environments = matchingEnvironments(3, 5);
            environments.push_back(std::make_unique<FailingEnvironment>());
            VectorEnvironment pool(std::move(environments));
            pool.reset();

            CHECK_THROWS_AS(pool.step(torch::zeros({4, 1}, torch::kLong)), EnvironmentError);
        }

        SUBCASE("Observations of the wrong shape are rejected")
        {
            auto environments = matchingEnvironments(1, 5);
            environments.push_back(std::make_unique<MisshapenEnvironment>());
            VectorEnvironment pool(std::move(environments));
            pool.reset();

            CHECK_THROWS_AS(pool.step(torch::zeros({2, 1}, torch::kLong)), EnvironmentError);
        }

        SUBCASE("Environments with different spaces are refused")
        {
            auto environments = matchingEnvironments(1, 5);
            environments.push_back(std::make_unique<CartPoleEnvironment>());
            CHECK_THROWS_AS(VectorEnvironment(std::move(environments)), std::invalid_argument);
        }

        SUBCASE("Wrong number of actions is refused")
        {
            VectorEnvironment pool(matchingEnvironments(2, 5));
            pool.reset();
            CHECK_THROWS_AS(pool.step(torch::zeros({3, 1}, torch::kLong)), std::invalid_argument);
        }
    }
}
