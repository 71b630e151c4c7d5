#include<stdexcept>
#include<string>

#include<doctest/doctest.h>

#include"../../include/Environment/EnvironmentFactory.hpp"
#include"../../include/Environment/CartPoleEnvironment.hpp"
#include"../../include/Environment/MatchingEnvironment.hpp"
#include"../../include/Environment/PendulumEnvironment.hpp"
#include"../../include/Environment/RemoteEnvironment.hpp"

namespace TrustRegion
{
    std::unique_ptr<Environment> makeEnvironment(const EnvironmentConfig &config, int index)
    {
        if (config.name == "Matching")
        {
            return std::make_unique<MatchingEnvironment>(config.episodeLength, index % 2);
        }
        if (config.name == "CartPole")
        {
            return std::make_unique<CartPoleEnvironment>();
        }
        if (config.name == "Pendulum")
        {
            return std::make_unique<PendulumEnvironment>();
        }
        if (config.name == "Remote")
        {
            auto url = config.serverAddress + ":" + std::to_string(config.basePort + index);
            return std::make_unique<RemoteEnvironment>(url, config.gymEnvironment);
        }
        throw std::invalid_argument("Unknown environment: " + config.name);
    }

    std::vector<std::unique_ptr<Environment>> makeEnvironments(const EnvironmentConfig &config)
    {
        std::vector<std::unique_ptr<Environment>> environments;
        environments.reserve(config.numEnvs);
        for (int i = 0; i < config.numEnvs; ++i)
        {
            environments.push_back(makeEnvironment(config, i));
        }
        return environments;
    }

    TEST_CASE("makeEnvironment()")
    {
        EnvironmentConfig config;

        SUBCASE("Matching environments alternate their phase")
        {
            config.name = "Matching";
            auto first = makeEnvironment(config, 0);
            auto second = makeEnvironment(config, 1);
            CHECK(first->reset().item<float>() == 0);
            CHECK(second->reset().item<float>() == 1);
        }

        SUBCASE("Builds the classic control tasks")
        {
            config.name = "CartPole";
            CHECK(makeEnvironment(config, 0)->observationShape() == std::vector<int64_t>{4});
            config.name = "Pendulum";
            CHECK(makeEnvironment(config, 0)->actionSpace().type == "Box");
        }

        SUBCASE("Builds one environment per slot")
        {
            config.numEnvs = 3;
            CHECK(makeEnvironments(config).size() == 3);
        }

        SUBCASE("Unknown names throw")
        {
            config.name = "Atari";
            CHECK_THROWS_AS(makeEnvironment(config, 0), std::invalid_argument);
        }
    }
}
