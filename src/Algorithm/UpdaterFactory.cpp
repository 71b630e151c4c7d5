#include<stdexcept>

#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/UpdaterFactory.hpp"
#include"../../include/Algorithms/NaturalPG.hpp"
#include"../../include/Algorithms/TrustRegionPG.hpp"
#include"../../include/Algorithms/VanillaPG.hpp"
#include"../../include/Model/mlp_base.hpp"

namespace TrustRegion
{
    std::unique_ptr<PolicyUpdater> makePolicyUpdater(const AlgorithmConfig &config, Policy &policy)
    {
        NaturalGradientOptions options;
        options.klSubsampleRatio = config.klSubsampleRatio;
        options.cgIterations = config.cgIterations;
        options.cgResidualTolerance = config.cgResidualTolerance;
        options.damping = config.damping;

        LineSearchOptions lineSearchOptions;
        lineSearchOptions.maxBacktracks = config.maxBacktracks;
        lineSearchOptions.backtrackRatio = config.backtrackRatio;
        lineSearchOptions.acceptRatio = config.acceptRatio;

        spdlog::debug("Policy updater {}", config.type);
        if (config.type == "TRPO")
        {
            return std::make_unique<TrustRegionPG>(policy, config.maxKl, options, true, lineSearchOptions);
        }
        if (config.type == "TNPG")
        {
            return std::make_unique<TrustRegionPG>(policy, config.maxKl, options, false);
        }
        if (config.type == "Natural")
        {
            return std::make_unique<NaturalPG>(policy, config.learningRate, options);
        }
        if (config.type == "Vanilla")
        {
            return std::make_unique<VanillaPG>(policy, config.learningRate);
        }
        throw std::invalid_argument("Unknown algorithm type: " + config.type);
    }

    TEST_CASE("makePolicyUpdater()")
    {
        Policy policy(ActionSpace{"Discrete", {2}}, std::make_shared<MlpBase>(1, std::vector<unsigned int>{4}));
        AlgorithmConfig config;

        SUBCASE("Builds every known strategy")
        {
            config.type = "TRPO";
            CHECK(dynamic_cast<TrustRegionPG *>(makePolicyUpdater(config, policy).get()) != nullptr);
            config.type = "TNPG";
            CHECK(dynamic_cast<TrustRegionPG *>(makePolicyUpdater(config, policy).get()) != nullptr);
            config.type = "Natural";
            CHECK(dynamic_cast<NaturalPG *>(makePolicyUpdater(config, policy).get()) != nullptr);
            config.type = "Vanilla";
            CHECK(dynamic_cast<VanillaPG *>(makePolicyUpdater(config, policy).get()) != nullptr);
        }

        SUBCASE("Rejects unknown strategies")
        {
            config.type = "PPO";
            CHECK_THROWS_AS(makePolicyUpdater(config, policy), std::invalid_argument);
        }
    }
}
