#include<chrono>
#include<csignal>
#include<cmath>
#include<filesystem>

#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/Trainer.hpp"
#include"../include/Config.hpp"
#include"../include/Algorithms/UpdaterFactory.hpp"
#include"../include/Environment/EnvironmentFactory.hpp"
#include"../include/Model/ModelFactory.hpp"

namespace TrustRegion
{
    std::string phaseName(TrainerPhase phase)
    {
        switch (phase)
        {
        case TrainerPhase::Init:
            return "Init";
        case TrainerPhase::Collecting:
            return "Collecting";
        case TrainerPhase::Computing:
            return "Computing";
        case TrainerPhase::Updating:
            return "Updating";
        case TrainerPhase::Refitting:
            return "Refitting";
        case TrainerPhase::Checkpointing:
            return "Checkpointing";
        case TrainerPhase::Finished:
            return "Finished";
        }
        return "Unknown";
    }

    Trainer::Trainer(TrainerContext context)
        : context(context),
          currentPhase(TrainerPhase::Init),
          stopRequested(false)
    {
    }

    void Trainer::requestStop()
    {
        stopRequested.store(true);
    }

    int64_t Trainer::restore()
    {
        if (context.checkpoints == nullptr)
        {
            spdlog::warn("Resume requested without a checkpoint directory, starting from scratch");
            return -1;
        }
        auto latest = context.checkpoints->latestIteration();
        if (!latest)
        {
            spdlog::info("No checkpoint in {}, starting from scratch", context.checkpoints->getDirectory());
            return -1;
        }
        TrainingState state{context.policy, context.valueFunction,
                            &context.policyUpdater, &context.valueFunctionTrainer, -1};
        context.checkpoints->load(*latest, state);
        context.collector.restart();
        return state.lastIteration;
    }

    void Trainer::checkpoint(int64_t iteration)
    {
        currentPhase = TrainerPhase::Checkpointing;
        TrainingState state{context.policy, context.valueFunction,
                            &context.policyUpdater, &context.valueFunctionTrainer, iteration};
        context.checkpoints->save(iteration, state);
    }

    void Trainer::runIteration(int64_t iteration)
    {
        auto start = std::chrono::steady_clock::now();
        spdlog::info("Starting iteration {}", iteration);

        currentPhase = TrainerPhase::Collecting;
        auto rollout = context.collector.collect(context.policy);

        currentPhase = TrainerPhase::Computing;
        auto batch = context.advantageEstimator.estimate(rollout, context.valueFunction);

        currentPhase = TrainerPhase::Updating;
        context.metrics.record(context.policyUpdater.update(batch));

        currentPhase = TrainerPhase::Refitting;
        context.metrics.record(context.valueFunctionTrainer.update(batch));

        const auto &statistics = context.collector.getStatistics();
        auto elapsed = std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();
        context.metrics.record("AverageReturn", statistics.meanReturn());
        context.metrics.record("AverageEpisodeLength", statistics.meanLength());
        context.metrics.record("TotalEpisodes", static_cast<float>(statistics.totalEpisodes));
        context.metrics.record("TotalSteps", static_cast<float>(statistics.totalSteps));
        context.metrics.record("IterationSeconds", elapsed);
        context.metrics.dump(iteration);
    }

    int64_t Trainer::run(int64_t numIterations, bool resume)
    {
        currentPhase = TrainerPhase::Init;
        int64_t lastIteration = resume ? restore() : -1;
        int64_t lastCheckpoint = lastIteration;
        bool checkpointsEnabled = context.checkpoints != nullptr && context.checkpointInterval > 0;

        for (int64_t iteration = lastIteration + 1; iteration < numIterations; ++iteration)
        {
            if (stopRequested.load())
            {
                spdlog::info("Stop requested, ending after iteration {}", lastIteration);
                break;
            }
            runIteration(iteration);
            lastIteration = iteration;

            bool finalIteration = iteration == numIterations - 1 || stopRequested.load();
            if (checkpointsEnabled && ((iteration + 1) % context.checkpointInterval == 0 || finalIteration))
            {
                checkpoint(iteration);
                lastCheckpoint = iteration;
            }
        }
        if (checkpointsEnabled && lastCheckpoint != lastIteration)
        {
            checkpoint(lastIteration);
        }

        currentPhase = TrainerPhase::Finished;
        return lastIteration;
    }

    namespace
    {
        std::atomic<Trainer *> interruptedTrainer{nullptr};
        static_assert(std::atomic<Trainer *>::is_always_lock_free, "SIGINT handling needs a lock-free pointer");

        void handleInterrupt(int)
        {
            auto *trainer = interruptedTrainer.load();
            if (trainer != nullptr)
            {
                trainer->requestStop();
            }
        }
    }

    InterruptBinding::InterruptBinding(Trainer &trainer)
    {
        interruptedTrainer.store(&trainer);
        std::signal(SIGINT, handleInterrupt);
    }

    InterruptBinding::~InterruptBinding()
    {
        std::signal(SIGINT, SIG_DFL);
        interruptedTrainer.store(nullptr);
    }

    namespace
    {
        TrainerConfig smallMatchingConfig()
        {
            TrainerConfig config;
            config.environment.name = "Matching";
            config.environment.numEnvs = 4;
            config.model.hiddenSizes = {8};
            config.algorithm.type = "TRPO";
            config.algorithm.maxKl = 0.01;
            config.trainer.horizon = 10;
            config.valueFunction.iterations = 5;
            return config;
        }

        float lastValue(const MetricsLogger &metrics, const std::string &key)
        {
            for (const auto &entry : metrics.getLastDump())
            {
                if (entry.first == key)
                {
                    return entry.second;
                }
            }
            return std::nanf("");
        }

        // Everything a Trainer refers to, built from a configuration
        struct Session
        {
            VectorEnvironment environments;
            RolloutCollector collector;
            Policy policy;
            ValueFunction valueFunction;
            std::unique_ptr<PolicyUpdater> updater;
            AdvantageEstimator estimator;
            ValueFunctionTrainer valueTrainer;
            MetricsLogger metrics;

            explicit Session(const TrainerConfig &config)
                : environments(makeEnvironments(config.environment)),
                  collector(environments, config.trainer.horizon),
                  policy(makePolicy(config.model, 1, environments.actionSpace())),
                  valueFunction(makeValueFunction(config.model, 1)),
                  updater(makePolicyUpdater(config.algorithm, policy)),
                  estimator(config.advantage.gamma, config.advantage.lambda, config.advantage.normalize),
                  valueTrainer(valueFunction, config.valueFunction.learningRate, config.valueFunction.iterations)
            {
            }

            TrainerContext context(CheckpointManager *checkpoints = nullptr, int checkpointInterval = 1)
            {
                return TrainerContext{collector, policy, valueFunction, *updater, estimator, valueTrainer,
                                      metrics, checkpoints, checkpointInterval};
            }
        };
    }

    TEST_CASE("Trainer")
    {
        torch::manual_seed(0);
        auto config = smallMatchingConfig();

        SUBCASE("One TRPO iteration on the matching task stays inside the trust region")
        {
            Session session(config);
            Trainer trainer(session.context());

            CHECK(trainer.phase() == TrainerPhase::Init);
            CHECK(trainer.run(1) == 0);
            CHECK(trainer.phase() == TrainerPhase::Finished);

            INFO("MeanKL " << lastValue(session.metrics, "MeanKL"));
            CHECK(lastValue(session.metrics, "MeanKL") <= config.algorithm.maxKl);
            CHECK(std::isfinite(lastValue(session.metrics, "Objective")));
            CHECK(std::isfinite(lastValue(session.metrics, "ValueLoss")));
            CHECK(lastValue(session.metrics, "TotalSteps") == 40);
            CHECK(lastValue(session.metrics, "TotalEpisodes") == 8);
        }

        SUBCASE("Every strategy runs through the same loop")
        {
            for (const auto &type : {"TNPG", "Natural", "Vanilla"})
            {
                config.algorithm.type = type;
                Session session(config);
                Trainer trainer(session.context());
                CHECK(trainer.run(2) == 1);
                CHECK(std::isfinite(lastValue(session.metrics, "Objective")));
            }
        }

        SUBCASE("A stop request ends the run before the next iteration")
        {
            Session session(config);
            Trainer trainer(session.context());
            trainer.requestStop();
            CHECK(trainer.run(5) == -1);
        }

        SUBCASE("SIGINT requests a stop while the trainer is bound")
        {
            Session session(config);
            Trainer trainer(session.context());
            {
                InterruptBinding binding(trainer);
                std::raise(SIGINT);
            }
            CHECK(trainer.run(5) == -1);
        }

        SUBCASE("A zero checkpoint interval writes no checkpoint at all")
        {
            auto directory = std::filesystem::temp_directory_path() / "trustregion_trainer_no_checkpoints";
            std::filesystem::remove_all(directory);
            CheckpointManager checkpoints(directory.string());

            Session session(config);
            Trainer trainer(session.context(&checkpoints, 0));
            CHECK(trainer.run(2) == 1);
            CHECK(!checkpoints.latestIteration().has_value());

            std::filesystem::remove_all(directory);
        }

        SUBCASE("Resuming continues after the latest checkpoint")
        {
            auto directory = std::filesystem::temp_directory_path() / "trustregion_trainer_test";
            std::filesystem::remove_all(directory);
            CheckpointManager checkpoints(directory.string());

            torch::Tensor trainedParameters;
            {
                Session session(config);
                Trainer trainer(session.context(&checkpoints));
                CHECK(trainer.run(2) == 1);
                trainedParameters = session.policy->flatParameters();
            }
            REQUIRE(checkpoints.latestIteration().has_value());
            CHECK(*checkpoints.latestIteration() == 1);

            Session resumed(config);
            Trainer trainer(resumed.context(&checkpoints));
            CHECK(trainer.run(2, true) == 1);
            CHECK(torch::equal(resumed.policy->flatParameters(), trainedParameters));

            CHECK(trainer.run(3, true) == 2);
            CHECK(*checkpoints.latestIteration() == 2);
            CHECK(lastValue(resumed.metrics, "Iteration") == 2);

            std::filesystem::remove_all(directory);
        }
    }
}
