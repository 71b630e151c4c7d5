#include<filesystem>
#include<fstream>
#include<mutex>
#include<regex>
#include<string>

#include<ATen/CPUGeneratorImpl.h>
#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/Checkpoint.hpp"
#include"../include/Errors.hpp"
#include"../include/Algorithms/VanillaPG.hpp"
#include"../include/Model/mlp_base.hpp"
#include"../include/Model/modelUtils.hpp"

namespace TrustRegion
{
    namespace
    {
        void checkState(const TrainingState &state)
        {
            if (state.policy.is_empty() || state.valueFunction.is_empty() ||
                state.policyUpdater == nullptr || state.valueFunctionTrainer == nullptr)
            {
                throw std::invalid_argument("Training state is missing a component");
            }
        }
    }

    CheckpointManager::CheckpointManager(std::string directory)
        : directory(std::move(directory))
    {
    }

    std::string CheckpointManager::checkpointPath(int64_t iteration) const
    {
        return (std::filesystem::path(directory) / ("checkpoint_" + std::to_string(iteration) + ".pt")).string();
    }

    void CheckpointManager::save(int64_t iteration, const TrainingState &state) const
    {
        checkState(state);
        auto path = checkpointPath(iteration);
        auto temporary = path + ".tmp";
        try
        {
            std::filesystem::create_directories(directory);

            torch::serialize::OutputArchive archive;
            torch::serialize::OutputArchive policyArchive;
            state.policy->save(policyArchive);
            archive.write("policy", policyArchive);

            torch::serialize::OutputArchive valueArchive;
            state.valueFunction->save(valueArchive);
            archive.write("value_function", valueArchive);

            torch::serialize::OutputArchive policyOptimizerArchive;
            state.policyUpdater->save(policyOptimizerArchive);
            archive.write("policy_optimizer", policyOptimizerArchive);

            torch::serialize::OutputArchive valueOptimizerArchive;
            state.valueFunctionTrainer->save(valueOptimizerArchive);
            archive.write("value_optimizer", valueOptimizerArchive);

            archive.write("last_iteration", torch::tensor({iteration}, torch::kLong));
            {
                auto generator = at::detail::getDefaultCPUGenerator();
                std::lock_guard<std::mutex> lock(generator.mutex());
                archive.write("rng_state", generator.get_state());
            }

            archive.save_to(temporary);
            std::filesystem::rename(temporary, path);
        }
        catch (const std::exception &error)
        {
            throw CheckpointError("Could not write checkpoint " + path + ": " + error.what());
        }
        spdlog::debug("Saved checkpoint {}", path);
    }

    void CheckpointManager::load(int64_t iteration, TrainingState &state) const
    {
        checkState(state);
        auto path = checkpointPath(iteration);
        if (!std::filesystem::exists(path))
        {
            throw CheckpointError("No checkpoint at " + path);
        }
        try
        {
            torch::serialize::InputArchive archive;
            archive.load_from(path);

            torch::serialize::InputArchive policyArchive;
            archive.read("policy", policyArchive);
            state.policy->load(policyArchive);

            torch::serialize::InputArchive valueArchive;
            archive.read("value_function", valueArchive);
            state.valueFunction->load(valueArchive);

            torch::serialize::InputArchive policyOptimizerArchive;
            archive.read("policy_optimizer", policyOptimizerArchive);
            state.policyUpdater->load(policyOptimizerArchive);

            torch::serialize::InputArchive valueOptimizerArchive;
            archive.read("value_optimizer", valueOptimizerArchive);
            state.valueFunctionTrainer->load(valueOptimizerArchive);

            torch::Tensor lastIteration;
            archive.read("last_iteration", lastIteration);
            state.lastIteration = lastIteration.item<int64_t>();

            torch::Tensor rngState;
            archive.read("rng_state", rngState);
            auto generator = at::detail::getDefaultCPUGenerator();
            std::lock_guard<std::mutex> lock(generator.mutex());
            generator.set_state(rngState);
        }
        catch (const std::exception &error)
        {
            throw CheckpointError("Could not read checkpoint " + path + ": " + error.what());
        }
        spdlog::info("Restored checkpoint {} (iteration {})", path, state.lastIteration);
    }

    std::optional<int64_t> CheckpointManager::latestIteration() const
    {
        std::error_code errorCode;
        if (!std::filesystem::is_directory(directory, errorCode))
        {
            return std::nullopt;
        }

        static const std::regex pattern("checkpoint_([0-9]+)\\.pt");
        std::optional<int64_t> latest;
        for (const auto &entry : std::filesystem::directory_iterator(directory))
        {
            std::smatch match;
            auto filename = entry.path().filename().string();
            if (entry.is_regular_file() && std::regex_match(filename, match, pattern))
            {
                auto iteration = std::stoll(match[1].str());
                if (!latest || iteration > *latest)
                {
                    latest = iteration;
                }
            }
        }
        return latest;
    }

    TEST_CASE("CheckpointManager")
    {
        auto directory = std::filesystem::temp_directory_path() / "trustregion_checkpoint_test";
        std::filesystem::remove_all(directory);
        CheckpointManager manager(directory.string());

        torch::manual_seed(0);
        Policy policy(ActionSpace{"Discrete", {2}}, std::make_shared<MlpBase>(3, std::vector<unsigned int>{4}));
        ValueFunction valueFunction(std::make_shared<MlpBase>(3, std::vector<unsigned int>{4}));
        VanillaPG updater(policy, 1e-2);
        ValueFunctionTrainer valueTrainer(valueFunction, 1e-2, 2);

        TrainingBatch batch;
        batch.observations = torch::rand({8, 3});
        batch.actions = torch::randint(0, 2, {8, 1}, torch::kLong);
        batch.distributionParameters = policy->distribution(batch.observations)->flatParameters().detach();
        batch.actionLogProbs = torch::zeros({8, 1});
        batch.advantages = torch::randn({8, 1});
        batch.valuePredictions = torch::zeros({8, 1});
        batch.returns = torch::randn({8, 1});
        updater.update(batch);
        valueTrainer.update(batch);

        TrainingState state{policy, valueFunction, &updater, &valueTrainer, 3};

        SUBCASE("No checkpoints yet")
        {
            CHECK(!manager.latestIteration().has_value());
            CHECK_THROWS_AS(manager.load(0, state), CheckpointError);
        }

        SUBCASE("Round trip restores parameters and the iteration counter")
        {
            auto policyParameters = policy->flatParameters();
            auto valueParameters = flattenParameters(valueFunction->parameters());
            manager.save(3, state);
            auto expectedDraw = torch::rand({4});

            policy->setFlatParameters(torch::zeros_like(policyParameters));
            assignFlatParameters(valueFunction->parameters(), torch::zeros_like(valueParameters));
            torch::rand({100});
            state.lastIteration = -1;

            manager.load(3, state);
            CHECK(torch::equal(policy->flatParameters(), policyParameters));
            CHECK(torch::equal(flattenParameters(valueFunction->parameters()), valueParameters));
            CHECK(state.lastIteration == 3);
            CHECK(torch::equal(torch::rand({4}), expectedDraw));

            SUBCASE("Optimizers keep working on the restored parameters")
            {
                auto data = updater.update(batch);
                CHECK(!torch::equal(policy->flatParameters(), policyParameters));
                CHECK(data.back().value == 1);
            }
        }

        SUBCASE("latestIteration() picks the highest index")
        {
            manager.save(1, state);
            manager.save(12, state);
            manager.save(4, state);
            std::ofstream(directory / "notes.txt") << "not a checkpoint";

            REQUIRE(manager.latestIteration().has_value());
            CHECK(*manager.latestIteration() == 12);
            CHECK(!std::filesystem::exists(manager.checkpointPath(12) + ".tmp"));
        }

        SUBCASE("Corrupt files raise CheckpointError")
        {
            std::filesystem::create_directories(directory);
            std::ofstream(manager.checkpointPath(5)) << "garbage";
            CHECK_THROWS_AS(manager.load(5, state), CheckpointError);
        }

        std::filesystem::remove_all(directory);
    }
}
