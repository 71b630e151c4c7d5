#include<limits>

#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/VanillaPG.hpp"
#include"../../include/Model/mlp_base.hpp"
#include"../../include/Model/modelUtils.hpp"

namespace TrustRegion
{
    VanillaPG::VanillaPG(Policy &policy, double learningRate)
        : policy(policy),
          optimizer(std::make_unique<torch::optim::Adam>(policy->parameters(),
                                                         torch::optim::AdamOptions(learningRate)))
    {
    }

    std::vector<UpdateDatum> VanillaPG::update(const TrainingBatch &batch)
    {
        auto oldDistribution = policy->distributionFromParameters(batch.distributionParameters);

        auto distribution = policy->distribution(batch.observations);
        auto logProbs = policy->logProbability(*distribution, batch.actions);
        auto objective = (logProbs * batch.advantages).mean();
        auto entropy = distribution->entropy().mean().item().toFloat();

        optimizer->zero_grad();
        (-objective).backward();

        bool finite = allFinite(objective);
        for (const auto &parameter : policy->parameters())
        {
            if (parameter.grad().defined() && !allFinite(parameter.grad()))
            {
                finite = false;
            }
        }
        if (!finite)
        {
            spdlog::warn("Non-finite policy gradient, skipping this update");
            optimizer->zero_grad();
            return {{"Objective", objective.item().toFloat()},
                    {"MeanKL", 0},
                    {"Entropy", entropy},
                    {"StepAccepted", 0}};
        }
        optimizer->step();

        return {{"Objective", objective.item().toFloat()},
                {"MeanKL", static_cast<float>(averageKl(policy, *oldDistribution, batch.observations))},
                {"Entropy", entropy},
                {"StepAccepted", 1}};
    }

    void VanillaPG::save(torch::serialize::OutputArchive &archive) const
    {
        optimizer->save(archive);
    }

    void VanillaPG::load(torch::serialize::InputArchive &archive)
    {
        optimizer->load(archive);
    }

    namespace
    {
        // Action 1 is always better than action 0, whatever the observation
        TrainingBatch preferActionOne(Policy &policy, int64_t size)
        {
            torch::NoGradGuard noGrad;
            TrainingBatch batch;
            batch.observations = torch::ones({size, 1});
            batch.actions = (torch::arange(size) % 2).view({size, 1});
            auto distribution = policy->distribution(batch.observations);
            batch.distributionParameters = distribution->flatParameters();
            batch.actionLogProbs = policy->logProbability(*distribution, batch.actions);
            batch.advantages = batch.actions.to(torch::kFloat) * 2 - 1;
            batch.returns = batch.advantages.clone();
            batch.valuePredictions = torch::zeros({size, 1});
            return batch;
        }
    }

    TEST_CASE("VanillaPG")
    {
        torch::manual_seed(0);
        Policy policy(ActionSpace{"Discrete", {2}}, std::make_shared<MlpBase>(1, std::vector<unsigned int>{5}));
        VanillaPG vanilla(policy, 1e-2);

        SUBCASE("update() shifts probability towards the better action")
        {
            auto before = policy->getProbability(torch::ones({1, 1}))[0][1].item().toDouble();
            std::vector<UpdateDatum> data;
            for (int i = 0; i < 10; ++i)
            {
                data = vanilla.update(preferActionOne(policy, 16));
            }
            auto after = policy->getProbability(torch::ones({1, 1}))[0][1].item().toDouble();

            INFO("Before: " << before << ", after: " << after);
            CHECK(after > before);
            REQUIRE(data.size() == 4);
            CHECK(data[0].name == "Objective");
            CHECK(data[1].value > 0);
            CHECK(data[3].value == 1);
        }

        SUBCASE("Non-finite advantages leave the parameters untouched")
        {
            auto batch = preferActionOne(policy, 8);
            batch.advantages[0] = std::numeric_limits<float>::quiet_NaN();
            auto parameters = policy->flatParameters();

            auto data = vanilla.update(batch);
            CHECK(torch::equal(policy->flatParameters(), parameters));
            CHECK(data.back().name == "StepAccepted");
            CHECK(data.back().value == 0);
        }
    }
}
