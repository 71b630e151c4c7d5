#include<limits>

#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/NaturalPG.hpp"
#include"../../include/Model/mlp_base.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/Optim/ConjugateGradient.hpp"
#include"../../include/Optim/FisherVectorProduct.hpp"

namespace TrustRegion
{
    NaturalPG::NaturalPG(Policy &policy, double learningRate, const NaturalGradientOptions &options)
        : policy(policy),
          options(options),
          optimizer(std::make_unique<torch::optim::Adam>(policy->parameters(),
                                                         torch::optim::AdamOptions(learningRate)))
    {
    }

    std::vector<UpdateDatum> NaturalPG::update(const TrainingBatch &batch)
    {
        auto parameters = policy->parameters();
        auto oldDistribution = policy->distributionFromParameters(batch.distributionParameters);

        auto distribution = policy->distribution(batch.observations);
        auto objective = (policy->logProbability(*distribution, batch.actions) * batch.advantages).mean();
        auto entropy = distribution->entropy().mean().item().toFloat();
        auto gradient = flatGrad(-objective, parameters);

        auto rejected = [&](const char *what) -> std::vector<UpdateDatum> {
            spdlog::warn("Non-finite {}, skipping this update", what);
            return {{"Objective", objective.item().toFloat()},
                    {"MeanKL", 0},
                    {"Entropy", entropy},
                    {"CGIterations", 0},
                    {"StepAccepted", 0}};
        };
        if (!allFinite(gradient))
        {
            return rejected("policy gradient");
        }

        auto observations = subsampleObservations(batch.observations, options.klSubsampleRatio);
        FisherVectorProduct fisher(policy, observations, options.damping);
        auto solution = conjugateGradient(fisher, gradient, options.cgIterations, options.cgResidualTolerance);
        if (!allFinite(solution.solution))
        {
            return rejected("natural gradient");
        }

        optimizer->zero_grad();
        int64_t offset = 0;
        for (auto &parameter : parameters)
        {
            auto slice = solution.solution.narrow(0, offset, parameter.numel()).view_as(parameter);
            parameter.mutable_grad() = slice.detach().clone();
            offset += parameter.numel();
        }
        optimizer->step();

        return {{"Objective", objective.item().toFloat()},
                {"MeanKL", static_cast<float>(averageKl(policy, *oldDistribution, batch.observations))},
                {"Entropy", entropy},
                {"CGIterations", static_cast<float>(solution.iterations)},
                {"StepAccepted", 1}};
    }

    void NaturalPG::save(torch::serialize::OutputArchive &archive) const
    {
        optimizer->save(archive);
    }

    void NaturalPG::load(torch::serialize::InputArchive &archive)
    {
        optimizer->load(archive);
    }

    namespace
    {
        TrainingBatch matchObservation(Policy &policy, int64_t size)
        {
            torch::NoGradGuard noGrad;
            TrainingBatch batch;
            batch.observations = (torch::arange(size) % 2).to(torch::kFloat).view({size, 1});
            batch.actions = ((torch::arange(size) % 4) >= 2).to(torch::kLong).view({size, 1});
            auto distribution = policy->distribution(batch.observations);
            batch.distributionParameters = distribution->flatParameters();
            batch.actionLogProbs = policy->logProbability(*distribution, batch.actions);
            // +1 when the action matches the observation, -1 otherwise
            batch.advantages = 1 - 2 * (batch.actions.to(torch::kFloat) - batch.observations).abs();
            batch.returns = batch.advantages.clone();
            batch.valuePredictions = torch::zeros({size, 1});
            return batch;
        }
    }

    TEST_CASE("NaturalPG")
    {
        torch::manual_seed(0);
        Policy policy(ActionSpace{"Discrete", {2}}, std::make_shared<MlpBase>(1, std::vector<unsigned int>{6}));
        NaturalGradientOptions options;
        options.damping = 1e-2;
        NaturalPG natural(policy, 1e-2, options);

        SUBCASE("update() learns to match the observation")
        {
            auto observations = torch::tensor({0.f, 1.f}).view({2, 1});
            auto before = policy->getProbability(observations);
            for (int i = 0; i < 20; ++i)
            {
                natural.update(matchObservation(policy, 16));
            }
            auto after = policy->getProbability(observations);

            INFO("Before: \n" << before << "\nAfter: \n" << after);
            CHECK(after[0][0].item().toDouble() > before[0][0].item().toDouble());
            CHECK(after[1][1].item().toDouble() > before[1][1].item().toDouble());
        }

        SUBCASE("Reports the conjugate gradient effort")
        {
            auto data = natural.update(matchObservation(policy, 8));
            REQUIRE(data.size() == 5);
            CHECK(data[3].name == "CGIterations");
            CHECK(data[3].value >= 1);
            CHECK(data[3].value <= options.cgIterations);
        }

        SUBCASE("Non-finite advantages leave the parameters untouched")
        {
            auto batch = matchObservation(policy, 8);
            batch.advantages[3] = std::numeric_limits<float>::infinity();
            auto parameters = policy->flatParameters();

            auto data = natural.update(batch);
            CHECK(torch::equal(policy->flatParameters(), parameters));
            CHECK(data.back().value == 0);
        }
    }
}
