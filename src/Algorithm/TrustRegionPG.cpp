#include<cmath>
#include<limits>
#include<stdexcept>
#include<string>

#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/TrustRegionPG.hpp"
#include"../../include/Model/mlp_base.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/Optim/ConjugateGradient.hpp"
#include"../../include/Optim/FisherVectorProduct.hpp"

namespace TrustRegion
{
    TrustRegionPG::TrustRegionPG(Policy &policy,
                                 double maxKl,
                                 const NaturalGradientOptions &options,
                                 bool lineSearch,
                                 const LineSearchOptions &lineSearchOptions)
        : policy(policy),
          maxKl(maxKl),
          options(options),
          lineSearch(lineSearch),
          lineSearchOptions(lineSearchOptions)
    {
        if (maxKl < 0)
        {
            throw std::invalid_argument("The trust region radius must not be negative");
        }
    }

    std::vector<UpdateDatum> TrustRegionPG::update(const TrainingBatch &batch)
    {
        auto parameters = policy->parameters();
        auto oldDistribution = policy->distributionFromParameters(batch.distributionParameters);
        const auto &oldLogProbs = batch.actionLogProbs;

        auto distribution = policy->distribution(batch.observations);
        auto logProbs = policy->logProbability(*distribution, batch.actions);
        auto surrogateLoss = -((logProbs - oldLogProbs).exp() * batch.advantages).mean();
        auto objective = (logProbs * batch.advantages).mean().item().toFloat();
        auto entropy = distribution->entropy().mean().item().toFloat();
        auto gradient = flatGrad(surrogateLoss, parameters);
        double y0 = surrogateLoss.item().toDouble();

        auto rejected = [&](const char *what) -> std::vector<UpdateDatum> {
            spdlog::warn("Non-finite {}, skipping this update", what);
            return {{"Objective", objective},
                    {"SurrogateLoss", static_cast<float>(y0)},
                    {"MeanKL", 0},
                    {"Entropy", entropy},
                    {"ExpectedImprovement", 0},
                    {"ActualImprovement", 0},
                    {"ImprovementRatio", 0},
                    {"LineSearchEvaluations", 0},
                    {"StepAccepted", 0}};
        };
        if (!std::isfinite(y0) || !allFinite(gradient))
        {
            return rejected("policy gradient");
        }

        torch::Tensor direction;
        double curvature;
        {
            auto observations = subsampleObservations(batch.observations, options.klSubsampleRatio);
            FisherVectorProduct fisher(policy, observations, options.damping);
            direction = conjugateGradient(fisher, gradient, options.cgIterations, options.cgResidualTolerance).solution;
            if (!allFinite(direction))
            {
                return rejected("search direction");
            }
            curvature = direction.dot(fisher(direction)).item().toDouble();
        }
        double scale = std::sqrt(2 * maxKl / (curvature + 1e-8));
        if (!std::isfinite(curvature) || !std::isfinite(scale))
        {
            return rejected("step size");
        }

        auto fullStep = scale * direction;
        double expectedImprovement = gradient.dot(fullStep).item().toDouble();
        auto x0 = policy->flatParameters();

        SurrogateEvaluator evaluate = [&](const torch::Tensor &candidate) {
            torch::NoGradGuard noGrad;
            policy->setFlatParameters(candidate);
            auto newDistribution = policy->distribution(batch.observations);
            auto newLogProbs = policy->logProbability(*newDistribution, batch.actions);
            auto loss = -((newLogProbs - oldLogProbs).exp() * batch.advantages).mean();
            auto kl = oldDistribution->klDivergence(*newDistribution).mean();
            return SurrogateEvaluation{loss.item().toDouble(), kl.item().toDouble()};
        };

        LineSearchResult result;
        if (lineSearch)
        {
            result = trustRegionLineSearch(evaluate, x0, fullStep, expectedImprovement, y0, maxKl, lineSearchOptions);
            if (!result.accepted)
            {
                spdlog::info("Line search found no step inside the trust region");
            }
        }
        else
        {
            auto candidate = x0 - fullStep;
            auto evaluation = evaluate(candidate);
            if (std::isfinite(evaluation.loss) && std::isfinite(evaluation.kl))
            {
                result = {candidate, true, expectedImprovement, y0 - evaluation.loss, 1};
            }
            else
            {
                spdlog::warn("Non-finite surrogate after the step, skipping this update");
                result = {x0, false, expectedImprovement, 0.0, 1};
            }
        }
        policy->setFlatParameters(result.parameters);

        double meanKl = averageKl(policy, *oldDistribution, batch.observations);
        double ratio = result.expectedImprovement != 0 ? result.actualImprovement / result.expectedImprovement : 0;

        return {{"Objective", objective},
                {"SurrogateLoss", static_cast<float>(y0)},
                {"MeanKL", static_cast<float>(meanKl)},
                {"Entropy", entropy},
                {"ExpectedImprovement", static_cast<float>(result.expectedImprovement)},
                {"ActualImprovement", static_cast<float>(result.actualImprovement)},
                {"ImprovementRatio", static_cast<float>(ratio)},
                {"LineSearchEvaluations", static_cast<float>(result.evaluations)},
                {"StepAccepted", result.accepted ? 1.f : 0.f}};
    }

    namespace
    {
        TrainingBatch preferActionOne(Policy &policy, int64_t size)
        {
            torch::NoGradGuard noGrad;
            TrainingBatch batch;
            batch.observations = torch::randn({size, 2});
            batch.actions = (torch::arange(size) % 2).view({size, 1});
            auto distribution = policy->distribution(batch.observations);
            batch.distributionParameters = distribution->flatParameters();
            batch.actionLogProbs = policy->logProbability(*distribution, batch.actions);
            batch.advantages = batch.actions.to(torch::kFloat) * 2 - 1;
            batch.returns = batch.advantages.clone();
            batch.valuePredictions = torch::zeros({size, 1});
            return batch;
        }

        float datum(const std::vector<UpdateDatum> &data, const std::string &name)
        {
            for (const auto &entry : data)
            {
                if (entry.name == name)
                {
                    return entry.value;
                }
            }
            FAIL("Missing metric " << name);
            return 0;
        }
    }

    TEST_CASE("TrustRegionPG")
    {
        torch::manual_seed(0);
        Policy policy(ActionSpace{"Discrete", {2}}, std::make_shared<MlpBase>(2, std::vector<unsigned int>{8}));
        NaturalGradientOptions options;
        const double maxKl = 0.01;

        SUBCASE("TRPO improves the surrogate and respects the trust region")
        {
            TrustRegionPG trpo(policy, maxKl, options, true);
            auto batch = preferActionOne(policy, 64);
            auto data = trpo.update(batch);

            CHECK(datum(data, "StepAccepted") == 1);
            CHECK(datum(data, "MeanKL") <= maxKl);
            CHECK(datum(data, "ActualImprovement") > 0);
            CHECK(datum(data, "LineSearchEvaluations") >= 1);
            CHECK(std::isfinite(datum(data, "Objective")));

            // The surrogate at the new parameters is lower than before
            torch::NoGradGuard noGrad;
            auto logProbs = policy->logProbability(*policy->distribution(batch.observations), batch.actions);
            auto loss = -((logProbs - batch.actionLogProbs).exp() * batch.advantages).mean().item().toFloat();
            CHECK(loss < datum(data, "SurrogateLoss"));
        }

        SUBCASE("TNPG takes the scaled step without searching")
        {
            TrustRegionPG tnpg(policy, maxKl, options, false);
            auto before = policy->flatParameters();
            auto data = tnpg.update(preferActionOne(policy, 64));

            CHECK(datum(data, "StepAccepted") == 1);
            CHECK(datum(data, "LineSearchEvaluations") == 1);
            CHECK(!torch::equal(policy->flatParameters(), before));
            // The quadratic model of the KL is accurate for small steps
            CHECK(datum(data, "MeanKL") < 3 * maxKl);
        }

        SUBCASE("A zero trust region keeps the parameters")
        {
            TrustRegionPG trpo(policy, 0.0, options, true);
            auto before = policy->flatParameters();
            auto data = trpo.update(preferActionOne(policy, 32));

            CHECK(datum(data, "StepAccepted") == 0);
            CHECK(datum(data, "ActualImprovement") == 0);
            CHECK(torch::equal(policy->flatParameters(), before));
        }

        SUBCASE("Non-finite advantages leave the parameters untouched")
        {
            TrustRegionPG trpo(policy, maxKl, options, true);
            auto batch = preferActionOne(policy, 16);
            batch.advantages[5] = std::numeric_limits<float>::quiet_NaN();
            auto before = policy->flatParameters();

            auto data = trpo.update(batch);
            CHECK(datum(data, "StepAccepted") == 0);
            CHECK(torch::equal(policy->flatParameters(), before));
        }

        SUBCASE("Gaussian policies")
        {
            Policy gaussian(ActionSpace{"Box", {2}}, std::make_shared<MlpBase>(3, std::vector<unsigned int>{8}));
            TrustRegionPG trpo(gaussian, maxKl, options, true);

            TrainingBatch batch;
            {
                torch::NoGradGuard noGrad;
                batch.observations = torch::randn({64, 3});
                auto acted = gaussian->act(batch.observations);
                batch.actions = acted[0];
                batch.actionLogProbs = acted[1];
                batch.distributionParameters = acted[2];
                // Reward actions whose first coordinate is positive
                batch.advantages = batch.actions.narrow(1, 0, 1).sign();
                batch.returns = batch.advantages.clone();
                batch.valuePredictions = torch::zeros({64, 1});
            }
            auto data = trpo.update(batch);
            CHECK(datum(data, "MeanKL") <= maxKl);
            CHECK(datum(data, "ActualImprovement") >= 0);
        }

        SUBCASE("Rejects a negative radius")
        {
            CHECK_THROWS_AS(TrustRegionPG(policy, -1, options), std::invalid_argument);
        }
    }
}
