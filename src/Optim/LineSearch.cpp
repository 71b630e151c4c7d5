#include<cmath>

#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Optim/LineSearch.hpp"

namespace TrustRegion
{
    LineSearchResult trustRegionLineSearch(const SurrogateEvaluator &evaluate,
                                           const torch::Tensor &x0,
                                           const torch::Tensor &fullStep,
                                           double expectedImprovement,
                                           double y0,
                                           double maxKl,
                                           const LineSearchOptions &options)
    {
        double stepFraction = 1.0;
        int evaluations = 0;
        for (int k = 0; k < options.maxBacktracks; ++k, stepFraction *= options.backtrackRatio)
        {
            auto candidate = x0 - stepFraction * fullStep;
            auto evaluation = evaluate(candidate);
            evaluations++;

            if (!std::isfinite(evaluation.loss) || !std::isfinite(evaluation.kl))
            {
                spdlog::debug("Line search step {}: non-finite surrogate, backtracking", k);
                continue;
            }
            double improvement = y0 - evaluation.loss;
            double expected = stepFraction * expectedImprovement;
            spdlog::debug("Line search step {}: improvement {:.6g} of {:.6g}, kl {:.6g}",
                          k, improvement, expected, evaluation.kl);
            if (evaluation.kl < maxKl && improvement >= options.acceptRatio * expected)
            {
                return {candidate, true, expected, improvement, evaluations};
            }
        }

        return {x0.clone(), false, expectedImprovement, 0.0, evaluations};
    }

    TEST_CASE("trustRegionLineSearch")
    {
        // Quadratic loss 0.5 |x|^2 with a KL that grows with the distance from x0
        auto x0 = torch::tensor({1.0, -2.0}, torch::kDouble);
        auto fullStep = x0.clone();
        double y0 = 0.5 * x0.dot(x0).item().toDouble();
        double expectedImprovement = x0.dot(fullStep).item().toDouble();
        int calls = 0;
        SurrogateEvaluator evaluate = [&](const torch::Tensor &x) {
            calls++;
            auto distance = (x - x0).pow(2).sum().item().toDouble();
            return SurrogateEvaluation{0.5 * x.dot(x).item().toDouble(), 0.01 * distance};
        };

        SUBCASE("An acceptable full step is taken after one evaluation")
        {
            auto result = trustRegionLineSearch(evaluate, x0, fullStep, expectedImprovement, y0, 1.0);

            CHECK(result.accepted);
            CHECK(result.evaluations == 1);
            CHECK(calls == 1);
            CHECK(torch::allclose(result.parameters, torch::zeros({2}, torch::kDouble)));
            CHECK(result.actualImprovement == doctest::Approx(y0));
            CHECK(result.expectedImprovement == doctest::Approx(expectedImprovement));
        }

        SUBCASE("Backtracks until the KL constraint holds")
        {
            // Full step has KL 0.05, the third candidate 0.64^2 * 0.05
            auto result = trustRegionLineSearch(evaluate, x0, fullStep, expectedImprovement, y0, 0.03);

            CHECK(result.accepted);
            CHECK(result.evaluations == 3);
            CHECK(torch::allclose(result.parameters, x0 * (1 - 0.64)));
            CHECK(result.expectedImprovement == doctest::Approx(0.64 * expectedImprovement));
        }

        SUBCASE("A zero trust region keeps the original parameters")
        {
            auto result = trustRegionLineSearch(evaluate, x0, fullStep, expectedImprovement, y0, 0.0);

            CHECK(!result.accepted);
            CHECK(result.evaluations == 10);
            CHECK(torch::equal(result.parameters, x0));
            CHECK(result.actualImprovement == 0);
        }

        SUBCASE("Candidates that do not improve are rejected")
        {
            auto result = trustRegionLineSearch(evaluate, x0, -fullStep, -expectedImprovement, y0, 1.0,
                                                LineSearchOptions{4, 0.5, 0.1});
            CHECK(!result.accepted);
            CHECK(result.evaluations == 4);
        }

        SUBCASE("Non-finite candidates are skipped")
        {
            SurrogateEvaluator unstable = [&](const torch::Tensor &x) {
                calls++;
                if (calls == 1)
                {
                    return SurrogateEvaluation{std::nan(""), 0.0};
                }
                return evaluate(x);
            };
            auto result = trustRegionLineSearch(unstable, x0, fullStep, expectedImprovement, y0, 1.0);
            CHECK(result.accepted);
            CHECK(result.evaluations == 2);
        }
    }
}
