#include<cmath>
#include<limits>
#include<stdexcept>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Distribution/Normal.hpp"
#include"../../include/Distribution/Categorical.hpp"

namespace TrustRegion
{
    Normal::Normal(const torch::Tensor loc, const torch::Tensor scale)
    {
        auto broadcastedTensors = torch::broadcast_tensors({loc, scale});
        this->loc = broadcastedTensors[0];
        this->scale = broadcastedTensors[1];
        this->batch_shape = this->loc.sizes().vec();
        this->event_shape = {};
    }

    torch::Tensor Normal::entropy()
    {
        return (0.5 + 0.5 * std::log(2 * M_PI) + torch::log(scale)).sum(-1);
    }

    /**
     * @details log N(x; mu, sigma) = -(x - mu)^2 / (2 sigma^2) - log(sigma) - log(sqrt(2 pi)),
     * evaluated element-wise.
     */
    torch::Tensor Normal::logProbability(torch::Tensor value)
    {
        auto variance = scale.pow(2);
        auto logScale = scale.log();
        return -(value - loc).pow(2) / (2 * variance) - logScale - std::log(std::sqrt(2 * M_PI));
    }

    torch::Tensor Normal::sample(c10::ArrayRef<int64_t> sampleShape)
    {
        auto shape = extendedShape(sampleShape);
        torch::NoGradGuard noGrad;
        return at::normal(loc.expand(shape), scale.expand(shape));
    }

    /**
     * @details KL(p || q) = log(sigma_q / sigma_p) + (sigma_p^2 + (mu_p - mu_q)^2) / (2 sigma_q^2) - 1/2
     */
    torch::Tensor Normal::klDivergence(Distribution &other)
    {
        auto *normal = dynamic_cast<Normal *>(&other);
        if (normal == nullptr)
        {
            throw std::invalid_argument("KL divergence between a Normal and a different family is undefined");
        }
        auto varianceRatio = (scale / normal->scale).pow(2);
        auto meanTerm = ((loc - normal->loc) / normal->scale).pow(2);
        return (0.5 * (varianceRatio + meanTerm - 1 - varianceRatio.log())).sum(-1);
    }

    torch::Tensor Normal::flatParameters()
    {
        return torch::cat({loc, scale}, -1);
    }

    std::unique_ptr<Distribution> Normal::detach()
    {
        return std::make_unique<Normal>(loc.detach(), scale.detach());
    }

    TEST_CASE("Normal")
    {
        float locsArray[] = {0, 1, 2, 3, 4, 5};
        float scalesArray[] = {5, 4, 3, 2, 1, 1};
        auto locs = torch::from_blob(locsArray, {2, 3});
        auto scales = torch::from_blob(scalesArray, {2, 3});
        auto dist = Normal(locs, scales);

        SUBCASE("Sample shape is [sample, batch, action]")
        {
            CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{2, 3});
            CHECK(dist.sample({20}).sizes().vec() == std::vector<int64_t>{20, 2, 3});
        }

        SUBCASE("Entropy is summed over action dimensions")
        {
            auto entropies = dist.entropy();
            INFO("Entropies: \n" << entropies);

            CHECK(entropies.sizes().vec() == std::vector<int64_t>{2});
            CHECK(entropies[0].item().toDouble() == doctest::Approx(8.3512).epsilon(1e-3));
        }

        SUBCASE("Log probabilities are reported per dimension")
        {
            float actions[2][3] = {{0, 1, 2},
                                   {0, 1, 2}};
            auto actionsTensor = torch::from_blob(actions, {2, 3});
            auto logProbs = dist.logProbability(actionsTensor);

            INFO(logProbs << "\n");
            CHECK(logProbs.sizes().vec() == std::vector<int64_t>{2, 3});
            CHECK(logProbs[0][0].item().toDouble() == doctest::Approx(-2.5284).epsilon(1e-3));
            CHECK(logProbs[0][1].item().toDouble() == doctest::Approx(-2.3052).epsilon(1e-3));
            CHECK(logProbs[1][0].item().toDouble() == doctest::Approx(-2.7371).epsilon(1e-3));
        }

        SUBCASE("klDivergence()")
        {
            auto p = Normal(torch::zeros({1, 1}), torch::ones({1, 1}));
            auto q = Normal(torch::ones({1, 1}), torch::full({1, 1}, 2.0));

            SUBCASE("Matches the closed form")
            {
                // log 2 + (1 + 1) / 8 - 0.5
                CHECK(p.klDivergence(q)[0].item().toDouble() == doctest::Approx(0.4431).epsilon(1e-3));
            }

            SUBCASE("Is zero against itself")
            {
                CHECK(dist.klDivergence(dist).abs().max().item().toDouble() < 1e-6);
            }

            SUBCASE("Rejects a different family")
            {
                auto logits = torch::zeros({1, 2});
                auto categorical = Categorical(nullptr, &logits);
                CHECK_THROWS_AS(p.klDivergence(categorical), std::invalid_argument);
            }
        }

        SUBCASE("Flat parameters hold mean then standard deviation")
        {
            auto parameters = dist.flatParameters();
            CHECK(parameters.sizes().vec() == std::vector<int64_t>{2, 6});
            CHECK(parameters[1][3].item().toFloat() == doctest::Approx(2));
            CHECK(parameters[0][1].item().toFloat() == doctest::Approx(1));
        }
    }
}
