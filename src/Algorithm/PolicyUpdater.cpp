#include<algorithm>
#include<cmath>
#include<stdexcept>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/Algorithm.hpp"
#include"../../include/Model/mlp_base.hpp"

namespace TrustRegion
{
    void PolicyUpdater::save(torch::serialize::OutputArchive &) const
    {
    }

    void PolicyUpdater::load(torch::serialize::InputArchive &)
    {
    }

    torch::Tensor subsampleObservations(const torch::Tensor &observations, double ratio)
    {
        if (!(ratio > 0))
        {
            throw std::invalid_argument("The KL subsample ratio must be positive");
        }
        if (ratio >= 1)
        {
            return observations;
        }
        int64_t batchSize = observations.size(0);
        auto numSamples = std::max<int64_t>(1, static_cast<int64_t>(std::lround(ratio * batchSize)));
        auto indices = torch::randperm(batchSize, torch::TensorOptions(torch::kLong).device(observations.device()))
                           .narrow(0, 0, numSamples);
        return observations.index_select(0, indices);
    }

    double averageKl(Policy &policy, Distribution &old, const torch::Tensor &observations)
    {
        torch::NoGradGuard noGrad;
        auto current = policy->distribution(observations);
        return old.klDivergence(*current).mean().item().toDouble();
    }

    TEST_CASE("subsampleObservations()")
    {
        auto observations = torch::arange(20, torch::kFloat).view({10, 2});

        SUBCASE("Full ratio keeps every observation")
        {
            CHECK(torch::equal(subsampleObservations(observations, 1.0), observations));
        }

        SUBCASE("Partial ratio draws distinct rows")
        {
            auto sample = subsampleObservations(observations, 0.4);
            REQUIRE(sample.size(0) == 4);
            auto firstColumn = std::get<0>(sample.select(1, 0).sort());
            CHECK(torch::all((firstColumn.narrow(0, 1, 3) - firstColumn.narrow(0, 0, 3)) > 0).item().toBool());
            CHECK(torch::equal(sample.select(1, 1), sample.select(1, 0) + 1));
        }

        SUBCASE("Tiny ratios still keep one observation")
        {
            CHECK(subsampleObservations(observations, 1e-6).size(0) == 1);
        }

        SUBCASE("Rejects non-positive ratios")
        {
            CHECK_THROWS_AS(subsampleObservations(observations, 0), std::invalid_argument);
        }
    }

    TEST_CASE("averageKl()")
    {
        Policy policy(ActionSpace{"Discrete", {3}}, std::make_shared<MlpBase>(2, std::vector<unsigned int>{4}));
        auto observations = torch::randn({8, 2});
        auto old = policy->distribution(observations)->detach();

        CHECK(averageKl(policy, *old, observations) == doctest::Approx(0).epsilon(1e-6));

        auto shifted = policy->flatParameters() + 0.5;
        policy->setFlatParameters(shifted);
        CHECK(averageKl(policy, *old, observations) > 0);
    }
}
