#include<stdexcept>

#include<doctest/doctest.h>

#include"../../include/Environment/MatchingEnvironment.hpp"

namespace TrustRegion
{
    MatchingEnvironment::MatchingEnvironment(int episodeLength, int phase)
        : episodeLength(episodeLength),
          phase(phase % 2),
          stepCount(0)
    {
        if (episodeLength < 1)
        {
            throw std::invalid_argument("Matching episodes need at least one step");
        }
    }

    float MatchingEnvironment::currentObservation() const
    {
        return static_cast<float>((phase + stepCount) % 2);
    }

    torch::Tensor MatchingEnvironment::reset()
    {
        stepCount = 0;
        return torch::full({1}, currentObservation());
    }

    StepResult MatchingEnvironment::step(const torch::Tensor &action)
    {
        auto chosen = action.reshape({-1})[0].item<int64_t>();
        if (chosen != 0 && chosen != 1)
        {
            throw std::invalid_argument("Matching actions are 0 or 1, got " + std::to_string(chosen));
        }

        float reward = chosen == static_cast<int64_t>(currentObservation()) ? 1.f : -1.f;
        stepCount++;
        bool done = stepCount >= episodeLength;

        return {torch::full({1}, currentObservation()), reward, done, {}};
    }

    void MatchingEnvironment::seed(uint64_t)
    {
    }

    std::vector<int64_t> MatchingEnvironment::observationShape() const
    {
        return {1};
    }

    ActionSpace MatchingEnvironment::actionSpace() const
    {
        return {"Discrete", {2}};
    }

    TEST_CASE("MatchingEnvironment")
    {
        MatchingEnvironment environment(3, 1);

        SUBCASE("Observations alternate starting from the phase")
        {
            CHECK(environment.reset().item<float>() == 1);
            CHECK(environment.step(torch::tensor({0}, torch::kLong)).observation.item<float>() == 0);
            CHECK(environment.step(torch::tensor({0}, torch::kLong)).observation.item<float>() == 1);
        }

        SUBCASE("Matching the observation is rewarded")
        {
            environment.reset();
            CHECK(environment.step(torch::tensor({1}, torch::kLong)).reward == 1);
            CHECK(environment.step(torch::tensor({1}, torch::kLong)).reward == -1);
        }

        SUBCASE("Episodes end after the configured length")
        {
            environment.reset();
            CHECK(!environment.step(torch::tensor({0}, torch::kLong)).done);
            CHECK(!environment.step(torch::tensor({0}, torch::kLong)).done);
            CHECK(environment.step(torch::tensor({0}, torch::kLong)).done);
        }

        SUBCASE("Invalid actions throw")
        {
            environment.reset();
            CHECK_THROWS_AS(environment.step(torch::tensor({2}, torch::kLong)), std::invalid_argument);
        }
    }
}
