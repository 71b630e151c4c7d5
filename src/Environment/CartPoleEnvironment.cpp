#include<cmath>
#include<stdexcept>

#include<doctest/doctest.h>

#include"../../include/Environment/CartPoleEnvironment.hpp"

namespace TrustRegion
{
    namespace
    {
        const float gravity = 9.8f;
        const float massCart = 1.0f;
        const float massPole = 0.1f;
        const float totalMass = massCart + massPole;
        const float length = 0.5f;
        const float poleMassLength = massPole * length;
        const float forceMagnitude = 10.0f;
        const float tau = 0.02f;
        const float xLimit = 2.4f;
        const float thetaLimit = 12.0f * 2.0f * static_cast<float>(M_PI) / 360.0f;
    }

    CartPoleEnvironment::CartPoleEnvironment(int maxSteps)
        : maxSteps(maxSteps),
          generator(0)
    {
        if (maxSteps < 1)
        {
            throw std::invalid_argument("CartPole episodes need at least one step");
        }
    }

    torch::Tensor CartPoleEnvironment::observation() const
    {
        return torch::tensor({x, xDot, theta, thetaDot});
    }

    torch::Tensor CartPoleEnvironment::reset()
    {
        std::uniform_real_distribution<float> distribution(-0.05f, 0.05f);
        x = distribution(generator);
        xDot = distribution(generator);
        theta = distribution(generator);
        thetaDot = distribution(generator);
        stepCount = 0;

        return observation();
    }

    StepResult CartPoleEnvironment::step(const torch::Tensor &action)
    {
        auto chosen = action.reshape({-1})[0].item<int64_t>();
        if (chosen != 0 && chosen != 1)
        {
            throw std::invalid_argument("CartPole actions are 0 or 1, got " + std::to_string(chosen));
        }
        float force = chosen == 1 ? forceMagnitude : -forceMagnitude;

        float cosTheta = std::cos(theta);
        float sinTheta = std::sin(theta);
        float temp = (force + poleMassLength * thetaDot * thetaDot * sinTheta) / totalMass;
        float thetaAcc = (gravity * sinTheta - cosTheta * temp) /
                         (length * (4.0f / 3.0f - massPole * cosTheta * cosTheta / totalMass));
        float xAcc = temp - poleMassLength * thetaAcc * cosTheta / totalMass;

        x += tau * xDot;
        xDot += tau * xAcc;
        theta += tau * thetaDot;
        thetaDot += tau * thetaAcc;
        stepCount++;

        bool failed = std::abs(x) > xLimit || std::abs(theta) > thetaLimit;
        return StepResult{observation(), 1.0f, failed || stepCount >= maxSteps, {}};
    }

    void CartPoleEnvironment::seed(uint64_t seed)
    {
        generator.seed(static_cast<std::mt19937::result_type>(seed));
    }

    std::vector<int64_t> CartPoleEnvironment::observationShape() const
    {
        return {4};
    }

    ActionSpace CartPoleEnvironment::actionSpace() const
    {
        return {"Discrete", {2}};
    }

    TEST_CASE("CartPoleEnvironment")
    {
        CartPoleEnvironment environment(50);
        environment.seed(3);

        SUBCASE("Reset starts close to upright")
        {
            auto observation = environment.reset();
            CHECK(observation.sizes().vec() == std::vector<int64_t>{4});
            CHECK(observation.abs().max().item<float>() <= 0.05f);
        }

        SUBCASE("Same seed gives the same initial state")
        {
            CartPoleEnvironment other(50);
            other.seed(3);
            CHECK(torch::equal(environment.reset(), other.reset()));
        }

        SUBCASE("Pushing one way eventually drops the pole")
        {
            environment.reset();
            StepResult result;
            int steps = 0;
            do
            {
                result = environment.step(torch::tensor({1}, torch::kLong));
                steps++;
            } while (!result.done);

            CHECK(steps < 50);
            CHECK(result.reward == 1.0f);
            CHECK(result.info.empty());
        }

        SUBCASE("The time limit ends the episode like a failure")
        {
            CartPoleEnvironment shortEnvironment(2);
            shortEnvironment.reset();
            shortEnvironment.step(torch::tensor({0}, torch::kLong));
            auto result = shortEnvironment.step(torch::tensor({1}, torch::kLong));
            CHECK(result.done);
            CHECK(result.reward == 1.0f);
            CHECK(result.info.empty());
        }
    }
}
