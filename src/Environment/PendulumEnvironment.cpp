#include<algorithm>
#include<cmath>
#include<stdexcept>

#include<doctest/doctest.h>

#include"../../include/Environment/PendulumEnvironment.hpp"

namespace TrustRegion
{
    namespace
    {
        const double gravity = 10.0;
        const double mass = 1.0;
        const double length = 1.0;
        const double dt = 0.05;

        double wrapToPi(double angle)
        {
            while (angle <= -M_PI)
            {
                angle += 2.0 * M_PI;
            }
            while (angle > M_PI)
            {
                angle -= 2.0 * M_PI;
            }
            return angle;
        }
    }

    PendulumEnvironment::PendulumEnvironment(int maxSteps)
        : maxSteps(maxSteps),
          generator(0)
    {
        if (maxSteps < 1)
        {
            throw std::invalid_argument("Pendulum episodes need at least one step");
        }
    }

    torch::Tensor PendulumEnvironment::observation() const
    {
        return torch::tensor({static_cast<float>(std::cos(theta)),
                              static_cast<float>(std::sin(theta)),
                              static_cast<float>(thetaDot)});
    }

    torch::Tensor PendulumEnvironment::reset()
    {
        std::uniform_real_distribution<double> angle(-M_PI, M_PI);
        std::uniform_real_distribution<double> velocity(-1.0, 1.0);
        theta = angle(generator);
        thetaDot = velocity(generator);
        stepCount = 0;

        return observation();
    }

    StepResult PendulumEnvironment::step(const torch::Tensor &action)
    {
        double torque = std::clamp(static_cast<double>(action.reshape({-1})[0].item<float>()), -maxTorque, maxTorque);

        // Cost of the state the action was taken in
        double cost = theta * theta + 0.1 * thetaDot * thetaDot + 0.001 * torque * torque;

        double thetaAcc = 3.0 * gravity / (2.0 * length) * std::sin(theta) + 3.0 / (mass * length * length) * torque;
        thetaDot = std::clamp(thetaDot + thetaAcc * dt, -maxSpeed, maxSpeed);
        theta = wrapToPi(theta + thetaDot * dt);
        stepCount++;

        return StepResult{observation(), static_cast<float>(-cost), stepCount >= maxSteps, {}};
    }

    void PendulumEnvironment::seed(uint64_t seed)
    {
        generator.seed(static_cast<std::mt19937::result_type>(seed));
    }

    std::vector<int64_t> PendulumEnvironment::observationShape() const
    {
        return {3};
    }

    ActionSpace PendulumEnvironment::actionSpace() const
    {
        return {"Box", {1}};
    }

    TEST_CASE("PendulumEnvironment")
    {
        PendulumEnvironment environment(10);
        environment.seed(1);

        SUBCASE("Observations lie on the unit circle")
        {
            auto observation = environment.reset();
            CHECK(observation.sizes().vec() == std::vector<int64_t>{3});
            auto radius = observation[0].item<float>() * observation[0].item<float>() +
                          observation[1].item<float>() * observation[1].item<float>();
            CHECK(radius == doctest::Approx(1.0));
        }

        SUBCASE("Rewards are never positive")
        {
            environment.reset();
            for (int i = 0; i < 5; ++i)
            {
                CHECK(environment.step(torch::tensor({1.5f})).reward <= 0.0f);
            }
        }

        SUBCASE("Torque is clipped")
        {
            PendulumEnvironment clipped(10);
            PendulumEnvironment reference(10);
            clipped.seed(7);
            reference.seed(7);
            clipped.reset();
            reference.reset();

            auto clippedResult = clipped.step(torch::tensor({100.0f}));
            auto referenceResult = reference.step(torch::tensor({2.0f}));
            CHECK(torch::allclose(clippedResult.observation, referenceResult.observation));
            CHECK(clippedResult.reward == doctest::Approx(referenceResult.reward));
        }

        SUBCASE("Episodes stop at the time limit")
        {
            environment.reset();
            StepResult result;
            for (int i = 0; i < 10; ++i)
            {
                result = environment.step(torch::tensor({0.0f}));
                CHECK(result.done == (i == 9));
            }
            CHECK(result.info.empty());
        }
    }
}
