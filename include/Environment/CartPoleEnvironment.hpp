#pragma once

#ifndef TRUSTREGIONRL_CARTPOLEENVIRONMENT_HPP
#define TRUSTREGIONRL_CARTPOLEENVIRONMENT_HPP

#include<random>

#include"Environment.hpp"

namespace TrustRegion
{
    /**
     * @class CartPoleEnvironment
     * @brief Classic cart-pole balancing task with Euler-integrated dynamics.
     *
     * Observation (x, x_dot, theta, theta_dot); action 0 pushes left, 1 pushes right.
     * Every step earns a reward of 1. The episode ends when the cart leaves
     * [-2.4, 2.4], the pole tilts more than 12 degrees or `maxSteps` steps have been
     * taken. A time-limit cut is reported as an ordinary terminal step.
     */
    class CartPoleEnvironment : public Environment
    {
    private:
        float x = 0.f;
        float xDot = 0.f;
        float theta = 0.f;
        float thetaDot = 0.f;
        int stepCount = 0;
        int maxSteps;
        std::mt19937 generator;

        torch::Tensor observation() const;

    public:
        explicit CartPoleEnvironment(int maxSteps = 500);

        torch::Tensor reset() override;

        StepResult step(const torch::Tensor &action) override;

        void seed(uint64_t seed) override;

        std::vector<int64_t> observationShape() const override;

        ActionSpace actionSpace() const override;
    };
}

#endif //TRUSTREGIONRL_CARTPOLEENVIRONMENT_HPP
