#pragma once

#ifndef TRUSTREGIONRL_PENDULUMENVIRONMENT_HPP
#define TRUSTREGIONRL_PENDULUMENVIRONMENT_HPP

#include<random>

#include"Environment.hpp"

namespace TrustRegion
{
    /**
     * @class PendulumEnvironment
     * @brief Torque-limited pendulum swing-up.
     *
     * Observation (cos theta, sin theta, theta_dot), one continuous action clipped to
     * [-2, 2]. The reward is -(theta^2 + 0.1 theta_dot^2 + 0.001 u^2) with theta
     * wrapped to [-pi, pi]. Episodes only end at the time limit.
     */
    class PendulumEnvironment : public Environment
    {
    private:
        double theta = 0.0;
        double thetaDot = 0.0;
        int stepCount = 0;
        int maxSteps;
        std::mt19937 generator;

        torch::Tensor observation() const;

    public:
        static constexpr double maxTorque = 2.0;
        static constexpr double maxSpeed = 8.0;

        explicit PendulumEnvironment(int maxSteps = 200);

        torch::Tensor reset() override;

        StepResult step(const torch::Tensor &action) override;

        void seed(uint64_t seed) override;

        std::vector<int64_t> observationShape() const override;

        ActionSpace actionSpace() const override;
    };
}

#endif //TRUSTREGIONRL_PENDULUMENVIRONMENT_HPP
