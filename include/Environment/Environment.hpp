#pragma once

#ifndef TRUSTREGIONRL_ENVIRONMENT_HPP
#define TRUSTREGIONRL_ENVIRONMENT_HPP

#include<cstdint>
#include<map>
#include<string>
#include<vector>

#include<torch/torch.h>
#include"../Space.hpp"

namespace TrustRegion
{
    /**
     * @brief Outcome of one environment step.
     */
    struct StepResult
    {
        torch::Tensor observation;
        float reward;
        bool done;
        std::map<std::string, float> info;
    };

    /**
     * @class Environment
     * @brief A single episodic environment with flat float observations.
     *
     * Discrete actions are passed as a kLong tensor holding one index, continuous
     * actions as a float tensor of the action dimensionality. Implementations are
     * not thread-safe; the pool never steps one environment from two threads.
     */
    class Environment
    {
    public:
        virtual ~Environment() = 0;

        /**
         * @brief Starts a new episode and returns its first observation.
         */
        virtual torch::Tensor reset() = 0;

        /**
         * @brief Advances the episode by one action.
         */
        virtual StepResult step(const torch::Tensor &action) = 0;

        /**
         * @brief Seeds the environment's own random number generator.
         */
        virtual void seed(uint64_t seed) = 0;

        virtual std::vector<int64_t> observationShape() const = 0;

        virtual ActionSpace actionSpace() const = 0;
    };

    inline Environment::~Environment() {

    }
}

#endif //TRUSTREGIONRL_ENVIRONMENT_HPP
