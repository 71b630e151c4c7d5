#pragma once

#ifndef TRUSTREGIONRL_MODELFACTORY_HPP
#define TRUSTREGIONRL_MODELFACTORY_HPP

#include"policy.hpp"
#include"ValueFunction.hpp"
#include"../Config.hpp"
#include"../Space.hpp"

namespace TrustRegion
{
    /**
     * @brief Builds an MLP policy for flat observations of size `observationSize`.
     */
    Policy makePolicy(const ModelConfig &config, unsigned int observationSize, const ActionSpace &actionSpace);

    /**
     * @brief Builds an MLP value function with its own trunk.
     */
    ValueFunction makeValueFunction(const ModelConfig &config, unsigned int observationSize);
}

#endif //TRUSTREGIONRL_MODELFACTORY_HPP
