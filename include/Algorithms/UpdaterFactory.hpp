#pragma once

#ifndef TRUSTREGIONRL_UPDATERFACTORY_HPP
#define TRUSTREGIONRL_UPDATERFACTORY_HPP

#include<memory>

#include"Algorithm.hpp"
#include"../Config.hpp"

namespace TrustRegion
{
    /**
     * @brief Builds the update strategy named by config.type: TRPO, TNPG, Natural or Vanilla.
     * @throws std::invalid_argument On an unknown type.
     */
    std::unique_ptr<PolicyUpdater> makePolicyUpdater(const AlgorithmConfig &config, Policy &policy);
}

#endif //TRUSTREGIONRL_UPDATERFACTORY_HPP
