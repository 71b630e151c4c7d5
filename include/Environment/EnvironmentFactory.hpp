#pragma once

#ifndef TRUSTREGIONRL_ENVIRONMENTFACTORY_HPP
#define TRUSTREGIONRL_ENVIRONMENTFACTORY_HPP

#include<memory>
#include<vector>

#include"Environment.hpp"
#include"../Config.hpp"

namespace TrustRegion
{
    /**
     * @brief Creates environment number `index` of the pool described by `config`.
     *
     * Matching environments alternate their phase with the index, remote environment
     * `index` connects to `serverAddress:basePort + index`.
     *
     * @throws std::invalid_argument On an unknown environment name.
     */
    std::unique_ptr<Environment> makeEnvironment(const EnvironmentConfig &config, int index);

    /**
     * @brief Creates all `config.numEnvs` environments of the pool.
     */
    std::vector<std::unique_ptr<Environment>> makeEnvironments(const EnvironmentConfig &config);
}

#endif //TRUSTREGIONRL_ENVIRONMENTFACTORY_HPP
