#pragma once

#ifndef TRUSTREGIONRL_SPACE_HPP
#define TRUSTREGIONRL_SPACE_HPP

#include<string>
#include<vector>
#include<cstdint>

namespace TrustRegion
{
    /**
     * @brief Description of an environment's action space.
     *
     * `type` is either "Discrete" (shape holds the number of actions) or "Box"
     * (shape holds the dimensions of a continuous action vector).
     */
    struct ActionSpace
    {
        std::string type;
        std::vector<int64_t> shape;
    };
}

#endif //TRUSTREGIONRL_SPACE_HPP
