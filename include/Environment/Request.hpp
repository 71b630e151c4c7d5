#pragma once

#ifndef TRUSTREGIONRL_REQUEST_HPP
#define TRUSTREGIONRL_REQUEST_HPP

#include<cstdint>
#include<memory>
#include<string>
#include<vector>

#include<msgpack.hpp>

namespace TrustRegion
{
namespace GymClient
{
    /**
     * @brief A gym-server request: the method name and its parameter struct.
     *
     * Packed as a MessagePack map {"method": ..., "param": {...}}.
     */
    template<class T>
    struct Request
    {
        std::string method;
        std::shared_ptr<T> param;

        Request(const std::string &method, std::shared_ptr<T> param) : method(method), param(param)
        {

        }

        MSGPACK_DEFINE_MAP(method, param);
    };

    struct InfoParam
    {
        int x = 0;
        MSGPACK_DEFINE_MAP(x);
    };

    struct MakeParam
    {
        std::string envName;
        int numEnv = 1;
        MSGPACK_DEFINE_MAP(envName, numEnv);
    };

    struct ResetParam
    {
        int x = 0;
        MSGPACK_DEFINE_MAP(x);
    };

    struct StepParam
    {
        std::vector<std::vector<float>> action;   ///< One action vector per hosted environment
        bool render = false;
        MSGPACK_DEFINE_MAP(action, render);
    };

    struct InfoResponse
    {
        std::string actionSpaceType;
        std::vector<int64_t> actionSpaceShape;
        std::string observationSpaceType;
        std::vector<int64_t> observationSpaceShape;
        MSGPACK_DEFINE_MAP(actionSpaceType, actionSpaceShape, observationSpaceType, observationSpaceShape);
    };

    struct MakeResponse
    {
        std::string result;
        MSGPACK_DEFINE_MAP(result);
    };

    struct ResetResponse
    {
        std::vector<std::vector<float>> observation;   ///< [environment][feature]
        MSGPACK_DEFINE_MAP(observation);
    };

    struct StepResponse
    {
        std::vector<std::vector<float>> observation;
        std::vector<std::vector<float>> reward;
        std::vector<std::vector<bool>> done;
        std::vector<std::vector<float>> real_reward;   ///< Reward before any server-side shaping
        MSGPACK_DEFINE_MAP(observation, reward, done, real_reward);
    };
}
}

#endif //TRUSTREGIONRL_REQUEST_HPP
