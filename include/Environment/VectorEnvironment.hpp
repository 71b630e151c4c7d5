#pragma once

#ifndef TRUSTREGIONRL_VECTORENVIRONMENT_HPP
#define TRUSTREGIONRL_VECTORENVIRONMENT_HPP

#include<functional>
#include<map>
#include<memory>
#include<string>
#include<vector>

#include<torch/torch.h>
#include"Environment.hpp"

namespace TrustRegion
{
    /**
     * @brief Batched outcome of one pool step.
     */
    struct VectorStepResult
    {
        torch::Tensor observations;                          ///< [N, obs...]
        torch::Tensor rewards;                               ///< [N, 1]
        torch::Tensor dones;                                 ///< [N, 1], 1 where an episode ended
        std::vector<std::map<std::string, float>> infos;     ///< One map per environment
    };

    /**
     * @class VectorEnvironment
     * @brief Steps N environments in lockstep on a set of worker threads.
     *
     * Every reset() and step() distributes the environments over the workers and joins
     * all of them before returning, so no environment runs ahead of the others.
     * Finished episodes are reset automatically: the returned observation of that slot
     * is the first one of the next episode and its info map holds `episode_return`
     * and `episode_length` of the finished one.
     *
     * Any exception raised by an environment, or an observation of the wrong shape,
     * is rethrown as EnvironmentError once all workers of the step have been joined.
     */
    class VectorEnvironment
    {
    private:
        std::vector<std::unique_ptr<Environment>> environments;
        unsigned int numThreads;
        std::vector<int64_t> observationDims;
        ActionSpace space;
        std::vector<float> episodeReturns;
        std::vector<int64_t> episodeLengths;

        void forEachEnvironment(const std::function<void(size_t)> &function);

        void checkObservation(size_t index, const torch::Tensor &observation) const;

    public:
        /**
         * @param environments At least one environment. All must share the observation shape and action space.
         * @param numThreads Worker threads, 0 means one per environment, 1 steps sequentially.
         * @throws std::invalid_argument If the environments disagree or the list is empty.
         */
        explicit VectorEnvironment(std::vector<std::unique_ptr<Environment>> environments,
                                   unsigned int numThreads = 0);

        /**
         * @brief Resets every environment.
         *
         * @return Observations [N, obs...]
         */
        torch::Tensor reset();

        /**
         * @brief Steps every environment with its row of `actions`.
         *
         * @param actions [N, 1] action indices for discrete spaces, [N, actionDim] for continuous ones.
         */
        VectorStepResult step(const torch::Tensor &actions);

        /**
         * @brief Seeds environment i with `base + i`.
         */
        void seed(uint64_t base);

        inline int64_t size() const
        {
            return static_cast<int64_t>(environments.size());
        }

        inline const std::vector<int64_t> &observationShape() const
        {
            return observationDims;
        }

        inline const ActionSpace &actionSpace() const
        {
            return space;
        }
    };
}

#endif //TRUSTREGIONRL_VECTORENVIRONMENT_HPP
