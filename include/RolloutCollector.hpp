#pragma once

#ifndef TRUSTREGIONRL_ROLLOUTCOLLECTOR_HPP
#define TRUSTREGIONRL_ROLLOUTCOLLECTOR_HPP

#include<deque>

#include<torch/torch.h>

#include"Storage.hpp"
#include"Environment/VectorEnvironment.hpp"
#include"Model/policy.hpp"

namespace TrustRegion
{
    /**
     * @struct EpisodeStatistics
     * @brief Returns and lengths of the most recently finished episodes.
     */
    struct EpisodeStatistics
    {
        std::deque<float> recentReturns;
        std::deque<float> recentLengths;
        int64_t totalEpisodes = 0;
        int64_t totalSteps = 0;      ///< Environment steps over all environments

        /// Mean of the window, or NaN before the first episode ends.
        float meanReturn() const;

        float meanLength() const;
    };

    /**
     * @class RolloutCollector
     * @brief Runs the policy in a vector environment for a fixed number of steps per call.
     *
     * Episodes carry over from one collect() to the next: the first call resets the
     * environments, later calls start from the observation the previous call ended on.
     * The collector is not reentrant and does not recover from environment errors.
     */
    class RolloutCollector
    {
    private:
        VectorEnvironment &environments;
        int64_t horizon;
        size_t rewardWindow;
        torch::Tensor currentObservation;
        EpisodeStatistics statistics;

        void recordEpisodes(const VectorStepResult &result);

    public:
        /**
         * @param environments Pool stepped by collect(). Must outlive the collector.
         * @param horizon Steps per environment and call.
         * @param rewardWindow Number of finished episodes kept in the statistics.
         * @throws std::invalid_argument If horizon or rewardWindow is smaller than one.
         */
        RolloutCollector(VectorEnvironment &environments, int64_t horizon, int rewardWindow = 100);

        /**
         * @brief Samples horizon transitions per environment from the policy.
         *
         * Runs under torch::NoGradGuard; the returned rollout has no value predictions yet.
         */
        RolloutStorage collect(Policy &policy);

        /// Forces the next collect() to start from freshly reset environments.
        void restart();

        inline const EpisodeStatistics &getStatistics() const
        {
            return statistics;
        }

        inline int64_t getHorizon() const
        {
            return horizon;
        }
    };
}

#endif //TRUSTREGIONRL_ROLLOUTCOLLECTOR_HPP
