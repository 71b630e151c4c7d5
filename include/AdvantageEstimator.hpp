#pragma once

#ifndef TRUSTREGIONRL_ADVANTAGEESTIMATOR_HPP
#define TRUSTREGIONRL_ADVANTAGEESTIMATOR_HPP

#include<torch/torch.h>

#include"Storage.hpp"
#include"Model/ValueFunction.hpp"

namespace TrustRegion
{
    /**
     * @struct TrainingBatch
     * @brief A rollout flattened to [T * N, ...] with advantages and return targets.
     *
     * Row t * N + n is step t of environment n. The bootstrap row of the rollout is not part
     * of the batch.
     */
    struct TrainingBatch
    {
        torch::Tensor observations;             ///< [B, obs...]
        torch::Tensor actions;                  ///< [B, 1] or [B, actionDim]
        torch::Tensor distributionParameters;   ///< [B, P], behaviour policy
        torch::Tensor actionLogProbs;           ///< [B, 1], behaviour policy
        torch::Tensor valuePredictions;         ///< [B, 1]
        torch::Tensor returns;                  ///< [B, 1]
        torch::Tensor advantages;               ///< [B, 1]

        inline int64_t size() const
        {
            return returns.size(0);
        }
    };

    /**
     * @class AdvantageEstimator
     * @brief Generalized advantage estimation over a full rollout.
     */
    class AdvantageEstimator
    {
    private:
        float gamma;
        float lambda;
        bool normalizeAdvantages;
        bool useGae;

    public:
        /**
         * @param gamma Discount factor in (0, 1).
         * @param lambda GAE trace parameter in [0, 1].
         * @param normalizeAdvantages Standardize the flattened advantages to zero mean and unit variance.
         * @param useGae When false the returns are plain bootstrapped discounted sums.
         * @throws std::invalid_argument If gamma or lambda is out of range.
         */
        AdvantageEstimator(float gamma, float lambda, bool normalizeAdvantages, bool useGae = true);

        /**
         * @brief Evaluates the value function on every stored observation, fills the returns
         * and advantages of the rollout and flattens it.
         */
        TrainingBatch estimate(RolloutStorage &rollout, ValueFunction &valueFunction) const;
    };
}

#endif //TRUSTREGIONRL_ADVANTAGEESTIMATOR_HPP
