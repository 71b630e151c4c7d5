#pragma once

#ifndef TRUSTREGIONRL_STORAGE_HPP
#define TRUSTREGIONRL_STORAGE_HPP

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

#include"Space.hpp"

namespace TrustRegion
{
    /**
     * @class RolloutStorage
     * @brief Fixed-horizon buffer of transitions from N environments.
     *
     * Time-major tensors: observations, masks, value predictions and returns hold
     * numSteps + 1 rows (the last row is the bootstrap state), actions, rewards, action
     * log-probabilities, distribution parameters and advantages hold numSteps rows.
     * masks[t + 1] is 0 when the episode ended at step t. Every column receives exactly
     * numSteps transitions; insert() refuses to write past the horizon.
     */
    class RolloutStorage
    {
    private:
        torch::Tensor observations;             ///< [T+1, N, obs...]
        torch::Tensor rewards;                  ///< [T, N, 1]
        torch::Tensor valuePredictions;         ///< [T+1, N, 1]
        torch::Tensor returns;                  ///< [T+1, N, 1]
        torch::Tensor advantages;               ///< [T, N, 1]
        torch::Tensor actionLogProbs;           ///< [T, N, 1] under the behaviour policy
        torch::Tensor distributionParameters;   ///< [T, N, P] flat snapshot of the behaviour policy
        torch::Tensor actions;                  ///< [T, N, 1] (kLong) or [T, N, actionDim]
        torch::Tensor masks;                    ///< [T+1, N, 1]
        torch::Device device;
        int64_t numSteps;
        int64_t step;

    public:
        /**
         * @param numSteps Horizon T.
         * @param numProcesses Number of environments N.
         * @param observationShape Shape of one observation.
         * @param actionSpace Decides the type and width of the action tensor.
         * @param numDistributionParameters Width P of a flat distribution snapshot.
         * @param device Where the tensors live.
         */
        RolloutStorage(int64_t numSteps,
                       int64_t numProcesses,
                       c10::ArrayRef<int64_t> observationShape,
                       ActionSpace actionSpace,
                       int64_t numDistributionParameters,
                       torch::Device device = torch::kCPU);

        /**
         * @brief Writes the observation every column starts from.
         */
        void setFirstObservation(torch::Tensor observation);

        /**
         * @brief Appends one transition per environment.
         *
         * @param observation Observation reached after the step, [N, obs...].
         * @param action Action taken.
         * @param actionLogProb Log-probability of the action under the behaviour policy, [N, 1].
         * @param distributionParameter Flat behaviour distribution, [N, P].
         * @param reward Reward received, [N, 1].
         * @param mask 0 where the episode ended with this step, [N, 1].
         * @throws std::out_of_range Once numSteps transitions have been inserted.
         */
        void insert(torch::Tensor observation,
                    torch::Tensor action,
                    torch::Tensor actionLogProb,
                    torch::Tensor distributionParameter,
                    torch::Tensor reward,
                    torch::Tensor mask);

        /**
         * @brief Fills returns and advantages from the stored rewards and value predictions.
         *
         * valuePredictions[0..T-1] must hold V(s_t); `nextValue` becomes the bootstrap
         * value V(s_T). With GAE the advantages follow the (gamma, tau) recurrence and
         * returns are advantages + values. Without GAE the returns are bootstrapped
         * discounted sums and advantages are returns - values.
         */
        void computeReturns(torch::Tensor nextValue, bool useGae, float gamma, float tau);

        inline bool isFull() const
        {
            return step == numSteps;
        }

        inline int64_t getNumSteps() const
        {
            return numSteps;
        }

        inline int64_t getNumProcesses() const
        {
            return rewards.size(1);
        }

        inline const torch::Tensor &get_actions() const
        {
            return actions;
        }

        inline const torch::Tensor &get_action_log_probs() const
        {
            return actionLogProbs;
        }

        inline const torch::Tensor &get_advantages() const
        {
            return advantages;
        }

        inline const torch::Tensor &get_distribution_parameters() const
        {
            return distributionParameters;
        }

        inline const torch::Tensor &get_masks() const
        {
            return masks;
        }

        inline const torch::Tensor &get_observations() const
        {
            return observations;
        }

        inline const torch::Tensor &get_returns() const
        {
            return returns;
        }

        inline const torch::Tensor &get_rewards() const
        {
            return rewards;
        }

        inline const torch::Tensor &get_value_predictions() const
        {
            return valuePredictions;
        }

        inline void set_value_predictions(torch::Tensor valuePredictions)
        {
            this->valuePredictions = valuePredictions;
        }
    };
}

#endif //TRUSTREGIONRL_STORAGE_HPP
