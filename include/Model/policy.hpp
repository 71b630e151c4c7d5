#pragma once

#ifndef TRUSTREGIONRL_POLICY_HPP
#define TRUSTREGIONRL_POLICY_HPP

#include<vector>
#include<memory>

#include<torch/torch.h>
#include<torch/nn.h>
#include"nnBase.hpp"
#include"OutputLayers.hpp"
#include"../Space.hpp"

namespace TrustRegion
{
    /**
     * @class PolicyImpl
     * @brief Stochastic policy: a feature trunk followed by a distribution head.
     *
     * The head is chosen from the action space: "Discrete" spaces get a
     * CategoricalOutput, "Box" spaces a NormalOutput. Besides acting, the policy
     * exposes its parameters as one flat vector so that second-order optimizers can
     * read and write them directly.
     */
    class PolicyImpl : public torch::nn::Module
    {
    private:
        ActionSpace actionSpace;

        std::shared_ptr<NNBase> base;

        std::shared_ptr<OutputLayer> outputLayer;

    public:
        /**
         * @throws std::invalid_argument If the action space type is not supported.
         */
        PolicyImpl(ActionSpace actionSpace, std::shared_ptr<NNBase> base);

        /**
         * @brief Action distribution for a batch of observations [batch, obs].
         */
        std::unique_ptr<Distribution> distribution(torch::Tensor observations) const;

        /**
         * @brief Samples one action per observation.
         *
         * @return {actions, actionLogProbs [batch, 1], distributionParameters [batch, P]}.
         *         Discrete actions have shape [batch, 1], continuous ones [batch, actionDim].
         */
        std::vector<torch::Tensor> act(torch::Tensor observations) const;

        /**
         * @brief Log-likelihood and mean entropy of stored actions under the current policy.
         *
         * @return {actionLogProbs [batch, 1], entropy (scalar)}
         */
        std::vector<torch::Tensor> evaluateAction(torch::Tensor observations, torch::Tensor actions) const;

        /**
         * @brief Joint log-probability [batch, 1] of `actions` under `dist`.
         *
         * Per-dimension Gaussian log-densities are summed over the action dimensions.
         */
        torch::Tensor logProbability(Distribution &dist, torch::Tensor actions) const;

        /**
         * @brief Rebuilds the distribution recorded at collection time.
         */
        std::unique_ptr<Distribution> distributionFromParameters(torch::Tensor parameters) const;

        /**
         * @brief Action probabilities of a discrete policy.
         *
         * @throws std::runtime_error For continuous action spaces.
         */
        torch::Tensor getProbability(torch::Tensor observations) const;

        /// All trainable parameters concatenated into one detached vector.
        torch::Tensor flatParameters() const;

        /// Overwrites every parameter in place from a flat vector.
        void setFlatParameters(const torch::Tensor &flat);

        int64_t numParameters() const;

        inline int64_t getNumDistributionParameters() const
        {
            return outputLayer->numDistributionParameters();
        }

        inline const ActionSpace &getActionSpace() const
        {
            return actionSpace;
        }
    };
    TORCH_MODULE(Policy);
}

#endif //TRUSTREGIONRL_POLICY_HPP
