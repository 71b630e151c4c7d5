#pragma once

#ifndef TRUSTREGIONRL_DISTRIBUTION_HPP
#define TRUSTREGIONRL_DISTRIBUTION_HPP

#include<memory>
#include<vector>
#include<torch/torch.h>

namespace TrustRegion
{
    /**
     * @class Distribution
     * @brief Abstract base class for the action distributions produced by a policy.
     *
     * Besides sampling and density evaluation, every distribution can report the KL
     * divergence to another distribution of the same family, export its parameters
     * as one flat tensor per batch element (so that the rollout storage can keep a
     * snapshot of the behaviour policy), and produce a detached copy of itself that
     * no longer participates in autograd.
     *
     * @see Normal
     * @see Categorical
    */
    class Distribution
    {
    protected:
        std::vector<int64_t> batch_shape;  ///< Shape of the batch dimension(s)
        std::vector<int64_t> event_shape;  ///< Shape of the event dimension(s)

        /**
         * @brief Combines the sample shape, batch shape and event shape into one shape.
         *
         * @param sampleShapes The desired shape for samples
         * @return std::vector<int64_t> The extended shape
        */
        std::vector<int64_t> extendedShape(c10::ArrayRef<int64_t> &sampleShapes);
    public:
        virtual ~Distribution() = 0;

        /**
         * @brief Computes the entropy of the distribution.
         *
         * @return torch::Tensor A tensor containing entropy values with shape matching batch_shape
        */
        virtual torch::Tensor entropy() = 0;

        /**
         * @brief Computes the log probability density/mass of a value under this distribution.
         *
         * @param value A tensor representing the value(s) to evaluate.
         * @return torch::Tensor A tensor of log probabilities
         */
        virtual torch::Tensor logProbability(torch::Tensor value) = 0;

        /**
         * @brief Generates samples from the distribution.
         *
         * @param sampleShape The desired number of samples and their dimensions (default: {})
         * @return torch::Tensor A tensor of sampled values with shape [sample_shape, batch_shape, event_shape]
        */
        virtual torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) = 0;

        /**
         * @brief Computes KL(this || other) for every element of the batch.
         *
         * The divergence is summed over the action dimensions, so the result has one
         * entry per observation. Gradients flow into both operands; detach one side
         * with detach() to differentiate with respect to the other only.
         *
         * @param other A distribution of the same family and batch shape.
         * @return torch::Tensor KL divergences with shape [batch]
         * @throws std::invalid_argument If `other` belongs to a different family.
         */
        virtual torch::Tensor klDivergence(Distribution &other) = 0;

        /**
         * @brief Exports the parameters of the distribution as a [batch, P] tensor.
         *
         * The exported tensor can be turned back into an identical distribution with
         * PolicyImpl::distributionFromParameters().
         */
        virtual torch::Tensor flatParameters() = 0;

        /**
         * @brief Returns a copy of the distribution whose parameters are cut from the graph.
         */
        virtual std::unique_ptr<Distribution> detach() = 0;
    };

    inline Distribution::~Distribution() {

    }
}

#endif //TRUSTREGIONRL_DISTRIBUTION_HPP
