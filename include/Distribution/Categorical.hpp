#pragma once

#ifndef TRUSTREGIONRL_CATEGORICAL_HPP
#define TRUSTREGIONRL_CATEGORICAL_HPP

#include"Distribution.hpp"
#include<c10/util/ArrayRef.h>

namespace TrustRegion
{
    /**
    * @class Categorical
    * @brief A categorical distribution over a discrete set of actions.
    *
    * The distribution can be parameterized using either probabilities or logits.
    * Internally the logits are always normalized so that logsumexp(logits) == 0,
    * which makes them double as log-probabilities and as the flat parameter
    * snapshot stored in the rollout.
    */
    class Categorical : public Distribution
    {
    private:
        torch::Tensor probs;      ///< Probability tensor for each event
        torch::Tensor logits;     ///< Normalized log-probabilities for each event
        torch::Tensor param;      ///< Primary parameterization (either probs or logits)
        int numEvents;            ///< Number of possible discrete events

    public:
        /**
         * @brief Constructs a Categorical distribution.
         *
         * Exactly one of the two parameters must be provided (non-null).
         *
         * @param probs Pointer to a probability tensor. Normalized over the last dimension.
         * @param logits Pointer to a tensor of unnormalized log-odds.
         * @throws std::runtime_error If both or neither are provided.
         */
        Categorical(const torch::Tensor *probs, const torch::Tensor *logits);

        torch::Tensor entropy() override;

        /**
         * @brief Computes the log-probability of event indices.
         *
         * @param value Indices in [0, numEvents - 1]. Broadcast against the batch.
         * @return Log-probabilities with the broadcast shape of `value`.
         */
        torch::Tensor logProbability(torch::Tensor value) override;

        /**
         * @brief Samples event indices with torch::multinomial.
         *
         * @param sampleShape Extra leading sample dimensions. Default is {} for one sample per batch element.
         * @return Integer tensor of shape [sampleShape, batch_shape].
        */
        torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) override;

        /**
         * @brief KL(this || other) = sum_i p_i (log p_i - log q_i).
         */
        torch::Tensor klDivergence(Distribution &other) override;

        /// The normalized logits, shape [batch, numEvents].
        torch::Tensor flatParameters() override;

        std::unique_ptr<Distribution> detach() override;

        inline torch::Tensor getLogits() { return logits; }
        inline torch::Tensor getParam() { return param; }
        inline torch::Tensor getProbability() { return probs; }
    };
}

#endif //TRUSTREGIONRL_CATEGORICAL_HPP
