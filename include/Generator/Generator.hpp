#pragma once

#ifndef TRUSTREGIONRL_GENERATOR_HPP
#define TRUSTREGIONRL_GENERATOR_HPP

#include<torch/torch.h>

namespace TrustRegion
{
    /**
     * @struct MiniBatch
     * @brief One shuffled slice of a flattened training batch.
     *
     * Every tensor has the same leading dimension, the number of samples in the slice.
    */
    struct MiniBatch
    {
        torch::Tensor observations;
        torch::Tensor actions;
        torch::Tensor valuePredictions;   ///< V(s_t) at collection time
        torch::Tensor returns;            ///< Regression targets of the value function
        torch::Tensor actionLogProbs;     ///< log pi_old(a_t | s_t)
        torch::Tensor advantages;

        MiniBatch() {}

        MiniBatch(torch::Tensor observations,
                  torch::Tensor actions,
                  torch::Tensor valuePredictions,
                  torch::Tensor returns,
                  torch::Tensor actionLogProbs,
                  torch::Tensor advantages)
            : observations(observations),
              actions(actions),
              valuePredictions(valuePredictions),
              returns(returns),
              actionLogProbs(actionLogProbs),
              advantages(advantages)
        {
        }
    };

    /**
     * @class Generator
     * @brief Iterates over the mini-batches of one pass through a training batch.
     */
    class Generator
    {
    public:
        virtual ~Generator() = 0;

        /// True once every mini-batch of the pass has been handed out.
        virtual bool done() const = 0;

        /**
         * @brief Returns the next mini-batch.
         * @throws std::out_of_range When called after done() became true.
        */
        virtual MiniBatch next() = 0;
    };

    inline Generator::~Generator() {}
}

#endif //TRUSTREGIONRL_GENERATOR_HPP
