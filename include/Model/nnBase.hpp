#pragma once

#ifndef TRUSTREGIONRL_NNBASE_HPP
#define TRUSTREGIONRL_NNBASE_HPP

#include<torch/torch.h>
#include<torch/nn.h>

namespace TrustRegion
{
    /**
     * @class NNBase
     * @brief Abstract feature extractor shared by the policy and the value function.
     *
     * A base maps a batch of flat observations [batch, numInputs] to a batch of
     * features [batch, getOutputSize()]. Heads (OutputLayer, the value head) are
     * attached on top by PolicyImpl and ValueFunctionImpl.
     */
    class NNBase : public torch::nn::Module
    {
    private:
        unsigned int numInputs;
        unsigned int outputSize;
    public:
        NNBase(unsigned int numInputs, unsigned int outputSize);

        /**
         * @brief Computes the features of a batch of observations.
         */
        virtual torch::Tensor forward(torch::Tensor inputs) = 0;

        inline unsigned int getNumInputs() const
        {
            return numInputs;
        }

        inline unsigned int getOutputSize() const
        {
            return outputSize;
        }
    };
}

#endif //TRUSTREGIONRL_NNBASE_HPP
