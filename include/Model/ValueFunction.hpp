#pragma once

#ifndef TRUSTREGIONRL_VALUEFUNCTION_HPP
#define TRUSTREGIONRL_VALUEFUNCTION_HPP

#include<memory>

#include<torch/torch.h>
#include<torch/nn.h>
#include"nnBase.hpp"

namespace TrustRegion
{
    /**
     * @class ValueFunctionImpl
     * @brief State-value estimator V(s): a feature trunk followed by a scalar linear head.
     *
     * Kept separate from the policy so that the two never share parameters and the
     * value regression cannot move the policy.
     */
    class ValueFunctionImpl : public torch::nn::Module
    {
    private:
        std::shared_ptr<NNBase> base;
        torch::nn::Linear valueLinear;

    public:
        explicit ValueFunctionImpl(std::shared_ptr<NNBase> base);

        /**
         * @brief Value predictions [batch, 1] for observations [batch, obs].
         */
        torch::Tensor forward(torch::Tensor observations);
    };
    TORCH_MODULE(ValueFunction);
}

#endif //TRUSTREGIONRL_VALUEFUNCTION_HPP
