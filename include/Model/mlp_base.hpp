#pragma once

#ifndef TRUSTREGIONRL_MLP_BASE_HPP
#define TRUSTREGIONRL_MLP_BASE_HPP

#include<string>
#include<vector>

#include<torch/nn.h>
#include"nnBase.hpp"

namespace TrustRegion
{
    /**
     * @class MlpBase
     * @brief Fully connected trunk: one Linear followed by an activation per hidden layer.
     *
     * Weights are initialized orthogonally with gain sqrt(2) and zero biases. With an
     * empty list of hidden sizes the trunk is the identity and its output size equals
     * the number of inputs.
     */
    class MlpBase : public NNBase
    {
    private:
        torch::nn::Sequential layers;

    public:
        /**
         * @param numInputs Size of a flat observation.
         * @param hiddenSizes Width of every hidden layer, in order.
         * @param activation "tanh" or "relu".
         * @throws std::invalid_argument On an unknown activation or a zero hidden size.
         */
        MlpBase(unsigned int numInputs,
                const std::vector<unsigned int> &hiddenSizes = {64, 64},
                const std::string &activation = "tanh");

        torch::Tensor forward(torch::Tensor inputs) override;
    };
}

#endif //TRUSTREGIONRL_MLP_BASE_HPP
