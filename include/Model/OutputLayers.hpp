#pragma once

#ifndef TRUSTREGIONRL_OUTPUTLAYERS_HPP
#define TRUSTREGIONRL_OUTPUTLAYERS_HPP

#include<torch/torch.h>
#include<torch/nn.h>
#include<memory>

#include"../Distribution/Distribution.hpp"

namespace TrustRegion {
    /**
     * @class OutputLayer
     * @brief Maps features of the policy trunk to an action distribution.
     *
     * Besides the forward pass, every output layer can rebuild its distribution from a
     * flat parameter snapshot (see Distribution::flatParameters()) and reports how many
     * numbers such a snapshot holds per observation.
    */
    class OutputLayer : public torch::nn::Module
    {
    public:
        virtual ~OutputLayer() = 0;

        /**
          * @brief Computes the action distribution for a batch of features.
          */
        virtual std::unique_ptr<Distribution> forward(torch::Tensor x) = 0;

        /**
         * @brief Rebuilds a distribution from parameters exported by flatParameters().
         */
        virtual std::unique_ptr<Distribution> fromParameters(torch::Tensor parameters) const = 0;

        /// Width of the flat parameter snapshot.
        virtual int64_t numDistributionParameters() const = 0;
    };

    inline OutputLayer::~OutputLayer() {

    }

    /**
     * @class CategoricalOutput
     * @brief Linear layer producing the logits of a Categorical distribution.
     *
     * The weights are initialized with a small gain (0.01) so the initial policy is
     * close to uniform.
    */
    class CategoricalOutput : public OutputLayer
    {
    private:
        torch::nn::Linear linear;
        unsigned int numOutputs;

    public:
        CategoricalOutput(unsigned int numInputs, unsigned int numOutputs);

        std::unique_ptr<Distribution> forward(torch::Tensor x) override;

        std::unique_ptr<Distribution> fromParameters(torch::Tensor parameters) const override;

        inline int64_t numDistributionParameters() const override
        {
            return numOutputs;
        }
    };

    /**
     * @class NormalOutput
     * @brief Diagonal Gaussian head with a state-dependent mean and a learned,
     * state-independent log standard deviation.
    */
    class NormalOutput : public OutputLayer
    {
    private:
        torch::nn::Linear linearLoc;
        torch::Tensor scaleLog;
        unsigned int numOutputs;

    public:
        /**
         * @param numInputs Width of the trunk features.
         * @param numOutputs Dimensionality of the action.
         * @param initialLogStd Initial value of every log standard deviation.
         */
        NormalOutput(unsigned int numInputs, unsigned int numOutputs, double initialLogStd = 0.0);

        std::unique_ptr<Distribution> forward(torch::Tensor x) override;

        std::unique_ptr<Distribution> fromParameters(torch::Tensor parameters) const override;

        inline int64_t numDistributionParameters() const override
        {
            return 2 * numOutputs;
        }
    };
}

#endif //TRUSTREGIONRL_OUTPUTLAYERS_HPP
