#pragma once

#ifndef TRUSTREGIONRL_FEEDFORWARDGENERATOR_HPP
#define TRUSTREGIONRL_FEEDFORWARDGENERATOR_HPP

#include<torch/torch.h>

#include"Generator.hpp"

namespace TrustRegion
{
    /**
    * @class FeedForwardGenerator
    * @brief Shuffles a flattened batch once and hands it out in fixed-size slices.
    *
    * All input tensors are already flattened to [B, ...]. The sample order is a
    * torch::randperm of B, cut into B / miniBatchSize rows; when miniBatchSize does
    * not divide B the left-over samples are skipped for this pass.
    */
    class FeedForwardGenerator : public Generator
    {
    private:
        torch::Tensor observations;
        torch::Tensor actions;
        torch::Tensor valuePredictions;
        torch::Tensor returns;
        torch::Tensor actionLogProbs;
        torch::Tensor advantages;

        /** @brief Shuffled sample indices, [numMiniBatches, miniBatchSize]. */
        torch::Tensor indices;

        int index;

    public:
        /**
         * @param miniBatchSize Samples per mini-batch, in [1, B].
         * @throws std::invalid_argument If miniBatchSize is outside [1, B].
        */
        FeedForwardGenerator(int64_t miniBatchSize,
                             torch::Tensor observations,
                             torch::Tensor actions,
                             torch::Tensor valuePredictions,
                             torch::Tensor returns,
                             torch::Tensor actionLogProbs,
                             torch::Tensor advantages);

        bool done() const override;

        MiniBatch next() override;

        inline int64_t numMiniBatches() const
        {
            return indices.size(0);
        }
    };
}

#endif //TRUSTREGIONRL_FEEDFORWARDGENERATOR_HPP
