#pragma once

#ifndef TRUSTREGIONRL_VALUEFUNCTIONTRAINER_HPP
#define TRUSTREGIONRL_VALUEFUNCTIONTRAINER_HPP

#include<memory>
#include<vector>

#include<torch/torch.h>

#include"Algorithm.hpp"
#include"../Model/ValueFunction.hpp"

namespace TrustRegion
{
    /**
     * @class ValueFunctionTrainer
     * @brief Regresses the value function onto the return targets of a batch with Adam.
     *
     * Every update runs `iterations` passes over the batch, each split into `miniBatches`
     * shuffled mini-batches. Reports ExplainedVariance of the predictions made before the
     * refit and the ValueLoss of the last pass. Non-finite targets, losses or gradients
     * stop the refit before the next optimizer step and report ValueLoss as NaN.
     */
    class ValueFunctionTrainer
    {
    private:
        ValueFunction &valueFunction;
        int iterations;
        int miniBatches;
        std::unique_ptr<torch::optim::Adam> optimizer;

    public:
        ValueFunctionTrainer(ValueFunction &valueFunction, double learningRate, int iterations, int miniBatches = 1);

        std::vector<UpdateDatum> update(const TrainingBatch &batch);

        void save(torch::serialize::OutputArchive &archive) const;

        void load(torch::serialize::InputArchive &archive);

        inline const torch::optim::Adam &getOptimizer() const
        {
            return *optimizer;
        }
    };

    /// 1 - Var(targets - predictions) / Var(targets), NaN when the targets are constant.
    float explainedVariance(const torch::Tensor &predictions, const torch::Tensor &targets);
}

#endif //TRUSTREGIONRL_VALUEFUNCTIONTRAINER_HPP
