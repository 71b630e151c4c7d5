#pragma once

#ifndef TRUSTREGIONRL_NATURALPG_HPP
#define TRUSTREGIONRL_NATURALPG_HPP

#include<memory>
#include<vector>

#include<torch/torch.h>

#include"Algorithm.hpp"

namespace TrustRegion
{
    /**
     * @class NaturalPG
     * @brief Natural policy gradient applied with Adam.
     *
     * The policy gradient is preconditioned by conjugate gradient against the Fisher
     * matrix of a subsample of the batch, and the resulting direction is written into the
     * parameter gradients before an ordinary Adam step. There is no trust region.
     */
    class NaturalPG : public PolicyUpdater
    {
    private:
        Policy &policy;
        NaturalGradientOptions options;
        std::unique_ptr<torch::optim::Adam> optimizer;

    public:
        NaturalPG(Policy &policy, double learningRate, const NaturalGradientOptions &options);

        std::vector<UpdateDatum> update(const TrainingBatch &batch) override;

        void save(torch::serialize::OutputArchive &archive) const override;

        void load(torch::serialize::InputArchive &archive) override;
    };
}

#endif //TRUSTREGIONRL_NATURALPG_HPP
