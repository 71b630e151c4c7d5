#pragma once

#ifndef TRUSTREGIONRL_VANILLAPG_HPP
#define TRUSTREGIONRL_VANILLAPG_HPP

#include<memory>
#include<vector>

#include<torch/torch.h>

#include"Algorithm.hpp"

namespace TrustRegion
{
    /**
     * @class VanillaPG
     * @brief Plain policy gradient: one Adam step on -mean(log pi(a|s) * A) per batch.
     */
    class VanillaPG : public PolicyUpdater
    {
    private:
        Policy &policy;
        std::unique_ptr<torch::optim::Adam> optimizer;

    public:
        VanillaPG(Policy &policy, double learningRate);

        std::vector<UpdateDatum> update(const TrainingBatch &batch) override;

        void save(torch::serialize::OutputArchive &archive) const override;

        void load(torch::serialize::InputArchive &archive) override;
    };
}

#endif //TRUSTREGIONRL_VANILLAPG_HPP
