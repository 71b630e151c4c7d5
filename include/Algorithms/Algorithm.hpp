#pragma once

#ifndef TRUSTREGIONRL_ALGORITHM_HPP
#define TRUSTREGIONRL_ALGORITHM_HPP

#include<string>
#include<vector>

#include<torch/torch.h>

#include"../AdvantageEstimator.hpp"
#include"../Distribution/Distribution.hpp"
#include"../Model/policy.hpp"

namespace TrustRegion
{
    /**
     * @brief One named scalar reported by an update, e.g. {"MeanKL", 0.004}.
     */
    struct UpdateDatum
    {
        std::string name;
        float value;
    };

    /**
     * @brief Settings shared by the updaters that precondition with the Fisher matrix.
     */
    struct NaturalGradientOptions
    {
        double klSubsampleRatio = 1.0;     ///< Share of the batch the Fisher products average over
        int cgIterations = 10;
        double cgResidualTolerance = 1e-10;
        double damping = 1e-3;
    };

    /**
     * @brief Strategy that turns one training batch into one policy update.
     *
     * Implementations never throw on numerical trouble. A non-finite gradient, search
     * direction, loss or KL leaves the parameters untouched, is logged as a warning and
     * reported with StepAccepted = 0.
     */
    class PolicyUpdater
    {
    public:
        virtual ~PolicyUpdater() = 0;

        /**
         * @param batch Flattened rollout with advantages, collected with the current parameters.
         * @return Metrics of the update.
         */
        virtual std::vector<UpdateDatum> update(const TrainingBatch &batch) = 0;

        /// Writes optimizer state, if the strategy keeps any.
        virtual void save(torch::serialize::OutputArchive &archive) const;

        virtual void load(torch::serialize::InputArchive &archive);
    };

    inline PolicyUpdater::~PolicyUpdater() {}

    /**
     * @brief Random subset of round(ratio * B) observations, or all of them when ratio >= 1.
     * @throws std::invalid_argument Unless 0 < ratio.
     */
    torch::Tensor subsampleObservations(const torch::Tensor &observations, double ratio);

    /// Mean KL(old || policy) over the observations, without building a graph.
    double averageKl(Policy &policy, Distribution &old, const torch::Tensor &observations);
}

#endif //TRUSTREGIONRL_ALGORITHM_HPP
