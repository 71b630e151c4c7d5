#pragma once

#ifndef TRUSTREGIONRL_TRUSTREGIONPG_HPP
#define TRUSTREGIONRL_TRUSTREGIONPG_HPP

#include<vector>

#include<torch/torch.h>

#include"Algorithm.hpp"
#include"../Optim/LineSearch.hpp"

namespace TrustRegion
{
    /**
     * @class TrustRegionPG
     * @brief Natural gradient steps scaled to a KL trust region (TNPG and TRPO).
     *
     * Each update minimizes the importance-sampled surrogate
     * L(theta) = -mean(exp(log pi_theta(a|s) - log pi_old(a|s)) * A).
     * The natural direction d = F^-1 g comes from conjugate gradient, and the step is
     * scaled by sqrt(2 maxKl / (d' F d)) so that its quadratic KL estimate equals maxKl.
     * Without line search (TNPG) the scaled step is applied as is. With line search (TRPO)
     * it is shortened until the exact mean KL stays below maxKl and the surrogate improves
     * enough.
     *
     * The Fisher products of one update all use the same observation subsample.
     */
    class TrustRegionPG : public PolicyUpdater
    {
    private:
        Policy &policy;
        double maxKl;
        NaturalGradientOptions options;
        bool lineSearch;
        LineSearchOptions lineSearchOptions;

    public:
        /**
         * @param policy Policy updated in place.
         * @param maxKl Trust region radius delta.
         * @param options Conjugate gradient and Fisher product settings.
         * @param lineSearch true for TRPO, false for TNPG.
         * @param lineSearchOptions Backtracking settings, ignored without line search.
         * @throws std::invalid_argument If maxKl is negative.
         */
        TrustRegionPG(Policy &policy,
                      double maxKl,
                      const NaturalGradientOptions &options,
                      bool lineSearch = true,
                      const LineSearchOptions &lineSearchOptions = LineSearchOptions());

        std::vector<UpdateDatum> update(const TrainingBatch &batch) override;
    };
}

#endif //TRUSTREGIONRL_TRUSTREGIONPG_HPP
