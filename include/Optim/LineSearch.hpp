#pragma once

#ifndef TRUSTREGIONRL_LINESEARCH_HPP
#define TRUSTREGIONRL_LINESEARCH_HPP

#include<functional>

#include<torch/torch.h>

namespace TrustRegion
{
    struct SurrogateEvaluation
    {
        double loss;   ///< Surrogate loss at the candidate, lower is better
        double kl;     ///< Mean KL(pi_old || pi_candidate)
    };

    /// Loads a flat parameter vector into the policy and evaluates it.
    using SurrogateEvaluator = std::function<SurrogateEvaluation(const torch::Tensor &)>;

    struct LineSearchOptions
    {
        int maxBacktracks = 10;
        double backtrackRatio = 0.8;
        double acceptRatio = 0.1;   ///< Fraction of the expected improvement a candidate must realize
    };

    struct LineSearchResult
    {
        torch::Tensor parameters;
        bool accepted;
        double expectedImprovement;   ///< Linear prediction at the accepted step fraction
        double actualImprovement;     ///< y0 minus the accepted loss, 0 when rejected
        int evaluations;
    };

    /**
     * @brief Backtracking search along -fullStep inside a KL trust region.
     *
     * Candidate k is x0 - backtrackRatio^k * fullStep. The first candidate whose loss and KL
     * are finite, whose KL is below maxKl, and which realizes at least acceptRatio times its
     * expected improvement is returned. When no candidate qualifies x0 is returned and
     * `accepted` is false. The evaluator may leave any candidate loaded in the policy; the
     * caller commits the returned parameters.
     *
     * @param expectedImprovement Improvement predicted for the full step.
     * @param y0 Surrogate loss at x0.
     */
    LineSearchResult trustRegionLineSearch(const SurrogateEvaluator &evaluate,
                                           const torch::Tensor &x0,
                                           const torch::Tensor &fullStep,
                                           double expectedImprovement,
                                           double y0,
                                           double maxKl,
                                           const LineSearchOptions &options = LineSearchOptions());
}

#endif //TRUSTREGIONRL_LINESEARCH_HPP
