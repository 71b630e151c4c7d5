#pragma once

#ifndef TRUSTREGIONRL_CONJUGATEGRADIENT_HPP
#define TRUSTREGIONRL_CONJUGATEGRADIENT_HPP

#include<functional>

#include<torch/torch.h>

namespace TrustRegion
{
    /// Computes A * v for a symmetric positive definite A that is never formed explicitly.
    using MatrixVectorProduct = std::function<torch::Tensor(const torch::Tensor &)>;

    struct ConjugateGradientResult
    {
        torch::Tensor solution;
        int iterations;          ///< Matrix-vector products spent
        double residualNorm;     ///< |b - A x| at the returned solution
    };

    /**
     * @brief Approximately solves A x = b by conjugate gradient, starting from x = 0.
     *
     * Stops after `iterations` steps or as soon as the squared residual norm drops below
     * `residualTolerance`, whichever comes first.
     *
     * @param matrixVectorProduct Oracle for A * v.
     * @param b Right-hand side, a flat vector.
     * @param iterations Maximum number of matrix-vector products.
     * @param residualTolerance Threshold on r . r.
     */
    ConjugateGradientResult conjugateGradient(const MatrixVectorProduct &matrixVectorProduct,
                                              const torch::Tensor &b,
                                              int iterations = 10,
                                              double residualTolerance = 1e-10);
}

#endif //TRUSTREGIONRL_CONJUGATEGRADIENT_HPP
