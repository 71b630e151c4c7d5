#pragma once

#ifndef TRUSTREGIONRL_FISHERVECTORPRODUCT_HPP
#define TRUSTREGIONRL_FISHERVECTORPRODUCT_HPP

#include<vector>

#include<torch/torch.h>

#include"../Model/policy.hpp"

namespace TrustRegion
{
    /**
     * @class FisherVectorProduct
     * @brief Products of the policy's Fisher information matrix with flat vectors.
     *
     * The matrix is the Hessian of the mean KL(pi_old || pi) over a fixed set of
     * observations, taken at pi = pi_old. It is never formed: the constructor builds the
     * KL gradient with create_graph, and every call differentiates (gradient . v) once
     * more. The policy parameters must not change while the object is in use.
     */
    class FisherVectorProduct
    {
    private:
        std::vector<torch::Tensor> parameters;
        torch::Tensor klGradient;
        double damping;

    public:
        /**
         * @param policy Policy whose current parameters define pi_old.
         * @param observations [M, obs...] observations the KL is averaged over.
         * @param damping Multiple of the identity added to the product.
         */
        FisherVectorProduct(Policy &policy, const torch::Tensor &observations, double damping = 1e-3);

        /// (F + damping * I) v, same size as the flat parameter vector.
        torch::Tensor operator()(const torch::Tensor &direction) const;
    };
}

#endif //TRUSTREGIONRL_FISHERVECTORPRODUCT_HPP
