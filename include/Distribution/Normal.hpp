#pragma once

#ifndef TRUSTREGIONRL_NORMAL_HPP
#define TRUSTREGIONRL_NORMAL_HPP

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"

namespace TrustRegion
{
    /**
     * @class Normal
     * @brief Diagonal Gaussian distribution used for continuous ("Box") action spaces.
     *
     * logProbability() is reported per action dimension; entropy() and klDivergence()
     * are summed over the last dimension.
    */
    class Normal : public Distribution
    {
    private:
        torch::Tensor loc;    ///< Mean of every action dimension
        torch::Tensor scale;  ///< Standard deviation of every action dimension
    public:
        /**
         * @brief Constructs a normal distribution with given mean and standard deviation.
         *
         * @param loc The mean. Broadcast against `scale`.
         * @param scale The standard deviation, positive.
        */
        Normal(const torch::Tensor loc, const torch::Tensor scale);

        /**
         * @brief 0.5 * log(2 * pi * e * scale^2), summed over the action dimensions.
        */
        torch::Tensor entropy() override;

        torch::Tensor logProbability(torch::Tensor value) override;

        /**
         * @brief Draws samples without recording them in the autograd graph.
         */
        torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) override;

        /**
         * @brief Closed-form KL between two diagonal Gaussians, summed over the action dimensions.
         */
        torch::Tensor klDivergence(Distribution &other) override;

        /// Mean and standard deviation concatenated along the last dimension.
        torch::Tensor flatParameters() override;

        std::unique_ptr<Distribution> detach() override;

        inline torch::Tensor getLoc()
        {
            return loc;
        }

        inline torch::Tensor getScale()
        {
            return scale;
        }
    };
}

#endif //TRUSTREGIONRL_NORMAL_HPP
