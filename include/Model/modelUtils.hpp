#pragma once

#ifndef TRUSTREGIONRL_MODELUTILS_HPP
#define TRUSTREGIONRL_MODELUTILS_HPP

#include<torch/nn.h>

#include<string>
#include<vector>

namespace TrustRegion
{
    /**
     * @brief Initializes weights orthogonally and biases to a constant.
     *
     * Parameters whose name contains "weight" are filled with a scaled orthogonal
     * matrix, parameters whose name contains "bias" are set to `biasGain`.
     *
     * @param parameters Named parameters of the module to initialize.
     * @param weightGain Scale applied to the orthogonal weight matrices.
     * @param biasGain Constant value for the biases.
     */
    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters, double weightGain, double biasGain);

    /**
     * @brief Concatenates a list of parameters into one detached 1-D tensor.
     */
    torch::Tensor flattenParameters(const std::vector<torch::Tensor> &parameters);

    /**
     * @brief Copies consecutive slices of `flat` into `parameters`, in place.
     *
     * @throws std::invalid_argument If the number of elements does not match.
     */
    void assignFlatParameters(const std::vector<torch::Tensor> &parameters, const torch::Tensor &flat);

    /**
     * @brief Gradient of a scalar with respect to `parameters`, flattened into one vector.
     *
     * Parameters that do not influence `output` contribute zeros.
     *
     * @param output Scalar to differentiate.
     * @param parameters Leaves to differentiate with respect to.
     * @param createGraph Record the gradient computation so it can be differentiated again.
     * @param retainGraph Keep the graph of `output` alive after the call.
     */
    torch::Tensor flatGrad(const torch::Tensor &output,
                           const std::vector<torch::Tensor> &parameters,
                           bool createGraph = false,
                           bool retainGraph = false);

    /// True when no element is NaN or infinite.
    bool allFinite(const torch::Tensor &tensor);
}

#endif //TRUSTREGIONRL_MODELUTILS_HPP
