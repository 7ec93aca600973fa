#pragma once

#ifndef APEXACTORRL_MODELUTILS_HPP
#define APEXACTORRL_MODELUTILS_HPP

#include<torch/nn.h>

#include<string>

namespace ApexActor
{
    /**
     * @brief Fills `tensor` in place with a (semi) orthogonal matrix scaled by `gain`
     *
     * A standard normal matrix is QR-decomposed and the sign of R's diagonal is
     * folded into Q. Tensors with fewer than two dimensions are returned unchanged.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain);

    /**
     * @brief Initializes weights and biases of a module
     *
     * Parameters whose name contains "bias" are set to `biasGain`; parameters
     * whose name contains "weight" are orthogonally initialized with `weightGain`.
     * Tensors are modified in place.
     *
     * @param parameters Named parameters, typically `module->named_parameters()`
     * @param weightGain Scale of the orthogonal weights, sqrt(2) for relu layers
     * @param biasGain Constant bias value
     */
    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters, double weightGain, double biasGain);
}

#endif //APEXACTORRL_MODELUTILS_HPP
