#pragma once

#ifndef APEXACTORRL_PARAMETERSYNCHRONIZER_HPP
#define APEXACTORRL_PARAMETERSYNCHRONIZER_HPP

#include<vector>

#include<torch/torch.h>

namespace ApexActor
{
    /**
     * @brief Overwrites every parameter of `module` with `newParameters`
     *
     * `newParameters[i]` is copied into the i-th tensor of `module.parameters()`.
     * Values are copied in place, so the module and its parameter tensors keep
     * their identity and anyone holding a reference to the module observes the
     * new values. Incoming tensors are converted to the device and dtype of the
     * receiving parameter.
     *
     * Staleness is not detected: applying an older parameter set after a newer
     * one silently rolls the module back.
     *
     * @throws std::invalid_argument if the parameter count or any tensor shape differs;
     *         the module is left untouched in that case
     */
    void synchronizeParameters(torch::nn::Module &module, const std::vector<torch::Tensor> &newParameters);

    /**
     * @brief Copies of the current parameter values in enumeration order
     */
    std::vector<torch::Tensor> snapshotParameters(const torch::nn::Module &module);
}

#endif //APEXACTORRL_PARAMETERSYNCHRONIZER_HPP
