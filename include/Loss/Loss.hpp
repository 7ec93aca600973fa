#pragma once

#ifndef APEXACTORRL_LOSS_HPP
#define APEXACTORRL_LOSS_HPP

#include<functional>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"../LocalBuffer.hpp"
#include"../Model/brain.hpp"

namespace ApexActor
{
    /**
     * @brief Shape information of the value head
     *
     * `stateSize` and `outputSize` are filled in by the worker from the
     * environment's observation and action spaces.
     */
    struct HeadConfig
    {
        std::vector<int64_t> stateSize;
        int64_t outputSize = 0;
        std::vector<int64_t> hiddenSizes;
    };

    /**
     * @brief Pluggable loss over a batch of transitions
     *
     * Called as `loss(policy, targetPolicy, batch, gamma, headConfig)`. The batch
     * carries rewards and dones reshaped to [N, 1]. The returned vector holds
     * the element-wise loss of shape [N, 1] first; losses may append auxiliary
     * outputs (the online action values for DQNLoss).
     */
    using LossFunction = std::function<std::vector<torch::Tensor>(Brain policy,
        Brain targetPolicy,
        const TransitionBatch &batch,
        double gamma,
        const HeadConfig &headConfig)>;

    /**
     * @brief Returns the loss registered under `lossType`
     *
     * @throws std::invalid_argument for an unknown loss type
     */
    LossFunction buildLoss(const std::string &lossType);
}

#endif //APEXACTORRL_LOSS_HPP
