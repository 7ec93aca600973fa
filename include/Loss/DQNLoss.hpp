#pragma once

#ifndef APEXACTORRL_DQNLOSS_HPP
#define APEXACTORRL_DQNLOSS_HPP

#include<vector>

#include<torch/torch.h>

#include"Loss.hpp"

namespace ApexActor
{
    /**
     * @brief Double-DQN temporal-difference loss
     *
     * For every transition of the batch:
     *
     *     a*     = argmax_a Q(s', a)
     *     target = r + gamma * Q_target(s', a*) * (1 - done)
     *     loss   = smooth_l1(Q(s, a), target)
     *
     * The target is detached. Returns `{element_wise_loss [N, 1], Q(s) [N, A]}`.
     */
    class DQNLoss
    {
    public:
        std::vector<torch::Tensor> operator()(Brain policy,
            Brain targetPolicy,
            const TransitionBatch &batch,
            double gamma,
            const HeadConfig &headConfig) const;
    };
}

#endif //APEXACTORRL_DQNLOSS_HPP
