#pragma once

#ifndef APEXACTORRL_PRIORITYESTIMATOR_HPP
#define APEXACTORRL_PRIORITYESTIMATOR_HPP

#include<vector>

#include<torch/torch.h>

#include"LocalBuffer.hpp"
#include"Loss/Loss.hpp"
#include"Model/brain.hpp"

namespace ApexActor
{
    /**
     * @brief Computes initial replay priorities of a collected batch
     *
     * The whole batch is evaluated with a single call of the loss function and
     * each entry receives `loss[i] + perEps`. With perEps > 0 every priority is
     * strictly positive, so every transition keeps a non-zero sampling weight in
     * the prioritized replay buffer.
     *
     * Evaluation runs without gradient tracking and does not touch the network,
     * so the same batch and parameters always produce the same priorities.
     */
    class PriorityEstimator
    {
    private:
        LossFunction lossFunction;
        double gamma;
        double perEps;
        HeadConfig headConfig;

    public:
        /**
         * @throws std::invalid_argument if perEps is not strictly positive or lossFunction is empty
         */
        PriorityEstimator(LossFunction lossFunction, double gamma, double perEps, HeadConfig headConfig);

        /**
         * @brief Returns one priority per batch entry, in batch order
         *
         * @param policy Online network
         * @param targetPolicy Network used for the bootstrap target, the online network on workers
         * @param batch Frozen local buffer
         * @param device Device the evaluation runs on
         */
        std::vector<float> computePriorities(Brain policy,
            Brain targetPolicy,
            const TransitionBatch &batch,
            torch::Device device) const;

        inline double getPerEps() const
        {
            return perEps;
        }
    };
}

#endif //APEXACTORRL_PRIORITYESTIMATOR_HPP
