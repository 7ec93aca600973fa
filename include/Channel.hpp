#pragma once

#ifndef APEXACTORRL_CHANNEL_HPP
#define APEXACTORRL_CHANNEL_HPP

#include<optional>
#include<vector>

#include<torch/torch.h>

#include"LocalBuffer.hpp"

namespace ApexActor
{
    /**
     * @brief One emission: a frozen local buffer with its priorities
     */
    struct ExperienceBatch
    {
        int rank;
        TransitionBatch transitions;
        std::vector<float> priorities;
    };

    /**
     * @brief Consumer side of the worker (replay buffer or learner)
     *
     * emit() may block while the consumer applies backpressure; it must not
     * drop the batch.
     */
    class ExperienceSink
    {
    public:
        virtual ~ExperienceSink() = default;

        virtual void connect() {}

        virtual void emit(const ExperienceBatch &batch) = 0;
    };

    /**
     * @brief Source of parameter sets published by the learner
     *
     * poll() never blocks: it returns the newest parameter set available, or
     * std::nullopt when nothing new has arrived.
     */
    class ParameterSource
    {
    public:
        virtual ~ParameterSource() = default;

        virtual void connect() {}

        virtual std::optional<std::vector<torch::Tensor>> poll() = 0;
    };
}

#endif //APEXACTORRL_CHANNEL_HPP
