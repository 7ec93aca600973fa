#pragma once

#ifndef APEXACTORRL_SCRIPTEDENVIRONMENT_HPP
#define APEXACTORRL_SCRIPTEDENVIRONMENT_HPP

#include<deque>
#include<functional>
#include<random>
#include<stdexcept>
#include<vector>

#include<torch/torch.h>

#include"../include/Channel.hpp"
#include"../include/Environment/Environment.hpp"

namespace ApexActor
{
    /**
     * @brief Deterministic environment with fixed-length episodes
     *
     * The state after t steps is [t, 0.5 t, 1, -t]. Taking action a at step t
     * yields reward a + 0.1 (t + 1). Episodes end after `episodeLength` steps.
     */
    class ScriptedEnvironment : public Environment
    {
    private:
        int64_t episodeLength;
        int64_t numActions;
        int64_t t = 0;
        std::mt19937 sampler;

        torch::Tensor observation() const
        {
            const auto value = static_cast<float>(t);
            return torch::tensor({value, 0.5f * value, 1.0f, -value});
        }

    public:
        int64_t resets = 0;
        int64_t steps = 0;
        int64_t renders = 0;
        int64_t failAtStep = -1;  /**< Total step count at which step() throws, -1 never */
        unsigned int lastSeed = 0;

        explicit ScriptedEnvironment(int64_t episodeLength, int64_t numActions = 3) :
        episodeLength(episodeLength),
        numActions(numActions),
        sampler(0)
        {
        }

        torch::Tensor reset() override
        {
            ++resets;
            t = 0;
            return observation();
        }

        StepResult step(const torch::Tensor &action) override
        {
            if (failAtStep >= 0 && steps == failAtStep)
            {
                throw std::runtime_error("scripted environment failure");
            }
            ++steps;
            const auto a = action.item<int64_t>();
            ++t;
            StepResult result;
            result.nextState = observation();
            result.reward = static_cast<double>(a) + 0.1 * static_cast<double>(t);
            result.done = t >= episodeLength;
            return result;
        }

        void seed(unsigned int seed) override
        {
            lastSeed = seed;
            sampler.seed(seed);
        }

        torch::Tensor sampleAction() override
        {
            std::uniform_int_distribution<int64_t> distribution(0, numActions - 1);
            return torch::tensor(distribution(sampler));
        }

        ActionSpace getActionSpace() const override
        {
            return ActionSpace{"Discrete", {numActions}};
        }

        ObservationSpace getObservationSpace() const override
        {
            return ObservationSpace{"Box", {4}};
        }

        void render() override
        {
            ++renders;
        }
    };

    /**
     * @brief Sink keeping every emitted batch in memory
     */
    class RecordingSink : public ExperienceSink
    {
    public:
        std::vector<ExperienceBatch> batches;
        int connects = 0;
        std::function<void()> onEmit;

        void connect() override
        {
            ++connects;
        }

        void emit(const ExperienceBatch &batch) override
        {
            batches.push_back(batch);
            if (onEmit)
            {
                onEmit();
            }
        }
    };

    /**
     * @brief Parameter source over a queue of published parameter sets
     *
     * Like a real subscriber, poll() drains the queue and returns only the
     * newest set.
     */
    class QueuedParameterSource : public ParameterSource
    {
    public:
        std::deque<std::vector<torch::Tensor>> queue;
        int polls = 0;

        std::optional<std::vector<torch::Tensor>> poll() override
        {
            ++polls;
            if (queue.empty())
            {
                return std::nullopt;
            }
            auto parameters = queue.back();
            queue.clear();
            return parameters;
        }
    };
}

#endif //APEXACTORRL_SCRIPTEDENVIRONMENT_HPP
