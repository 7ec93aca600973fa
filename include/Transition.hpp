#pragma once

#ifndef APEXACTORRL_TRANSITION_HPP
#define APEXACTORRL_TRANSITION_HPP

#include<map>
#include<string>
#include<utility>

#include<torch/torch.h>

namespace ApexActor
{
    /**
     * @brief One environment step `(state, action, reward, next_state, done)`
     *
     * A Transition is immutable once built. It is produced by the interaction
     * loop and consumed either by the NStepWindow or directly by the LocalBuffer.
     */
    class Transition
    {
    private:
        torch::Tensor state;
        torch::Tensor action;
        double reward;
        torch::Tensor nextState;
        bool done;

    public:
        Transition(torch::Tensor state,
            torch::Tensor action,
            double reward,
            torch::Tensor nextState,
            bool done) :
        state(std::move(state)),
        action(std::move(action)),
        reward(reward),
        nextState(std::move(nextState)),
        done(done)
        {
        }

        inline const torch::Tensor &getState() const
        {
            return state;
        }

        inline const torch::Tensor &getAction() const
        {
            return action;
        }

        inline double getReward() const
        {
            return reward;
        }

        inline const torch::Tensor &getNextState() const
        {
            return nextState;
        }

        inline bool isDone() const
        {
            return done;
        }
    };

    /**
     * @brief Response of a single environment step
     *
     * Mirrors the `(next_state, reward, done, info)` tuple returned by gym-style
     * environments. `info` carries free-form diagnostic strings.
     */
    struct StepResult
    {
        torch::Tensor nextState;
        double reward;
        bool done;
        std::map<std::string, std::string> info;
    };
}

#endif //APEXACTORRL_TRANSITION_HPP
