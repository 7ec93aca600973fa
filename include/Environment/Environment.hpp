#pragma once

#ifndef APEXACTORRL_ENVIRONMENT_HPP
#define APEXACTORRL_ENVIRONMENT_HPP

#include<torch/torch.h>

#include"../Space.hpp"
#include"../Transition.hpp"

namespace ApexActor
{
    /**
     * @brief Gym-style environment driven by a worker
     *
     * Implementations are treated as opaque: workers only rely on the shape of
     * observations and on rewards being scalars. Errors raised by reset() or
     * step() are expected to propagate out of the worker.
     */
    class Environment
    {
    public:
        virtual ~Environment() = 0;

        /**
         * @brief Starts a new episode and returns its first observation
         */
        virtual torch::Tensor reset() = 0;

        /**
         * @brief Applies an action and returns `(next_state, reward, done, info)`
         */
        virtual StepResult step(const torch::Tensor &action) = 0;

        /**
         * @brief Seeds the environment and its action-space sampler
         */
        virtual void seed(unsigned int seed) = 0;

        /**
         * @brief Draws an action uniformly from the action space
         */
        virtual torch::Tensor sampleAction() = 0;

        virtual ActionSpace getActionSpace() const = 0;

        virtual ObservationSpace getObservationSpace() const = 0;

        virtual void render() {}
    };
    inline Environment::~Environment() {}
}

#endif //APEXACTORRL_ENVIRONMENT_HPP
