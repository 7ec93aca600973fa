#pragma once

#ifndef APEXACTORRL_LOCALBUFFER_HPP
#define APEXACTORRL_LOCALBUFFER_HPP

#include<cstddef>
#include<vector>

#include<torch/torch.h>

#include"Transition.hpp"

namespace ApexActor
{
    /**
     * @brief Frozen, fixed-size view of a LocalBuffer
     *
     * Every tensor has the entry count as its leading dimension:
     * - states:     [N, *observation_shape], float
     * - actions:    [N, *action_shape], int64 for discrete actions
     * - rewards:    [N], float
     * - nextStates: [N, *observation_shape], float
     * - dones:      [N], float (0 or 1)
     */
    struct TransitionBatch
    {
        torch::Tensor states;
        torch::Tensor actions;
        torch::Tensor rewards;
        torch::Tensor nextStates;
        torch::Tensor dones;

        inline int64_t size() const
        {
            return states.defined() ? states.size(0) : 0;
        }
    };

    /**
     * @brief Worker-local accumulation buffer stored as a struct of arrays
     *
     * The five fields are only ever grown together through push(), so their
     * lengths stay equal and index i of every field describes the same
     * transition, in collection order.
     */
    class LocalBuffer
    {
    private:
        std::vector<torch::Tensor> states;
        std::vector<torch::Tensor> actions;
        std::vector<double> rewards;
        std::vector<torch::Tensor> nextStates;
        std::vector<bool> dones;

    public:
        LocalBuffer() = default;

        /**
         * @brief Appends one entry to every field
         */
        void push(const Transition &transition);

        /**
         * @brief Number of entries, measured on the states field
         *
         * @throws std::logic_error if the fields are out of lock-step
         */
        std::size_t size() const;

        /**
         * @brief True when every field holds the same number of entries
         */
        bool isLockStep() const;

        void clear();

        /**
         * @brief Stacks every field into a fixed-size tensor
         *
         * @throws std::logic_error if the buffer is empty or out of lock-step
         */
        TransitionBatch freeze() const;

        inline bool empty() const
        {
            return states.empty();
        }

        inline const std::vector<torch::Tensor> &getStates() const
        {
            return states;
        }

        inline const std::vector<torch::Tensor> &getActions() const
        {
            return actions;
        }

        inline const std::vector<double> &getRewards() const
        {
            return rewards;
        }

        inline const std::vector<torch::Tensor> &getNextStates() const
        {
            return nextStates;
        }

        inline const std::vector<bool> &getDones() const
        {
            return dones;
        }
    };
}

#endif //APEXACTORRL_LOCALBUFFER_HPP
