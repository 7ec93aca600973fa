#pragma once

#ifndef APEXACTORRL_NSTEPWINDOW_HPP
#define APEXACTORRL_NSTEPWINDOW_HPP

#include<cstddef>
#include<vector>

#include"Transition.hpp"

namespace ApexActor
{
    /**
     * @brief Bounded FIFO window of the most recent transitions
     *
     * `NStepWindow` is a fixed-capacity ring buffer. Pushing into a full window
     * evicts the oldest transition. Slots are addressed by index relative to the
     * oldest element, so `at(0)` is always the oldest and `at(size() - 1)` the
     * newest transition.
     *
     * The window is sliding: folding does not consume its contents. Every push
     * into a full window therefore produces a new n-step estimate that overlaps
     * the previous one in `capacity - 1` transitions.
     */
    class NStepWindow
    {
    private:
        std::vector<Transition> slots; /**< Storage, grows to `capacity` then is overwritten in place */
        std::size_t capacity;          /**< Window length N */
        std::size_t head;              /**< Slot holding the oldest element once the window is full */

    public:
        /**
         * @brief Constructs an empty window
         *
         * @param capacity Window length N, must be at least 1
         * @throws std::invalid_argument if capacity is 0
         */
        explicit NStepWindow(std::size_t capacity);

        /**
         * @brief Appends a transition, evicting the oldest one when full
         */
        void push(const Transition &transition);

        /**
         * @brief Returns the i-th transition counted from the oldest
         *
         * @throws std::out_of_range if index >= size()
         */
        const Transition &at(std::size_t index) const;

        /**
         * @brief Folds the full window into a single n-step transition
         *
         * The folded transition keeps the state and action of the oldest element.
         * Its reward is the discounted sum
         *
         *     R = sum_{i=0}^{N-1} gamma^i * r_i
         *
         * its next state is the newest element's next state and it is done when
         * any element of the window is done.
         *
         * @param gamma Discount factor
         * @throws std::logic_error if the window is not full
         */
        Transition fold(double gamma) const;

        void clear();

        inline std::size_t size() const
        {
            return slots.size();
        }

        inline std::size_t getCapacity() const
        {
            return capacity;
        }

        inline bool isFull() const
        {
            return slots.size() == capacity;
        }

        inline bool empty() const
        {
            return slots.empty();
        }
    };
}

#endif //APEXACTORRL_NSTEPWINDOW_HPP
