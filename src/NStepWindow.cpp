/**
 * @file NStepWindow.cpp
 * @brief Sliding n-step window and its fold into a single transition
 */

#include<stdexcept>
#include<string>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/NStepWindow.hpp"

namespace ApexActor
{
    NStepWindow::NStepWindow(std::size_t capacity) :
    capacity(capacity),
    head(0)
    {
        if (capacity == 0)
        {
            throw std::invalid_argument("NStepWindow capacity must be at least 1");
        }
        slots.reserve(capacity);
    }

    void NStepWindow::push(const Transition &transition)
    {
        if (slots.size() < capacity)
        {
            slots.push_back(transition);
            return;
        }
        // Full: the oldest slot is overwritten and the head moves to the next oldest
        slots[head] = transition;
        head = (head + 1) % capacity;
    }

    const Transition &NStepWindow::at(std::size_t index) const
    {
        if (index >= slots.size())
        {
            throw std::out_of_range("NStepWindow index " + std::to_string(index) +
                " out of range for size " + std::to_string(slots.size()));
        }
        return slots[(head + index) % slots.size()];
    }

    /**
     * @brief Folds the window into one n-step transition
     *
     * Walks the window from oldest to newest accumulating
     *
     *     R = r_0 + gamma * r_1 + gamma^2 * r_2 + ... + gamma^{N-1} * r_{N-1}
     *
     * The discount is not truncated at done flags; done is reported as the OR of
     * all flags so the consumer does not bootstrap past a terminal state.
     */
    Transition NStepWindow::fold(double gamma) const
    {
        if (!isFull())
        {
            throw std::logic_error("NStepWindow::fold called on a window holding " +
                std::to_string(slots.size()) + " of " + std::to_string(capacity) + " transitions");
        }

        double reward = 0;
        double discount = 1;
        bool done = false;
        for (std::size_t i = 0; i < capacity; ++i)
        {
            const auto &transition = at(i);
            reward += discount * transition.getReward();
            discount *= gamma;
            done = done || transition.isDone();
        }

        const auto &first = at(0);
        const auto &last = at(capacity - 1);
        return Transition(first.getState(), first.getAction(), reward, last.getNextState(), done);
    }

    void NStepWindow::clear()
    {
        slots.clear();
        head = 0;
    }

    namespace
    {
        Transition makeTransition(float index, double reward, bool done)
        {
            return Transition(torch::full({2}, index),
                torch::tensor(static_cast<int64_t>(index)),
                reward,
                torch::full({2}, index + 1),
                done);
        }
    }

    TEST_CASE("NStepWindow")
    {
        SUBCASE("Zero capacity is rejected")
        {
            CHECK_THROWS_AS(NStepWindow(0), std::invalid_argument);
        }

        SUBCASE("Evicts the oldest transition once full")
        {
            NStepWindow window(3);
            for (int i = 0; i < 5; ++i)
            {
                window.push(makeTransition(static_cast<float>(i), i, false));
            }

            REQUIRE(window.size() == 3);
            CHECK(window.isFull());
            CHECK(window.at(0).getReward() == doctest::Approx(2));
            CHECK(window.at(1).getReward() == doctest::Approx(3));
            CHECK(window.at(2).getReward() == doctest::Approx(4));
            CHECK_THROWS_AS(window.at(3), std::out_of_range);
        }

        SUBCASE("Folding a partial window is an error")
        {
            NStepWindow window(3);
            window.push(makeTransition(0, 1, false));
            CHECK_THROWS_AS(window.fold(0.9), std::logic_error);
        }

        SUBCASE("Fold computes the discounted reward sum")
        {
            NStepWindow window(3);
            window.push(makeTransition(0, 1.0, false));
            window.push(makeTransition(1, 2.0, false));
            window.push(makeTransition(2, 4.0, false));

            auto folded = window.fold(0.5);

            // 1 + 0.5 * 2 + 0.25 * 4
            CHECK(folded.getReward() == doctest::Approx(3.0));
            CHECK(folded.getState()[0].item<float>() == doctest::Approx(0));
            CHECK(folded.getAction().item<int64_t>() == 0);
            CHECK(folded.getNextState()[0].item<float>() == doctest::Approx(3));
            CHECK_FALSE(folded.isDone());
        }

        SUBCASE("Folded done is the OR of the window")
        {
            NStepWindow window(3);
            window.push(makeTransition(0, 0, false));
            window.push(makeTransition(1, 0, true));
            window.push(makeTransition(2, 0, false));

            CHECK(window.fold(0.99).isDone());
        }

        SUBCASE("Window keeps sliding after a fold")
        {
            NStepWindow window(2);
            window.push(makeTransition(0, 1.0, false));
            window.push(makeTransition(1, 10.0, false));
            auto first = window.fold(0.1);
            window.push(makeTransition(2, 100.0, false));
            auto second = window.fold(0.1);

            CHECK(first.getReward() == doctest::Approx(2.0));
            CHECK(second.getReward() == doctest::Approx(20.0));
            CHECK(second.getState()[0].item<float>() == doctest::Approx(1));
            CHECK(second.getNextState()[0].item<float>() == doctest::Approx(3));
        }

        SUBCASE("Capacity one folds to the transition itself")
        {
            NStepWindow window(1);
            window.push(makeTransition(4, 7.0, true));
            auto folded = window.fold(0.5);

            CHECK(folded.getReward() == doctest::Approx(7.0));
            CHECK(folded.isDone());
        }

        SUBCASE("Clear empties the window")
        {
            NStepWindow window(2);
            window.push(makeTransition(0, 1.0, false));
            window.push(makeTransition(1, 1.0, false));
            window.clear();

            CHECK(window.empty());
            CHECK_FALSE(window.isFull());
        }
    }
}
