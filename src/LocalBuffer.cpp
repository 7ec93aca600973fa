/**
 * @file LocalBuffer.cpp
 * @brief Struct-of-arrays accumulation buffer of a worker
 */

#include<stdexcept>
#include<string>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/LocalBuffer.hpp"

namespace ApexActor
{
    void LocalBuffer::push(const Transition &transition)
    {
        states.push_back(transition.getState());
        actions.push_back(transition.getAction());
        rewards.push_back(transition.getReward());
        nextStates.push_back(transition.getNextState());
        dones.push_back(transition.isDone());
    }

    bool LocalBuffer::isLockStep() const
    {
        const auto length = states.size();
        return actions.size() == length &&
               rewards.size() == length &&
               nextStates.size() == length &&
               dones.size() == length;
    }

    std::size_t LocalBuffer::size() const
    {
        if (!isLockStep())
        {
            throw std::logic_error("LocalBuffer fields are out of lock-step");
        }
        return states.size();
    }

    void LocalBuffer::clear()
    {
        states.clear();
        actions.clear();
        rewards.clear();
        nextStates.clear();
        dones.clear();
    }

    /**
     * @brief Stacks the buffer into a TransitionBatch
     *
     * States and actions keep their element shape behind a new leading dimension.
     * Rewards are narrowed to float and dones are stored as 0/1 floats so the
     * batch can be fed to a loss function directly.
     */
    TransitionBatch LocalBuffer::freeze() const
    {
        const auto length = size();
        if (length == 0)
        {
            throw std::logic_error("Cannot freeze an empty LocalBuffer");
        }

        TransitionBatch batch;
        batch.states = torch::stack(states).to(torch::kFloat);
        batch.actions = torch::stack(actions);
        batch.nextStates = torch::stack(nextStates).to(torch::kFloat);

        batch.rewards = torch::empty({static_cast<int64_t>(length)}, torch::kFloat);
        batch.dones = torch::empty({static_cast<int64_t>(length)}, torch::kFloat);
        auto rewardAccessor = batch.rewards.accessor<float, 1>();
        auto doneAccessor = batch.dones.accessor<float, 1>();
        for (std::size_t i = 0; i < length; ++i)
        {
            rewardAccessor[i] = static_cast<float>(rewards[i]);
            doneAccessor[i] = dones[i] ? 1.0f : 0.0f;
        }
        return batch;
    }

    TEST_CASE("LocalBuffer")
    {
        LocalBuffer buffer;

        SUBCASE("Fields grow in lock-step")
        {
            for (int i = 0; i < 4; ++i)
            {
                buffer.push(Transition(torch::rand({3}), torch::tensor(int64_t{1}), i, torch::rand({3}), i == 3));
                CHECK(buffer.isLockStep());
                CHECK(buffer.size() == static_cast<std::size_t>(i + 1));
            }
        }

        SUBCASE("Freezing an empty buffer is an error")
        {
            CHECK_THROWS_AS(buffer.freeze(), std::logic_error);
        }

        SUBCASE("freeze() stacks fields in collection order")
        {
            for (int i = 0; i < 5; ++i)
            {
                buffer.push(Transition(torch::full({3}, static_cast<float>(i)),
                    torch::tensor(static_cast<int64_t>(i % 2)),
                    0.5 * i,
                    torch::full({3}, static_cast<float>(i + 1)),
                    i == 4));
            }

            auto batch = buffer.freeze();

            CHECK(batch.size() == 5);
            CHECK(batch.states.sizes() == torch::IntArrayRef({5, 3}));
            CHECK(batch.nextStates.sizes() == torch::IntArrayRef({5, 3}));
            CHECK(batch.actions.sizes() == torch::IntArrayRef({5}));
            CHECK(batch.actions.scalar_type() == torch::kLong);
            CHECK(batch.rewards.sizes() == torch::IntArrayRef({5}));
            CHECK(batch.dones.sizes() == torch::IntArrayRef({5}));

            for (int i = 0; i < 5; ++i)
            {
                CHECK(batch.states[i][0].item<float>() == doctest::Approx(i));
                CHECK(batch.nextStates[i][0].item<float>() == doctest::Approx(i + 1));
                CHECK(batch.actions[i].item<int64_t>() == i % 2);
                CHECK(batch.rewards[i].item<float>() == doctest::Approx(0.5 * i));
            }
            CHECK(batch.dones[3].item<float>() == doctest::Approx(0));
            CHECK(batch.dones[4].item<float>() == doctest::Approx(1));
        }

        SUBCASE("clear() empties every field")
        {
            buffer.push(Transition(torch::rand({3}), torch::tensor(int64_t{0}), 1, torch::rand({3}), false));
            buffer.clear();

            CHECK(buffer.empty());
            CHECK(buffer.size() == 0);
            CHECK(buffer.getRewards().empty());
            CHECK(buffer.getDones().empty());
        }
    }
}
