/**
 * @file DQNLoss.cpp
 * @brief Element-wise double-DQN loss used to seed replay priorities
 */

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Loss/DQNLoss.hpp"

namespace ApexActor
{
    std::vector<torch::Tensor> DQNLoss::operator()(Brain policy,
        Brain targetPolicy,
        const TransitionBatch &batch,
        double gamma,
        const HeadConfig &) const
    {
        // The network sees flattened observations
        auto states = batch.states.reshape({batch.states.size(0), -1});
        auto nextStates = batch.nextStates.reshape({batch.nextStates.size(0), -1});

        auto qValues = policy->forward(states);
        auto nextQValues = policy->forward(nextStates);
        auto nextTargetQValues = targetPolicy->forward(nextStates);

        // Q(s, a) for the action actually taken
        auto currentQValue = qValues.gather(1, batch.actions.to(torch::kLong).reshape({-1, 1}));
        // Action chosen by the online network, evaluated by the target network
        auto nextQValue = nextTargetQValues.gather(1, nextQValues.argmax(1).unsqueeze(1));

        auto masks = 1 - batch.dones;
        auto target = batch.rewards + gamma * nextQValue * masks;

        auto elementWiseLoss = torch::smooth_l1_loss(currentQValue,
            target.detach(),
            at::Reduction::None);

        return {elementWiseLoss, qValues};
    }

    TEST_CASE("DQNLoss")
    {
        torch::manual_seed(0);
        Brain brain(3, 2, std::vector<int64_t>{8});
        DQNLoss loss;
        HeadConfig headConfig{{3}, 2, {8}};

        TransitionBatch batch;
        batch.states = torch::rand({6, 3});
        batch.actions = torch::randint(2, {6}, torch::kLong);
        batch.rewards = torch::rand({6, 1});
        batch.nextStates = torch::rand({6, 3});
        batch.dones = torch::zeros({6, 1});

        SUBCASE("Returns one non-negative loss per transition")
        {
            auto outputs = loss(brain, brain, batch, 0.99, headConfig);
            REQUIRE(outputs.size() == 2);
            CHECK(outputs[0].size(0) == 6);
            CHECK(outputs[0].size(1) == 1);
            CHECK(outputs[0].min().item<float>() >= 0);
            CHECK(outputs[1].size(1) == 2);
        }

        SUBCASE("Terminal transitions do not bootstrap")
        {
            torch::NoGradGuard guard;
            batch.dones = torch::ones({6, 1});
            auto outputs = loss(brain, brain, batch, 0.99, headConfig);

            auto current = brain->forward(batch.states).gather(1, batch.actions.reshape({-1, 1}));
            auto expected = torch::smooth_l1_loss(current, batch.rewards, at::Reduction::None);
            CHECK(torch::allclose(outputs[0], expected));
        }

        SUBCASE("Loss is zero when the target equals the current value")
        {
            torch::NoGradGuard guard;
            batch.dones = torch::ones({6, 1});
            batch.rewards = brain->forward(batch.states).gather(1, batch.actions.reshape({-1, 1}));
            auto outputs = loss(brain, brain, batch, 0.99, headConfig);
            CHECK(outputs[0].abs().max().item<float>() == doctest::Approx(0).epsilon(1e-6));
        }
    }
}
