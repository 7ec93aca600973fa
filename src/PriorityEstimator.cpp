/**
 * @file PriorityEstimator.cpp
 * @brief Initial replay priorities from the element-wise loss of a batch
 */

#include<stdexcept>
#include<string>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/PriorityEstimator.hpp"
#include"../include/Loss/DQNLoss.hpp"

namespace ApexActor
{
    PriorityEstimator::PriorityEstimator(LossFunction lossFunction, double gamma, double perEps, HeadConfig headConfig) :
    lossFunction(std::move(lossFunction)),
    gamma(gamma),
    perEps(perEps),
    headConfig(std::move(headConfig))
    {
        if (!this->lossFunction)
        {
            throw std::invalid_argument("PriorityEstimator needs a loss function");
        }
        if (!(perEps > 0))
        {
            throw std::invalid_argument("perEps must be strictly positive");
        }
    }

    /**
     * @brief Evaluates the loss on the whole batch at once
     *
     * The batch is moved to `device` with rewards and dones reshaped to [N, 1]
     * and actions cast to int64, which is the layout loss functions expect.
     */
    std::vector<float> PriorityEstimator::computePriorities(Brain policy,
        Brain targetPolicy,
        const TransitionBatch &batch,
        torch::Device device) const
    {
        torch::NoGradGuard noGrad;

        TransitionBatch deviceBatch;
        deviceBatch.states = batch.states.to(device, torch::kFloat);
        deviceBatch.actions = batch.actions.to(device, torch::kLong);
        deviceBatch.rewards = batch.rewards.to(device, torch::kFloat).reshape({-1, 1});
        deviceBatch.nextStates = batch.nextStates.to(device, torch::kFloat);
        deviceBatch.dones = batch.dones.to(device, torch::kFloat).reshape({-1, 1});

        auto outputs = lossFunction(policy, targetPolicy, deviceBatch, gamma, headConfig);
        if (outputs.empty())
        {
            throw std::logic_error("Loss function returned no element-wise loss");
        }

        auto priorities = (outputs[0].detach().reshape({-1}) + perEps).to(torch::kCPU, torch::kFloat).contiguous();
        if (priorities.size(0) != batch.size())
        {
            throw std::logic_error("Loss function returned " + std::to_string(priorities.size(0)) +
                " elements for a batch of " + std::to_string(batch.size()));
        }
        return std::vector<float>(priorities.data_ptr<float>(),
            priorities.data_ptr<float>() + priorities.numel());
    }

    TEST_CASE("PriorityEstimator")
    {
        torch::manual_seed(0);
        Brain brain(3, 2, std::vector<int64_t>{8});
        HeadConfig headConfig{{3}, 2, {8}};

        TransitionBatch batch;
        batch.states = torch::rand({10, 3});
        batch.actions = torch::randint(2, {10}, torch::kLong);
        batch.rewards = torch::rand({10});
        batch.nextStates = torch::rand({10, 3});
        batch.dones = torch::zeros({10});

        SUBCASE("One priority per entry, loss plus perEps")
        {
            PriorityEstimator estimator(DQNLoss(), 0.99, 1e-6, headConfig);
            auto priorities = estimator.computePriorities(brain, brain, batch, torch::kCPU);
            REQUIRE(priorities.size() == 10);

            torch::NoGradGuard guard;
            TransitionBatch reshaped = batch;
            reshaped.rewards = batch.rewards.reshape({-1, 1});
            reshaped.dones = batch.dones.reshape({-1, 1});
            auto loss = DQNLoss()(brain, brain, reshaped, 0.99, headConfig)[0].reshape({-1});
            for (int i = 0; i < 10; ++i)
            {
                CHECK(priorities[i] == doctest::Approx(loss[i].item<float>() + 1e-6));
            }
        }

        SUBCASE("Priorities stay positive when the loss is zero")
        {
            auto zeroLoss = [](Brain, Brain, const TransitionBatch &batch, double, const HeadConfig &)
            {
                return std::vector<torch::Tensor>{torch::zeros({batch.states.size(0), 1})};
            };
            PriorityEstimator estimator(zeroLoss, 0.99, 1e-6, headConfig);
            auto priorities = estimator.computePriorities(brain, brain, batch, torch::kCPU);
            for (const auto priority : priorities)
            {
                CHECK(priority > 0);
                CHECK(priority == doctest::Approx(1e-6));
            }
        }

        SUBCASE("Same batch and parameters give the same priorities")
        {
            PriorityEstimator estimator(DQNLoss(), 0.99, 1e-6, headConfig);
            auto first = estimator.computePriorities(brain, brain, batch, torch::kCPU);
            auto second = estimator.computePriorities(brain, brain, batch, torch::kCPU);
            CHECK(first == second);
        }

        SUBCASE("Non-positive perEps is rejected")
        {
            CHECK_THROWS_AS(PriorityEstimator(DQNLoss(), 0.99, 0.0, headConfig), std::invalid_argument);
        }

        SUBCASE("Loss of the wrong length is an error")
        {
            auto shortLoss = [](Brain, Brain, const TransitionBatch &, double, const HeadConfig &)
            {
                return std::vector<torch::Tensor>{torch::zeros({3, 1})};
            };
            PriorityEstimator estimator(shortLoss, 0.99, 1e-6, headConfig);
            CHECK_THROWS_AS(estimator.computePriorities(brain, brain, batch, torch::kCPU), std::logic_error);
        }
    }
}
