/**
 * @file brain.cpp
 * @brief Q-network used by DQN workers
 */

#include<cmath>
#include<stdexcept>
#include<string>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/brain.hpp"
#include"../../include/Model/modelUtils.hpp"

namespace ApexActor
{
    /**
     * @brief Builds the hidden stack and the linear value head
     *
     * Hidden layers use relu, so weights are initialized orthogonally with gain
     * sqrt(2); biases start at zero.
     */
    BrainImpl::BrainImpl(int64_t stateSize, int64_t outputSize, const std::vector<int64_t> &hiddenSizes) :
        hidden(nullptr),
        output(nullptr),
        stateSize(stateSize),
        outputSize(outputSize)
    {
        if (stateSize <= 0 || outputSize <= 0)
        {
            throw std::invalid_argument("Brain needs positive state and output sizes, got " +
                std::to_string(stateSize) + " and " + std::to_string(outputSize));
        }

        hidden = torch::nn::Sequential();
        int64_t inputSize = stateSize;
        for (const auto hiddenSize : hiddenSizes)
        {
            hidden->push_back(torch::nn::Linear(inputSize, hiddenSize));
            hidden->push_back(torch::nn::Functional(torch::relu));
            inputSize = hiddenSize;
        }
        output = torch::nn::Linear(inputSize, outputSize);

        register_module("hidden", hidden);
        register_module("output", output);

        initWeights(hidden->named_parameters(), std::sqrt(2.), 0);
        initWeights(output->named_parameters(), std::sqrt(2.), 0);
    }

    torch::Tensor BrainImpl::forward(torch::Tensor state)
    {
        if (!hidden->is_empty())
        {
            state = hidden->forward(state);
        }
        return output(state);
    }

    TEST_CASE("Brain")
    {
        torch::manual_seed(0);
        Brain brain(4, 3, std::vector<int64_t>{16, 8});

        SUBCASE("Single state gives one value per action")
        {
            auto values = brain->forward(torch::rand({4}));
            CHECK(values.dim() == 1);
            CHECK(values.size(0) == 3);
        }

        SUBCASE("Batch of states gives a value matrix")
        {
            auto values = brain->forward(torch::rand({5, 4}));
            CHECK(values.size(0) == 5);
            CHECK(values.size(1) == 3);
        }

        SUBCASE("Parameters are enumerated hidden layers first")
        {
            auto parameters = brain->parameters();
            REQUIRE(parameters.size() == 6);
            CHECK(parameters[0].sizes() == torch::IntArrayRef({16, 4}));
            CHECK(parameters[1].sizes() == torch::IntArrayRef({16}));
            CHECK(parameters[2].sizes() == torch::IntArrayRef({8, 16}));
            CHECK(parameters[3].sizes() == torch::IntArrayRef({8}));
            CHECK(parameters[4].sizes() == torch::IntArrayRef({3, 8}));
            CHECK(parameters[5].sizes() == torch::IntArrayRef({3}));
        }

        SUBCASE("Without hidden layers the network is linear")
        {
            Brain linear(4, 2, std::vector<int64_t>{});
            CHECK(linear->parameters().size() == 2);
            CHECK(linear->forward(torch::rand({4})).size(0) == 2);
        }

        SUBCASE("Non-positive sizes are rejected")
        {
            CHECK_THROWS_AS(Brain(0, 3, std::vector<int64_t>{8}), std::invalid_argument);
            CHECK_THROWS_AS(Brain(4, 0, std::vector<int64_t>{8}), std::invalid_argument);
        }
    }
}
