#pragma once

#ifndef APEXACTORRL_BRAIN_HPP
#define APEXACTORRL_BRAIN_HPP

#include<vector>

#include<torch/torch.h>
#include<torch/nn.h>

namespace ApexActor
{
    /**
     * @class BrainImpl
     * @brief Multi-layer perceptron mapping a state to one value per action
     *
     * The network is a stack of `Linear -> relu` blocks, one per entry of
     * `hiddenSizes`, followed by a linear head with `outputSize` outputs:
     *
     *     Q(s) = W_out * relu(... relu(W_1 * s + b_1) ...) + b_out
     *
     * Both a single state `[state_size]` and a batch `[batch, state_size]` are
     * accepted.
     *
     * The order of `parameters()` is the registration order (hidden layers first,
     * weight before bias, then the output layer). Parameter synchronization relies
     * on this order being identical on the learner and on every worker.
     */
    class BrainImpl : public torch::nn::Module
    {
    private:
        torch::nn::Sequential hidden;
        torch::nn::Linear output;
        int64_t stateSize;
        int64_t outputSize;

    public:
        /**
         * @param stateSize Flattened observation size
         * @param outputSize Number of discrete actions
         * @param hiddenSizes Width of each hidden layer, may be empty
         *
         * @throws std::invalid_argument if stateSize or outputSize is not positive
         */
        BrainImpl(int64_t stateSize, int64_t outputSize, const std::vector<int64_t> &hiddenSizes);

        torch::Tensor forward(torch::Tensor state);

        inline int64_t getStateSize() const
        {
            return stateSize;
        }

        inline int64_t getOutputSize() const
        {
            return outputSize;
        }
    };
    TORCH_MODULE(Brain);
}

#endif //APEXACTORRL_BRAIN_HPP
