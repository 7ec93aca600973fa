#pragma once

#ifndef APEXACTORRL_DQNWORKER_HPP
#define APEXACTORRL_DQNWORKER_HPP

#include<memory>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"Worker.hpp"
#include"../EpsilonGreedy.hpp"
#include"../Loss/Loss.hpp"
#include"../Model/brain.hpp"
#include"../PriorityEstimator.hpp"

namespace ApexActor
{
    /**
     * @class DQNWorker
     * @brief Epsilon-greedy DQN worker with optional n-step returns
     *
     * The worker owns a local copy of the Q-network (`Brain`). Actions are chosen
     * epsilon-greedily: with probability epsilon an action is sampled from the
     * environment's action space, otherwise the arg-max of Q(s) is taken.
     *
     * collectData() runs whole episodes back to back. With nStep > 1 each
     * transition goes through a sliding NStepWindow and every full window is
     * folded into one buffer entry; otherwise transitions are appended directly.
     * Collection stops as soon as the buffer holds `localBufferMaxSize` entries,
     * abandoning the episode in flight; the next cycle starts with a reset.
     *
     * Priorities are the element-wise loss of the configured loss type plus
     * perEps, computed with the online network used as its own target.
     */
    class DQNWorker : public Worker
    {
    private:
        HeadConfig headConfig;
        Brain dqn;
        std::vector<torch::Tensor> initialParameters;
        EpsilonGreedy exploration;
        std::unique_ptr<PriorityEstimator> priorityEstimator;

    public:
        /**
         * @brief Constructs the worker and its network
         *
         * @param rank Process-unique rank, seeds exploration and the environment
         * @param config Worker hyperparameters
         * @param hiddenSizes Hidden layer widths of the Q-network
         * @param env Environment with a "Discrete" action space
         * @param initialParameters Learner parameters to start from, in parameter order;
         *                          empty keeps the network's own initialization
         * @param experienceSink Consumer of emitted batches, required by run()
         * @param parameterSource Learner parameter feed, may be null
         * @param device Device holding the network
         *
         * @throws std::invalid_argument on an invalid config, a non-discrete action space
         *         or mismatching initial parameters
         */
        DQNWorker(int rank,
            const WorkerConfig &config,
            std::vector<int64_t> hiddenSizes,
            std::shared_ptr<Environment> env,
            std::vector<torch::Tensor> initialParameters = {},
            std::shared_ptr<ExperienceSink> experienceSink = nullptr,
            std::shared_ptr<ParameterSource> parameterSource = nullptr,
            torch::Device device = torch::kCPU);

        void initNetworks() override;

        /**
         * @throws std::invalid_argument if no experience sink was supplied
         */
        void initCommunication() override;

        torch::Tensor selectAction(const torch::Tensor &state) override;

        StepResult step(const torch::Tensor &action) override;

        LocalBuffer collectData() override;

        std::vector<float> computePriorities(const TransitionBatch &batch) override;

        void synchronize(const std::vector<torch::Tensor> &newParameters) override;

        void run() override;

        /**
         * @brief Loads network weights written by `torch::save(brain, path)`
         */
        void loadParams(const std::string &path);

        inline Brain getNetwork() const
        {
            return dqn;
        }

        inline double getEpsilon() const
        {
            return exploration.getEpsilon();
        }

        inline const HeadConfig &getHeadConfig() const
        {
            return headConfig;
        }
    };
}

#endif //APEXACTORRL_DQNWORKER_HPP
