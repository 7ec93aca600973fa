#pragma once

#ifndef APEXACTORRL_WORKER_HPP
#define APEXACTORRL_WORKER_HPP

#include<atomic>
#include<cstdint>
#include<memory>
#include<vector>

#include<torch/torch.h>

#include"../Channel.hpp"
#include"../Environment/Environment.hpp"
#include"../LocalBuffer.hpp"
#include"../Transition.hpp"
#include"../WorkerConfig.hpp"

namespace ApexActor
{
    /**
     * @brief Phase of the collection cycle Idle -> Collecting -> Emitting -> Idle
     */
    enum class WorkerPhase
    {
        Idle,
        Collecting,
        Emitting
    };

    const char *toString(WorkerPhase phase);

    /**
     * @brief Score and length of a finished episode
     */
    struct EpisodeStats
    {
        double score = 0;
        int64_t steps = 0;
        double epsilon = 0;
    };

    /**
     * @brief Identity and mutable cycle state owned by a worker
     */
    struct WorkerState
    {
        int rank;
        torch::Device device;
        int64_t updateStep = 0;
        WorkerPhase phase = WorkerPhase::Idle;
        int64_t episodesFinished = 0;
        EpisodeStats lastEpisode;
    };

    /**
     * @brief Abstract distributed data-collection worker
     *
     * A worker drives one environment, converts its transitions into
     * training-ready experience and hands `(buffer, priorities)` pairs to an
     * ExperienceSink. Parameter sets published by the learner are pulled from a
     * ParameterSource and applied between action selections.
     *
     * Concrete workers implement the network and communication setup together
     * with the operations of one cycle; the cycle itself is driven by runCycle().
     * Each worker exclusively owns its buffer, n-step window, exploration state
     * and network copy, and runs strictly sequentially.
     *
     * Seeding is derived from the rank: a std::mt19937 seeded with the rank draws
     * one integer in [0, 999] that seeds the environment.
     */
    class Worker
    {
    private:
        std::atomic<bool> stopRequested;

    protected:
        WorkerState state;
        WorkerConfig config;
        std::shared_ptr<Environment> env;
        unsigned int envSeed;
        std::shared_ptr<ExperienceSink> experienceSink;
        std::shared_ptr<ParameterSource> parameterSource;

        /**
         * @brief Converts a raw observation to a float tensor on `device`
         */
        static torch::Tensor preprocessState(const torch::Tensor &state, torch::Device device);

        /**
         * @brief Copies `newParameters` into `network` in place
         */
        void synchronizeNetwork(torch::nn::Module &network, const std::vector<torch::Tensor> &newParameters);

        /**
         * @brief Applies the newest parameter set of the source, if any
         *
         * @return true when a parameter set was applied
         */
        bool pollParameters();

        void recordEpisode(double score, int64_t steps, double epsilon);

        void setPhase(WorkerPhase phase);

        /**
         * @brief Runs one Idle -> Collecting -> Emitting -> Idle cycle
         *
         * The buffer returned by collectData() is frozen, prioritized and emitted.
         * When a stop is requested during collection the partial buffer is
         * discarded and nothing is emitted. The parameter source is polled after
         * every `workerUpdateInterval`-th emission.
         *
         * @return false when the cycle was cut short by a stop request
         */
        bool runCycle();

    public:
        /**
         * @brief Validates the configuration and seeds the environment
         *
         * @throws std::invalid_argument on an invalid config, negative rank or null environment
         */
        Worker(int rank, WorkerConfig config, std::shared_ptr<Environment> env, torch::Device device);

        virtual ~Worker() = default;

        Worker(const Worker &) = delete;
        Worker &operator=(const Worker &) = delete;

        virtual void initNetworks() = 0;

        virtual void initCommunication() = 0;

        /**
         * @brief Chooses the action for `state` and advances exploration
         *
         * One call is the smallest unit with respect to parameter content:
         * synchronization never happens inside it.
         */
        virtual torch::Tensor selectAction(const torch::Tensor &state) = 0;

        virtual StepResult step(const torch::Tensor &action) = 0;

        /**
         * @brief Fills a fresh local buffer with `localBufferMaxSize` entries
         */
        virtual LocalBuffer collectData() = 0;

        virtual std::vector<float> computePriorities(const TransitionBatch &batch) = 0;

        virtual void synchronize(const std::vector<torch::Tensor> &newParameters) = 0;

        /**
         * @brief Repeats the collection cycle until stopped or maxUpdateStep is reached
         */
        virtual void run() = 0;

        /**
         * @brief Asks run() to return at the next phase boundary
         *
         * Safe to call from another thread.
         */
        void requestStop();

        bool isStopRequested() const;

        inline int getRank() const
        {
            return state.rank;
        }

        inline WorkerPhase getPhase() const
        {
            return state.phase;
        }

        inline int64_t getUpdateStep() const
        {
            return state.updateStep;
        }

        inline unsigned int getEnvironmentSeed() const
        {
            return envSeed;
        }

        inline int64_t episodesFinished() const
        {
            return state.episodesFinished;
        }

        inline const EpisodeStats &lastEpisodeStats() const
        {
            return state.lastEpisode;
        }

        inline const WorkerConfig &getConfig() const
        {
            return config;
        }

        inline torch::Device getDevice() const
        {
            return state.device;
        }
    };
}

#endif //APEXACTORRL_WORKER_HPP
