/**
 * @file Worker.cpp
 * @brief Seeding, synchronization and the collection cycle shared by all workers
 */

#include<random>
#include<stdexcept>

#include<torch/torch.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Worker/Worker.hpp"
#include"../../include/ParameterSynchronizer.hpp"
#ifndef DOCTEST_CONFIG_DISABLE
#include"../../test/ScriptedEnvironment.hpp"
#endif

namespace ApexActor
{
    const char *toString(WorkerPhase phase)
    {
        switch (phase)
        {
            case WorkerPhase::Idle:
                return "Idle";
            case WorkerPhase::Collecting:
                return "Collecting";
            case WorkerPhase::Emitting:
                return "Emitting";
        }
        return "Unknown";
    }

    /**
     * @brief Validates the configuration and seeds the environment from the rank
     *
     * The rank seeds a std::mt19937 that draws the environment seed from
     * [0, 999]; repeated runs with the same rank assignment see the same
     * environment randomness.
     */
    Worker::Worker(int rank, WorkerConfig config, std::shared_ptr<Environment> env, torch::Device device) :
    stopRequested(false),
    state{rank, device},
    config(std::move(config)),
    env(std::move(env)),
    envSeed(0)
    {
        this->config.validate();
        if (rank < 0)
        {
            throw std::invalid_argument("Worker rank must be non-negative, got " + std::to_string(rank));
        }
        if (!this->env)
        {
            throw std::invalid_argument("Worker needs an environment");
        }

        std::mt19937 seeder(static_cast<unsigned int>(rank));
        std::uniform_int_distribution<unsigned int> seedDistribution(0, 999);
        envSeed = seedDistribution(seeder);
        this->env->seed(envSeed);

        spdlog::info("Worker {} seeded environment with {} on {}", rank, envSeed, device.str());
    }

    torch::Tensor Worker::preprocessState(const torch::Tensor &state, torch::Device device)
    {
        return state.to(device, torch::kFloat);
    }

    void Worker::synchronizeNetwork(torch::nn::Module &network, const std::vector<torch::Tensor> &newParameters)
    {
        synchronizeParameters(network, newParameters);
        spdlog::info("Worker {} synchronized {} parameter tensors", state.rank, newParameters.size());
    }

    bool Worker::pollParameters()
    {
        if (!parameterSource)
        {
            return false;
        }
        auto newParameters = parameterSource->poll();
        if (!newParameters)
        {
            return false;
        }
        synchronize(*newParameters);
        return true;
    }

    void Worker::recordEpisode(double score, int64_t steps, double epsilon)
    {
        state.lastEpisode = EpisodeStats{score, steps, epsilon};
        ++state.episodesFinished;
        spdlog::info("Worker {} episode {} score: {} steps: {} epsilon: {:.4f}",
            state.rank, state.episodesFinished, score, steps, epsilon);
    }

    void Worker::setPhase(WorkerPhase phase)
    {
        spdlog::debug("Worker {} {} -> {}", state.rank, toString(state.phase), toString(phase));
        state.phase = phase;
    }

    bool Worker::runCycle()
    {
        if (isStopRequested())
        {
            return false;
        }
        if (!experienceSink)
        {
            throw std::logic_error("Worker " + std::to_string(state.rank) + " has no experience sink");
        }

        setPhase(WorkerPhase::Collecting);
        LocalBuffer buffer = collectData();
        if (isStopRequested())
        {
            // A partially filled buffer is dropped on shutdown
            setPhase(WorkerPhase::Idle);
            return false;
        }

        setPhase(WorkerPhase::Emitting);
        ExperienceBatch batch{state.rank, buffer.freeze(), {}};
        batch.priorities = computePriorities(batch.transitions);
        experienceSink->emit(batch);
        ++state.updateStep;
        spdlog::info("Worker {} emitted {} transitions (cycle {})", state.rank, batch.transitions.size(), state.updateStep);

        setPhase(WorkerPhase::Idle);
        if (state.updateStep % config.workerUpdateInterval == 0)
        {
            pollParameters();
        }
        return true;
    }

    void Worker::requestStop()
    {
        stopRequested.store(true);
    }

    bool Worker::isStopRequested() const
    {
        return stopRequested.load();
    }

#ifndef DOCTEST_CONFIG_DISABLE
    namespace
    {
        /**
         * @brief Worker that emits one constant transition per cycle
         */
        class ConstantWorker : public Worker
        {
        public:
            std::vector<WorkerPhase> phasesSeenByCollect;
            std::vector<std::vector<torch::Tensor>> received;
            bool stopWhileCollecting = false;

            ConstantWorker(int rank, WorkerConfig config, std::shared_ptr<Environment> env,
                std::shared_ptr<ExperienceSink> sink, std::shared_ptr<ParameterSource> source) :
            Worker(rank, std::move(config), std::move(env), torch::kCPU)
            {
                experienceSink = std::move(sink);
                parameterSource = std::move(source);
            }

            void initNetworks() override {}

            void initCommunication() override {}

            torch::Tensor selectAction(const torch::Tensor &) override
            {
                return torch::tensor(int64_t{0});
            }

            StepResult step(const torch::Tensor &action) override
            {
                return env->step(action);
            }

            LocalBuffer collectData() override
            {
                phasesSeenByCollect.push_back(getPhase());
                LocalBuffer buffer;
                buffer.push(Transition(torch::zeros({4}), torch::tensor(int64_t{0}), 1.0, torch::zeros({4}), false));
                if (stopWhileCollecting)
                {
                    requestStop();
                }
                return buffer;
            }

            std::vector<float> computePriorities(const TransitionBatch &batch) override
            {
                return std::vector<float>(batch.size(), 1.0f);
            }

            void synchronize(const std::vector<torch::Tensor> &newParameters) override
            {
                received.push_back(newParameters);
            }

            void run() override
            {
                while (getUpdateStep() < config.maxUpdateStep && runCycle())
                {
                }
            }
        };
    }

    TEST_CASE("Worker")
    {
        auto env = std::make_shared<ScriptedEnvironment>(5);
        auto sink = std::make_shared<RecordingSink>();
        auto source = std::make_shared<QueuedParameterSource>();
        WorkerConfig config;
        config.maxUpdateStep = 4;
        config.workerUpdateInterval = 2;

        SUBCASE("Environment seed is a single rank-seeded draw in [0, 999]")
        {
            ConstantWorker worker(7, config, env, sink, source);
            std::mt19937 seeder(7);
            std::uniform_int_distribution<unsigned int> distribution(0, 999);
            CHECK(worker.getEnvironmentSeed() == distribution(seeder));
            CHECK(env->lastSeed == worker.getEnvironmentSeed());
            CHECK(worker.getEnvironmentSeed() <= 999);
        }

        SUBCASE("Same rank gives the same environment seed")
        {
            ConstantWorker first(3, config, env, sink, source);
            auto other = std::make_shared<ScriptedEnvironment>(5);
            ConstantWorker second(3, config, other, sink, source);
            CHECK(first.getEnvironmentSeed() == second.getEnvironmentSeed());
        }

        SUBCASE("Invalid construction is rejected")
        {
            CHECK_THROWS_AS(ConstantWorker(-1, config, env, sink, source), std::invalid_argument);
            CHECK_THROWS_AS(ConstantWorker(0, config, nullptr, sink, source), std::invalid_argument);
            config.perEps = 0;
            CHECK_THROWS_AS(ConstantWorker(0, config, env, sink, source), std::invalid_argument);
        }

        SUBCASE("run() cycles Collecting -> Emitting -> Idle until maxUpdateStep")
        {
            ConstantWorker worker(0, config, env, sink, source);
            worker.run();

            CHECK(worker.getUpdateStep() == 4);
            CHECK(sink->batches.size() == 4);
            CHECK(worker.getPhase() == WorkerPhase::Idle);
            for (const auto phase : worker.phasesSeenByCollect)
            {
                CHECK(phase == WorkerPhase::Collecting);
            }
            for (const auto &batch : sink->batches)
            {
                CHECK(batch.rank == 0);
                CHECK(batch.priorities.size() == static_cast<std::size_t>(batch.transitions.size()));
            }
        }

        SUBCASE("Parameters are polled every workerUpdateInterval emissions")
        {
            source->queue.push_back({torch::ones({2})});
            source->queue.push_back({torch::ones({3})});
            sink->onEmit = [&sink, &source]()
            {
                if (sink->batches.size() == 3)
                {
                    source->queue.push_back({torch::ones({4})});
                }
            };
            ConstantWorker worker(0, config, env, sink, source);
            worker.run();

            CHECK(source->polls == 2);
            // Only the newest set queued before each poll is applied
            REQUIRE(worker.received.size() == 2);
            CHECK(worker.received[0][0].size(0) == 3);
            CHECK(worker.received[1][0].size(0) == 4);
            CHECK(source->queue.empty());
        }

        SUBCASE("A stop during collection discards the buffer")
        {
            ConstantWorker worker(0, config, env, sink, source);
            worker.stopWhileCollecting = true;
            worker.run();

            CHECK(sink->batches.empty());
            CHECK(worker.getUpdateStep() == 0);
            CHECK(worker.getPhase() == WorkerPhase::Idle);
        }

        SUBCASE("A stop requested between cycles ends run()")
        {
            ConstantWorker worker(0, config, env, sink, source);
            sink->onEmit = [&worker]() { worker.requestStop(); };
            worker.run();

            CHECK(sink->batches.size() == 1);
            CHECK(worker.getUpdateStep() == 1);
        }
    }
#endif
}
