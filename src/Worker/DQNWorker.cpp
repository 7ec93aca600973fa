/**
 * @file DQNWorker.cpp
 * @brief Epsilon-greedy DQN data-collection worker
 *
 * Drives a single discrete-action environment, aggregates transitions into
 * (optionally n-step) experience, computes initial priorities with the DQN loss
 * and emits fixed-size batches to the replay side.
 */

#include<filesystem>
#include<numeric>
#include<stdexcept>

#include<torch/torch.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Worker/DQNWorker.hpp"
#include"../../include/NStepWindow.hpp"
#include"../../include/ParameterSynchronizer.hpp"
#ifndef DOCTEST_CONFIG_DISABLE
#include"../../test/ScriptedEnvironment.hpp"
#endif

namespace ApexActor
{
    namespace
    {
        int64_t flattenedSize(const std::vector<int64_t> &shape)
        {
            return std::accumulate(shape.begin(), shape.end(), int64_t{1}, std::multiplies<int64_t>());
        }
    }

    DQNWorker::DQNWorker(int rank,
        const WorkerConfig &config,
        std::vector<int64_t> hiddenSizes,
        std::shared_ptr<Environment> env,
        std::vector<torch::Tensor> initialParameters,
        std::shared_ptr<ExperienceSink> experienceSink,
        std::shared_ptr<ParameterSource> parameterSource,
        torch::Device device) :
    Worker(rank, config, std::move(env), device),
    dqn(nullptr),
    initialParameters(std::move(initialParameters)),
    exploration(config.maxEpsilon, config.minEpsilon, config.epsilonDecay, static_cast<unsigned int>(rank))
    {
        const auto actionSpace = this->env->getActionSpace();
        if (actionSpace.type != "Discrete" || actionSpace.shape.size() != 1)
        {
            throw std::invalid_argument("DQNWorker needs a Discrete action space, got " + actionSpace.type);
        }

        headConfig.stateSize = this->env->getObservationSpace().shape;
        headConfig.outputSize = actionSpace.shape[0];
        headConfig.hiddenSizes = std::move(hiddenSizes);

        this->experienceSink = std::move(experienceSink);
        this->parameterSource = std::move(parameterSource);

        initNetworks();
        priorityEstimator = std::make_unique<PriorityEstimator>(buildLoss(this->config.lossType),
            this->config.gamma,
            this->config.perEps,
            headConfig);
    }

    /**
     * @brief Builds the local Q-network and loads the learner's initial parameters
     */
    void DQNWorker::initNetworks()
    {
        dqn = Brain(flattenedSize(headConfig.stateSize), headConfig.outputSize, headConfig.hiddenSizes);
        dqn->to(state.device);
        dqn->eval();
        if (!initialParameters.empty())
        {
            synchronizeParameters(*dqn, initialParameters);
        }
    }

    void DQNWorker::initCommunication()
    {
        if (!experienceSink)
        {
            throw std::invalid_argument("DQNWorker " + std::to_string(state.rank) + " has no experience sink");
        }
        experienceSink->connect();
        if (parameterSource)
        {
            parameterSource->connect();
        }
    }

    /**
     * @brief Epsilon-greedy action selection followed by one decay step
     *
     * Exploration samples from the environment's action space; exploitation
     * takes the arg-max of the network's action values. Epsilon decays after
     * every call whichever branch was taken.
     */
    torch::Tensor DQNWorker::selectAction(const torch::Tensor &state)
    {
        torch::Tensor selectedAction;
        if (exploration.shouldExplore())
        {
            selectedAction = env->sampleAction();
        }
        else
        {
            torch::NoGradGuard noGrad;
            auto input = preprocessState(state, this->state.device).reshape({-1});
            selectedAction = dqn->forward(input).argmax().cpu();
        }
        exploration.decay();
        return selectedAction;
    }

    StepResult DQNWorker::step(const torch::Tensor &action)
    {
        return env->step(action);
    }

    /**
     * @brief Plays episodes until the local buffer holds localBufferMaxSize entries
     *
     * The buffer size is checked after every appended entry and collection ends
     * the moment it reaches the threshold, so every returned buffer holds exactly
     * localBufferMaxSize entries. The unfinished episode is abandoned.
     *
     * With nStep > 1 a sliding window is created for the cycle; it is not
     * cleared at episode boundaries. Parameter updates are picked up between
     * episodes. A stop request ends collection after the current step and the
     * partial buffer is returned for the caller to discard.
     */
    LocalBuffer DQNWorker::collectData()
    {
        LocalBuffer localBuffer;
        std::unique_ptr<NStepWindow> nStepWindow;
        if (config.nStep > 1)
        {
            nStepWindow = std::make_unique<NStepWindow>(config.nStep);
        }

        bool full = false;
        while (!full && !isStopRequested())
        {
            auto currentState = env->reset();
            bool done = false;
            double score = 0;
            int64_t numSteps = 0;

            while (!done && !full && !isStopRequested())
            {
                if (config.render)
                {
                    env->render();
                }
                ++numSteps;
                auto action = selectAction(currentState);
                auto result = step(action);
                Transition transition(currentState, action, result.reward, result.nextState, result.done);

                if (nStepWindow)
                {
                    nStepWindow->push(transition);
                    if (nStepWindow->isFull())
                    {
                        localBuffer.push(nStepWindow->fold(config.gamma));
                    }
                }
                else
                {
                    localBuffer.push(transition);
                }

                currentState = result.nextState;
                score += result.reward;
                done = result.done;
                full = localBuffer.size() >= config.localBufferMaxSize;
            }

            if (done)
            {
                recordEpisode(score, numSteps, exploration.getEpsilon());
                if (!full)
                {
                    pollParameters();
                }
            }
        }
        return localBuffer;
    }

    std::vector<float> DQNWorker::computePriorities(const TransitionBatch &batch)
    {
        return priorityEstimator->computePriorities(dqn, dqn, batch, state.device);
    }

    void DQNWorker::synchronize(const std::vector<torch::Tensor> &newParameters)
    {
        synchronizeNetwork(*dqn, newParameters);
    }

    void DQNWorker::run()
    {
        initCommunication();
        spdlog::info("Worker {} started, collecting {} transitions per cycle", state.rank, config.localBufferMaxSize);
        while (state.updateStep < config.maxUpdateStep && runCycle())
        {
        }
        spdlog::info("Worker {} finished after {} cycles", state.rank, state.updateStep);
    }

    void DQNWorker::loadParams(const std::string &path)
    {
        torch::load(dqn, path);
        dqn->to(state.device);
        spdlog::info("Worker {} loaded the model from {}", state.rank, path);
    }

#ifndef DOCTEST_CONFIG_DISABLE
    namespace
    {
        WorkerConfig testConfig()
        {
            WorkerConfig config;
            config.maxEpsilon = 1.0;
            config.minEpsilon = 0.01;
            config.epsilonDecay = 0.0001;
            config.localBufferMaxSize = 100;
            config.maxUpdateStep = 2;
            return config;
        }

        std::vector<torch::Tensor> initialBrainParameters()
        {
            torch::manual_seed(42);
            Brain reference(4, 3, std::vector<int64_t>{16});
            return snapshotParameters(*reference);
        }
    }

    TEST_CASE("DQNWorker")
    {
        auto config = testConfig();
        auto parameters = initialBrainParameters();

        SUBCASE("Non-discrete action spaces are rejected")
        {
            class BoxEnvironment : public ScriptedEnvironment
            {
            public:
                BoxEnvironment() : ScriptedEnvironment(5) {}

                ActionSpace getActionSpace() const override
                {
                    return ActionSpace{"Box", {2}};
                }
            };
            CHECK_THROWS_AS(DQNWorker(0, config, {16}, std::make_shared<BoxEnvironment>()), std::invalid_argument);
        }

        SUBCASE("Head config follows the environment")
        {
            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5));
            CHECK(worker.getHeadConfig().outputSize == 3);
            CHECK(worker.getHeadConfig().stateSize == std::vector<int64_t>{4});
        }

        SUBCASE("Initial parameters are loaded into the network")
        {
            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5), parameters);
            auto networkParameters = worker.getNetwork()->parameters();
            REQUIRE(networkParameters.size() == parameters.size());
            for (std::size_t i = 0; i < parameters.size(); ++i)
            {
                CHECK(torch::equal(networkParameters[i], parameters[i]));
            }
        }

        SUBCASE("Mismatching initial parameters are rejected")
        {
            parameters.pop_back();
            CHECK_THROWS_AS(DQNWorker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5), parameters),
                std::invalid_argument);
        }

        SUBCASE("Epsilon is non-increasing and bounded below")
        {
            config.epsilonDecay = 0.01;
            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5), parameters);
            auto currentState = torch::zeros({4});
            double previous = worker.getEpsilon();
            for (int i = 0; i < 300; ++i)
            {
                worker.selectAction(currentState);
                CHECK(worker.getEpsilon() <= previous);
                CHECK(worker.getEpsilon() >= config.minEpsilon);
                previous = worker.getEpsilon();
            }
            CHECK(worker.getEpsilon() == doctest::Approx(config.minEpsilon));
        }

        SUBCASE("Greedy selection takes the arg-max action")
        {
            config.maxEpsilon = 0;
            config.minEpsilon = 0;
            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5), parameters);
            auto input = torch::tensor({1.0f, 0.5f, 1.0f, -1.0f});
            torch::NoGradGuard guard;
            auto expected = worker.getNetwork()->forward(input).argmax().item<int64_t>();
            CHECK(worker.selectAction(input).item<int64_t>() == expected);
        }

        SUBCASE("collectData() returns exactly localBufferMaxSize entries")
        {
            // Episodes of 7 steps do not divide 100: the 15th episode is cut short
            auto env = std::make_shared<ScriptedEnvironment>(7);
            DQNWorker worker(0, config, {16}, env, parameters);
            auto buffer = worker.collectData();

            CHECK(buffer.isLockStep());
            CHECK(buffer.size() == 100);
            CHECK(buffer.getStates().size() == 100);
            CHECK(buffer.getActions().size() == 100);
            CHECK(buffer.getRewards().size() == 100);
            CHECK(buffer.getNextStates().size() == 100);
            CHECK(buffer.getDones().size() == 100);
            CHECK(env->steps == 100);
            CHECK(env->resets == 15);
            CHECK(worker.episodesFinished() == 14);
            CHECK(worker.lastEpisodeStats().steps == 7);
        }

        SUBCASE("Transitions are recorded in collection order across episodes")
        {
            config.localBufferMaxSize = 12;
            auto env = std::make_shared<ScriptedEnvironment>(5);
            DQNWorker worker(0, config, {16}, env, parameters);
            auto buffer = worker.collectData();

            const auto &states = buffer.getStates();
            const auto &nextStates = buffer.getNextStates();
            const auto &dones = buffer.getDones();
            for (std::size_t i = 0; i < buffer.size(); ++i)
            {
                const auto t = static_cast<float>(i % 5);
                CHECK(states[i][0].item<float>() == doctest::Approx(t));
                CHECK(nextStates[i][0].item<float>() == doctest::Approx(t + 1));
                CHECK(dones[i] == (i % 5 == 4));
            }
        }

        SUBCASE("N-step collection folds sliding windows")
        {
            config.nStep = 3;
            config.gamma = 0.5;
            config.localBufferMaxSize = 10;
            config.maxEpsilon = 0;
            config.minEpsilon = 0;
            auto env = std::make_shared<ScriptedEnvironment>(100);
            DQNWorker worker(0, config, {16}, env, parameters);
            auto buffer = worker.collectData();

            REQUIRE(buffer.size() == 10);
            // The first fold needs 3 steps, each later step adds one entry
            CHECK(env->steps == 12);

            const auto &states = buffer.getStates();
            const auto &actions = buffer.getActions();
            const auto &rewards = buffer.getRewards();
            const auto &nextStates = buffer.getNextStates();
            for (std::size_t i = 0; i < buffer.size(); ++i)
            {
                // Entry i starts at step i and ends 3 steps later
                CHECK(states[i][0].item<float>() == doctest::Approx(static_cast<double>(i)));
                CHECK(nextStates[i][0].item<float>() == doctest::Approx(static_cast<double>(i + 3)));
            }

            // Entry i folds the rewards a_j + 0.1 (j + 1) of steps i, i + 1, i + 2
            for (std::size_t i = 0; i + 2 < buffer.size(); ++i)
            {
                double expected = 0;
                double discount = 1;
                for (std::size_t j = i; j < i + 3; ++j)
                {
                    const auto a = static_cast<double>(actions[j].item<int64_t>());
                    expected += discount * (a + 0.1 * static_cast<double>(j + 1));
                    discount *= 0.5;
                }
                CHECK(rewards[i] == doctest::Approx(expected));
            }
        }

        SUBCASE("N-step done flag is the OR of the window")
        {
            config.nStep = 2;
            config.localBufferMaxSize = 6;
            auto env = std::make_shared<ScriptedEnvironment>(3);
            DQNWorker worker(0, config, {16}, env, parameters);
            auto buffer = worker.collectData();

            // Steps: t=1,2,3(done),1,2,3(done),1 ; windows end at every step from the second on
            const auto &dones = buffer.getDones();
            REQUIRE(buffer.size() == 6);
            CHECK_FALSE(dones[0]);
            CHECK(dones[1]);
            CHECK(dones[2]);
            CHECK_FALSE(dones[3]);
            CHECK(dones[4]);
            CHECK(dones[5]);
        }

        SUBCASE("Determinism: same rank and parameters give identical buffers")
        {
            auto firstEnv = std::make_shared<ScriptedEnvironment>(9);
            auto secondEnv = std::make_shared<ScriptedEnvironment>(9);
            DQNWorker first(7, config, {16}, firstEnv, parameters);
            DQNWorker second(7, config, {16}, secondEnv, parameters);

            auto firstBatch = first.collectData().freeze();
            auto secondBatch = second.collectData().freeze();

            CHECK(torch::equal(firstBatch.states, secondBatch.states));
            CHECK(torch::equal(firstBatch.actions, secondBatch.actions));
            CHECK(torch::equal(firstBatch.rewards, secondBatch.rewards));
            CHECK(torch::equal(firstBatch.nextStates, secondBatch.nextStates));
            CHECK(torch::equal(firstBatch.dones, secondBatch.dones));
            CHECK(first.getEpsilon() == second.getEpsilon());
        }

        SUBCASE("Different ranks explore differently")
        {
            auto firstEnv = std::make_shared<ScriptedEnvironment>(9);
            auto secondEnv = std::make_shared<ScriptedEnvironment>(9);
            DQNWorker first(1, config, {16}, firstEnv, parameters);
            DQNWorker second(2, config, {16}, secondEnv, parameters);

            auto firstBatch = first.collectData().freeze();
            auto secondBatch = second.collectData().freeze();
            CHECK_FALSE(torch::equal(firstBatch.actions, secondBatch.actions));
        }

        SUBCASE("Priorities are positive and reproducible")
        {
            config.localBufferMaxSize = 20;
            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5), parameters);
            auto batch = worker.collectData().freeze();

            auto first = worker.computePriorities(batch);
            auto second = worker.computePriorities(batch);
            REQUIRE(first.size() == 20);
            CHECK(first == second);
            for (const auto priority : first)
            {
                CHECK(priority > 0);
            }
        }

        SUBCASE("synchronize() updates the network seen through held references")
        {
            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5), parameters);
            auto heldNetwork = worker.getNetwork();

            torch::manual_seed(1);
            Brain learner(4, 3, std::vector<int64_t>{16});
            auto newParameters = snapshotParameters(*learner);
            worker.synchronize(newParameters);

            auto heldParameters = heldNetwork->parameters();
            for (std::size_t i = 0; i < newParameters.size(); ++i)
            {
                CHECK(torch::equal(heldParameters[i], newParameters[i]));
            }
        }

        SUBCASE("loadParams() restores a saved network in place")
        {
            torch::manual_seed(9);
            Brain saved(4, 3, std::vector<int64_t>{16});
            const auto path = (std::filesystem::temp_directory_path() / "apexactor_dqnworker_brain.pt").string();
            torch::save(saved, path);

            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5), parameters);
            auto heldNetwork = worker.getNetwork();
            worker.loadParams(path);
            std::filesystem::remove(path);

            auto savedParameters = saved->parameters();
            auto loadedParameters = worker.getNetwork()->parameters();
            auto heldParameters = heldNetwork->parameters();
            REQUIRE(loadedParameters.size() == savedParameters.size());
            for (std::size_t i = 0; i < savedParameters.size(); ++i)
            {
                CHECK(torch::equal(loadedParameters[i], savedParameters[i]));
                CHECK(torch::equal(heldParameters[i], savedParameters[i]));
            }
        }

        SUBCASE("loadParams() fails on a missing checkpoint")
        {
            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5), parameters);
            CHECK_THROWS(worker.loadParams("/nonexistent/apexactor_brain.pt"));
        }

        SUBCASE("Rendering is requested before every action when enabled")
        {
            config.render = true;
            config.localBufferMaxSize = 10;
            auto env = std::make_shared<ScriptedEnvironment>(4);
            DQNWorker worker(0, config, {16}, env, parameters);
            worker.collectData();
            CHECK(env->renders == 10);
        }

        SUBCASE("Environment failures propagate out of collectData()")
        {
            auto env = std::make_shared<ScriptedEnvironment>(5);
            env->failAtStep = 12;
            DQNWorker worker(0, config, {16}, env, parameters);
            CHECK_THROWS_AS(worker.collectData(), std::runtime_error);
        }

        SUBCASE("run() needs an experience sink")
        {
            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5), parameters);
            CHECK_THROWS_AS(worker.run(), std::invalid_argument);
        }

        SUBCASE("run() emits maxUpdateStep full batches")
        {
            auto sink = std::make_shared<RecordingSink>();
            auto source = std::make_shared<QueuedParameterSource>();
            DQNWorker worker(5, config, {16}, std::make_shared<ScriptedEnvironment>(8), parameters, sink, source);
            worker.run();

            CHECK(sink->connects == 1);
            REQUIRE(sink->batches.size() == 2);
            for (const auto &batch : sink->batches)
            {
                CHECK(batch.rank == 5);
                CHECK(batch.transitions.size() == 100);
                CHECK(batch.priorities.size() == 100);
            }
            CHECK(worker.getUpdateStep() == 2);
            CHECK(worker.getPhase() == WorkerPhase::Idle);
            CHECK(source->polls > 0);
        }

        SUBCASE("Parameters published mid-cycle are applied between episodes")
        {
            auto sink = std::make_shared<RecordingSink>();
            auto source = std::make_shared<QueuedParameterSource>();
            torch::manual_seed(3);
            Brain learner(4, 3, std::vector<int64_t>{16});
            auto newParameters = snapshotParameters(*learner);
            source->queue.push_back(newParameters);

            config.maxUpdateStep = 1;
            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(10), parameters, sink, source);
            worker.run();

            CHECK(source->queue.empty());
            auto networkParameters = worker.getNetwork()->parameters();
            for (std::size_t i = 0; i < newParameters.size(); ++i)
            {
                CHECK(torch::equal(networkParameters[i], newParameters[i]));
            }
        }

        SUBCASE("requestStop() ends collection with a partial buffer")
        {
            auto sink = std::make_shared<RecordingSink>();
            DQNWorker worker(0, config, {16}, std::make_shared<ScriptedEnvironment>(5), parameters, sink);
            worker.requestStop();
            worker.run();

            CHECK(sink->batches.empty());
            CHECK(worker.getUpdateStep() == 0);
        }
    }
#endif
}
