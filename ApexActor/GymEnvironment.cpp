#include<map>
#include<numeric>
#include<stdexcept>
#include<thread>

#include<spdlog/spdlog.h>
#include<fmt/ranges.h>
#include<doctest/doctest.h>

#include"GymEnvironment.hpp"

namespace WorkerClient
{
    GymEnvironment::GymEnvironment(std::unique_ptr<Communicator> communicator, const std::string &envName) :
    communicator(std::move(communicator)),
    sampler(0)
    {
        auto makeParams = std::make_shared<makeParam>();
        makeParams->envName = envName;
        this->communicator->sendRequest(Request<makeParam>("make", makeParams));
        auto makeResponse = this->communicator->getResponse<MakeResponse>();
        spdlog::info(makeResponse->result);

        this->communicator->sendRequest(Request<infoParam>("info", std::make_shared<infoParam>()));
        auto envInfo = this->communicator->getResponse<InfoResponse>();
        if (envInfo->actionSpaceType != "Discrete" || envInfo->actionSpaceShape.size() != 1)
        {
            throw std::runtime_error("Environment " + envName + " does not have a Discrete action space");
        }
        actionSpace = ApexActor::ActionSpace{envInfo->actionSpaceType, envInfo->actionSpaceShape};
        observationSpace = ApexActor::ObservationSpace{envInfo->observationSpaceType, envInfo->observationSpaceShape};
        spdlog::info("Action space: {} - [{}]", actionSpace.type, fmt::join(actionSpace.shape, ", "));
        spdlog::info("Observation space: {} - [{}]", observationSpace.type, fmt::join(observationSpace.shape, ", "));
    }

    torch::Tensor GymEnvironment::toObservation(const std::vector<float> &observation) const
    {
        const auto expected = std::accumulate(observationSpace.shape.begin(), observationSpace.shape.end(),
            int64_t{1}, std::multiplies<int64_t>());
        if (static_cast<int64_t>(observation.size()) != expected)
        {
            throw std::runtime_error("Gym server sent " + std::to_string(observation.size())
                + " observation values, expected " + std::to_string(expected));
        }
        return torch::tensor(observation).reshape(observationSpace.shape);
    }

    torch::Tensor GymEnvironment::reset()
    {
        communicator->sendRequest(Request<resetParam>("reset", std::make_shared<resetParam>()));
        return toObservation(communicator->getResponse<ResetResponse>()->observation);
    }

    ApexActor::StepResult GymEnvironment::step(const torch::Tensor &action)
    {
        auto stepParams = std::make_shared<stepParam>();
        stepParams->action = action.item<int64_t>();
        stepParams->render = renderNextStep;
        renderNextStep = false;
        communicator->sendRequest(Request<stepParam>("step", stepParams));

        auto stepResponse = communicator->getResponse<StepResponse>();
        ApexActor::StepResult result;
        result.nextState = toObservation(stepResponse->observation);
        result.reward = stepResponse->reward;
        result.done = stepResponse->done;
        return result;
    }

    void GymEnvironment::seed(unsigned int seed)
    {
        auto seedParams = std::make_shared<seedParam>();
        seedParams->seed = seed;
        communicator->sendRequest(Request<seedParam>("seed", seedParams));
        auto seedResponse = communicator->getResponse<MakeResponse>();
        spdlog::debug("Seeded gym environment with {}: {}", seed, seedResponse->result);
        sampler.seed(seed);
    }

    torch::Tensor GymEnvironment::sampleAction()
    {
        std::uniform_int_distribution<int64_t> distribution(0, actionSpace.shape[0] - 1);
        return torch::tensor(distribution(sampler));
    }

    ApexActor::ActionSpace GymEnvironment::getActionSpace() const
    {
        return actionSpace;
    }

    ApexActor::ObservationSpace GymEnvironment::getObservationSpace() const
    {
        return observationSpace;
    }

    void GymEnvironment::render()
    {
        renderNextStep = true;
    }

    namespace
    {
        /**
         * @brief Gym server double answering a fixed number of requests
         *
         * Serves a 2-action environment with 3-value observations whose episodes
         * last two steps. Every received method name is recorded.
         */
        class FakeGymServer
        {
        private:
            zmq::socket_t socket;
            std::thread worker;

            void reply(const std::string &method, const msgpack::object &param)
            {
                if (method == "make" || method == "seed")
                {
                    socket.send(packMessage(MakeResponse{"ok"}), zmq::send_flags::none);
                }
                else if (method == "info")
                {
                    socket.send(packMessage(InfoResponse{infoActionType, {2}, "Box", {3}}), zmq::send_flags::none);
                }
                else if (method == "reset")
                {
                    t = 0;
                    socket.send(packMessage(ResetResponse{{0.0f, 0.0f, 0.0f}}), zmq::send_flags::none);
                }
                else
                {
                    const auto params = param.as<std::map<std::string, msgpack::object>>();
                    lastAction = params.at("action").as<int64_t>();
                    rendered.push_back(params.at("render").as<bool>());
                    ++t;
                    const auto value = static_cast<float>(t);
                    StepResponse response{{value, value, value}, static_cast<float>(lastAction), t >= 2};
                    socket.send(packMessage(response), zmq::send_flags::none);
                }
            }

        public:
            std::vector<std::string> methods;
            std::vector<bool> rendered;
            std::string infoActionType = "Discrete";
            int64_t lastAction = -1;
            int t = 0;

            FakeGymServer(zmq::context_t &context, const std::string &url) :
            socket(context, zmq::socket_type::pair)
            {
                socket.set(zmq::sockopt::linger, 0);
                socket.bind(url);
            }

            void serve(int requests)
            {
                worker = std::thread([this, requests]()
                {
                    for (int i = 0; i < requests; ++i)
                    {
                        zmq::message_t message;
                        if (!socket.recv(message, zmq::recv_flags::none))
                        {
                            return;
                        }
                        auto handle = msgpack::unpack(static_cast<const char *>(message.data()), message.size());
                        const auto request = handle.get().as<std::map<std::string, msgpack::object>>();
                        const auto method = request.at("method").as<std::string>();
                        methods.push_back(method);
                        reply(method, request.at("param"));
                    }
                });
            }

            void join()
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }

            ~FakeGymServer()
            {
                join();
            }
        };
    }

    TEST_CASE("GymEnvironment")
    {
        auto context = std::make_shared<zmq::context_t>(1);
        FakeGymServer server(*context, "inproc://gym");

        SUBCASE("Talks the make/info/seed/reset/step protocol")
        {
            server.serve(5);
            GymEnvironment env(std::make_unique<Communicator>("inproc://gym", context), "Scripted-v0");

            CHECK(env.getActionSpace().type == "Discrete");
            CHECK(env.getActionSpace().shape == std::vector<int64_t>{2});
            CHECK(env.getObservationSpace().shape == std::vector<int64_t>{3});

            env.seed(11);
            auto observation = env.reset();
            CHECK(observation.sizes() == torch::IntArrayRef({3}));

            env.render();
            auto result = env.step(torch::tensor(int64_t{1}));
            server.join();

            CHECK(server.methods == std::vector<std::string>{"make", "info", "seed", "reset", "step"});
            CHECK(server.lastAction == 1);
            REQUIRE(server.rendered.size() == 1);
            CHECK(server.rendered[0]);
            CHECK(result.reward == doctest::Approx(1.0));
            CHECK_FALSE(result.done);
            CHECK(result.nextState[0].item<float>() == doctest::Approx(1.0f));
        }

        SUBCASE("Rejects servers without a Discrete action space")
        {
            server.infoActionType = "Box";
            server.serve(2);
            CHECK_THROWS_AS(GymEnvironment(std::make_unique<Communicator>("inproc://gym", context), "Box-v0"),
                std::runtime_error);
        }

        SUBCASE("A silent server is a timeout error")
        {
            server.serve(0);
            CHECK_THROWS_AS(GymEnvironment(std::make_unique<Communicator>("inproc://gym", context, 50), "Silent-v0"),
                std::runtime_error);
        }

        SUBCASE("Sampled actions stay inside the action space")
        {
            server.serve(3);
            GymEnvironment env(std::make_unique<Communicator>("inproc://gym", context), "Scripted-v0");
            env.seed(5);
            for (int i = 0; i < 50; ++i)
            {
                const auto action = env.sampleAction().item<int64_t>();
                CHECK(action >= 0);
                CHECK(action < 2);
            }
        }
    }
}
