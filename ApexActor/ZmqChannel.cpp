#include<chrono>
#include<numeric>
#include<stdexcept>
#include<thread>

#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"ZmqChannel.hpp"
#include"Communication.hpp"

namespace WorkerClient
{
    namespace
    {
        template<typename T>
        std::vector<T> flatValues(const torch::Tensor &tensor, torch::ScalarType type)
        {
            auto flat = tensor.detach().to(torch::kCPU, type).contiguous();
            return std::vector<T>(flat.data_ptr<T>(), flat.data_ptr<T>() + flat.numel());
        }

        std::vector<int64_t> trailingShape(const torch::Tensor &tensor)
        {
            return std::vector<int64_t>(tensor.sizes().begin() + 1, tensor.sizes().end());
        }

        int64_t numel(const std::vector<int64_t> &shape)
        {
            return std::accumulate(shape.begin(), shape.end(), int64_t{1}, std::multiplies<int64_t>());
        }

        std::vector<int64_t> withLeading(int64_t leading, const std::vector<int64_t> &shape)
        {
            std::vector<int64_t> result{leading};
            result.insert(result.end(), shape.begin(), shape.end());
            return result;
        }
    }

    ExperienceMessage toExperienceMessage(const ApexActor::ExperienceBatch &batch)
    {
        const auto &transitions = batch.transitions;

        ExperienceMessage message;
        message.rank = batch.rank;
        message.stateShape = trailingShape(transitions.states);
        message.actionShape = trailingShape(transitions.actions);
        message.states = flatValues<float>(transitions.states, torch::kFloat);
        message.actions = flatValues<int64_t>(transitions.actions, torch::kLong);
        message.rewards = flatValues<float>(transitions.rewards, torch::kFloat);
        message.nextStates = flatValues<float>(transitions.nextStates, torch::kFloat);
        message.dones = flatValues<float>(transitions.dones, torch::kFloat);
        message.priorities = batch.priorities;
        return message;
    }

    ApexActor::ExperienceBatch fromExperienceMessage(const ExperienceMessage &message)
    {
        const auto size = static_cast<int64_t>(message.priorities.size());
        const auto stateSize = numel(message.stateShape);
        const auto actionSize = numel(message.actionShape);
        if (static_cast<int64_t>(message.states.size()) != size * stateSize ||
            static_cast<int64_t>(message.nextStates.size()) != size * stateSize ||
            static_cast<int64_t>(message.actions.size()) != size * actionSize ||
            static_cast<int64_t>(message.rewards.size()) != size ||
            static_cast<int64_t>(message.dones.size()) != size)
        {
            throw std::invalid_argument("Experience message fields do not describe "
                + std::to_string(size) + " entries");
        }

        ApexActor::ExperienceBatch batch;
        batch.rank = message.rank;
        batch.transitions.states = torch::tensor(message.states).reshape(withLeading(size, message.stateShape));
        batch.transitions.actions = torch::tensor(message.actions).reshape(withLeading(size, message.actionShape));
        batch.transitions.rewards = torch::tensor(message.rewards);
        batch.transitions.nextStates = torch::tensor(message.nextStates).reshape(withLeading(size, message.stateShape));
        batch.transitions.dones = torch::tensor(message.dones);
        batch.priorities = message.priorities;
        return batch;
    }

    ParameterMessage toParameterMessage(const std::vector<torch::Tensor> &parameters, int64_t version)
    {
        ParameterMessage message;
        message.version = version;
        for (const auto &parameter : parameters)
        {
            message.shapes.emplace_back(parameter.sizes().begin(), parameter.sizes().end());
            message.values.push_back(flatValues<float>(parameter, torch::kFloat));
        }
        return message;
    }

    std::vector<torch::Tensor> toParameters(const ParameterMessage &message)
    {
        if (message.shapes.size() != message.values.size())
        {
            throw std::invalid_argument("Parameter message has " + std::to_string(message.shapes.size())
                + " shapes but " + std::to_string(message.values.size()) + " value lists");
        }

        std::vector<torch::Tensor> parameters;
        parameters.reserve(message.shapes.size());
        for (std::size_t i = 0; i < message.shapes.size(); ++i)
        {
            if (static_cast<int64_t>(message.values[i].size()) != numel(message.shapes[i]))
            {
                throw std::invalid_argument("Parameter " + std::to_string(i) + " does not match its shape");
            }
            parameters.push_back(torch::tensor(message.values[i]).reshape(message.shapes[i]));
        }
        return parameters;
    }

    ZmqExperienceSink::ZmqExperienceSink(std::string url, std::shared_ptr<zmq::context_t> context, int ackTimeout) :
    url(std::move(url)),
    context(context ? std::move(context) : std::make_shared<zmq::context_t>(1)),
    ackTimeout(ackTimeout)
    {
    }

    ZmqExperienceSink::~ZmqExperienceSink()
    {
        socket.reset();
    }

    void ZmqExperienceSink::connect()
    {
        socket = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::req);
        socket->set(zmq::sockopt::linger, 0);
        socket->set(zmq::sockopt::rcvtimeo, ackTimeout);
        socket->connect(url);
        spdlog::info("Sending experience to: {}", url);
    }

    void ZmqExperienceSink::emit(const ApexActor::ExperienceBatch &batch)
    {
        if (!socket)
        {
            throw std::logic_error("ZmqExperienceSink used before connect()");
        }

        socket->send(packMessage(toExperienceMessage(batch)), zmq::send_flags::none);

        // Blocks until the consumer has taken the batch
        zmq::message_t reply;
        if (!socket->recv(reply, zmq::recv_flags::none))
        {
            spdlog::error("No acknowledgement from {} within {} ms", url, ackTimeout);
            throw std::runtime_error("No acknowledgement received from " + url);
        }
        const auto ack = unpackMessage<AckMessage>(reply);
        spdlog::debug("Worker {} batch of {} acknowledged", ack.rank, ack.received);
    }

    ZmqParameterSource::ZmqParameterSource(std::string url, std::shared_ptr<zmq::context_t> context) :
    url(std::move(url)),
    context(context ? std::move(context) : std::make_shared<zmq::context_t>(1))
    {
    }

    ZmqParameterSource::~ZmqParameterSource()
    {
        socket.reset();
    }

    void ZmqParameterSource::connect()
    {
        socket = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::sub);
        socket->set(zmq::sockopt::linger, 0);
        socket->set(zmq::sockopt::subscribe, "");
        socket->connect(url);
        spdlog::info("Receiving parameters from: {}", url);
    }

    std::optional<std::vector<torch::Tensor>> ZmqParameterSource::poll()
    {
        if (!socket)
        {
            throw std::logic_error("ZmqParameterSource used before connect()");
        }

        zmq::message_t latest;
        bool received = false;
        while (true)
        {
            zmq::message_t message;
            if (!socket->recv(message, zmq::recv_flags::dontwait))
            {
                break;
            }
            latest = std::move(message);
            received = true;
        }
        if (!received)
        {
            return std::nullopt;
        }

        try
        {
            const auto message = unpackMessage<ParameterMessage>(latest);
            auto parameters = toParameters(message);
            version = message.version;
            return parameters;
        }
        catch (const msgpack::unpack_error &error)
        {
            spdlog::warn("Dropping malformed parameter message: {}", error.what());
        }
        catch (const msgpack::type_error &error)
        {
            spdlog::warn("Dropping parameter message of unexpected type: {}", error.what());
        }
        catch (const std::invalid_argument &error)
        {
            spdlog::warn("Dropping inconsistent parameter message: {}", error.what());
        }
        return std::nullopt;
    }

    namespace
    {
        ApexActor::ExperienceBatch sampleBatch()
        {
            ApexActor::ExperienceBatch batch;
            batch.rank = 3;
            batch.transitions.states = torch::arange(12, torch::kFloat).reshape({3, 4});
            batch.transitions.actions = torch::tensor({int64_t{2}, int64_t{0}, int64_t{1}});
            batch.transitions.rewards = torch::tensor({1.0f, -0.5f, 0.25f});
            batch.transitions.nextStates = torch::arange(12, 24, torch::kFloat).reshape({3, 4});
            batch.transitions.dones = torch::tensor({0.0f, 0.0f, 1.0f});
            batch.priorities = {0.5f, 1.5f, 0.1f};
            return batch;
        }

        std::optional<std::vector<torch::Tensor>> pollUntilReceived(ZmqParameterSource &source)
        {
            for (int attempt = 0; attempt < 200; ++attempt)
            {
                auto parameters = source.poll();
                if (parameters)
                {
                    return parameters;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return std::nullopt;
        }
    }

    TEST_CASE("ZmqChannel")
    {
        auto context = std::make_shared<zmq::context_t>(1);

        SUBCASE("Experience messages keep shapes and values")
        {
            auto batch = sampleBatch();
            auto message = toExperienceMessage(batch);

            CHECK(message.rank == 3);
            CHECK(message.stateShape == std::vector<int64_t>{4});
            CHECK(message.actionShape.empty());
            CHECK(message.states.size() == 12);
            CHECK(message.actions == std::vector<int64_t>{2, 0, 1});
            CHECK(message.dones == std::vector<float>{0.0f, 0.0f, 1.0f});

            auto rebuilt = fromExperienceMessage(message);
            CHECK(torch::equal(rebuilt.transitions.states, batch.transitions.states));
            CHECK(torch::equal(rebuilt.transitions.actions, batch.transitions.actions));
            CHECK(torch::equal(rebuilt.transitions.nextStates, batch.transitions.nextStates));
            CHECK(rebuilt.priorities == batch.priorities);
        }

        SUBCASE("Inconsistent experience messages are rejected")
        {
            auto message = toExperienceMessage(sampleBatch());
            message.rewards.pop_back();
            CHECK_THROWS_AS(fromExperienceMessage(message), std::invalid_argument);
        }

        SUBCASE("Parameter values that do not fill their shape are rejected")
        {
            auto message = toParameterMessage({torch::ones({2, 3}), torch::zeros({3})}, 4);
            CHECK(message.version == 4);
            CHECK(toParameters(message)[0].sizes() == torch::IntArrayRef({2, 3}));

            message.values[1].push_back(1.0f);
            CHECK_THROWS_AS(toParameters(message), std::invalid_argument);
        }

        SUBCASE("emit() blocks until the consumer acknowledges")
        {
            zmq::socket_t replay(*context, zmq::socket_type::rep);
            replay.set(zmq::sockopt::linger, 0);
            replay.bind("inproc://experience");

            ZmqExperienceSink sink("inproc://experience", context);
            CHECK_THROWS_AS(sink.emit(sampleBatch()), std::logic_error);
            sink.connect();

            ExperienceMessage received;
            std::thread consumer([&replay, &received]()
            {
                zmq::message_t message;
                if (replay.recv(message, zmq::recv_flags::none))
                {
                    received = unpackMessage<ExperienceMessage>(message);
                    AckMessage ack{received.rank, static_cast<int64_t>(received.priorities.size())};
                    replay.send(packMessage(ack), zmq::send_flags::none);
                }
            });
            sink.emit(sampleBatch());
            consumer.join();

            CHECK(received.rank == 3);
            CHECK(received.priorities == std::vector<float>{0.5f, 1.5f, 0.1f});
        }

        SUBCASE("emit() fails when the consumer never acknowledges")
        {
            zmq::socket_t replay(*context, zmq::socket_type::rep);
            replay.set(zmq::sockopt::linger, 0);
            replay.bind("inproc://silent-experience");

            ZmqExperienceSink sink("inproc://silent-experience", context, 50);
            sink.connect();
            CHECK_THROWS_AS(sink.emit(sampleBatch()), std::runtime_error);
        }

        SUBCASE("poll() drains to the newest parameter set")
        {
            zmq::socket_t learner(*context, zmq::socket_type::pub);
            learner.set(zmq::sockopt::linger, 0);
            learner.bind("inproc://parameters");

            ZmqParameterSource source("inproc://parameters", context);
            CHECK_THROWS_AS(source.poll(), std::logic_error);
            source.connect();
            CHECK_FALSE(source.poll().has_value());
            CHECK(source.getVersion() == -1);

            // Subscriptions propagate asynchronously: publish until one arrives
            std::optional<std::vector<torch::Tensor>> first;
            for (int attempt = 0; attempt < 200 && !first; ++attempt)
            {
                learner.send(packMessage(toParameterMessage({torch::zeros({2})}, 1)), zmq::send_flags::none);
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                first = source.poll();
            }
            REQUIRE(first.has_value());
            CHECK(source.getVersion() == 1);

            learner.send(packMessage(toParameterMessage({torch::full({2}, 2.0f)}, 2)), zmq::send_flags::none);
            learner.send(packMessage(toParameterMessage({torch::full({2}, 3.0f)}, 3)), zmq::send_flags::none);
            std::this_thread::sleep_for(std::chrono::milliseconds(50));

            auto newest = pollUntilReceived(source);
            REQUIRE(newest.has_value());
            CHECK(source.getVersion() == 3);
            CHECK(torch::equal((*newest)[0], torch::full({2}, 3.0f)));
            CHECK_FALSE(source.poll().has_value());

            SUBCASE("Undecodable messages are skipped")
            {
                learner.send(packMessage(std::string("not parameters")), zmq::send_flags::none);
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                CHECK_FALSE(source.poll().has_value());
                CHECK(source.getVersion() == 3);
            }
        }
    }
}
