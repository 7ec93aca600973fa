#pragma once
/**
 * @file Communication.hpp
 * @brief ZeroMQ request/response client for the gym environment server
 *
 * The Communicator owns a ZMQ_PAIR socket connected to a gym server and
 * exchanges MessagePack-encoded `Request<T>` envelopes and responses with it.
 * A missing response within the receive timeout is an error: it is logged and
 * thrown, never turned into an empty result.
 */

#ifndef APEXACTORRL_COMMUNICATION_HPP
#define APEXACTORRL_COMMUNICATION_HPP

#include<cstring>
#include<memory>
#include<stdexcept>
#include<string>

#include<msgpack.hpp>
#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"Request.hpp"

namespace WorkerClient
{
    /**
     * @brief Serializes `value` into a ZeroMQ message
     */
    template<class T>
    zmq::message_t packMessage(const T &value)
    {
        msgpack::sbuffer buffer;
        msgpack::pack(buffer, value);

        zmq::message_t message(buffer.size());
        std::memcpy(message.data(), buffer.data(), buffer.size());
        return message;
    }

    /**
     * @brief Deserializes a ZeroMQ message into `T`
     *
     * @throws msgpack::unpack_error if the payload is not MessagePack
     * @throws msgpack::type_error if the payload does not match `T`
     */
    template<class T>
    T unpackMessage(const zmq::message_t &message)
    {
        msgpack::object_handle objectHandle = msgpack::unpack(static_cast<const char *>(message.data()), message.size());
        return objectHandle.get().as<T>();
    }

    /**
     * @class Communicator
     * @brief ZeroMQ client of a gym environment server
     *
     * Usage pattern:
     * 1. Create the Communicator with the server URL
     * 2. Send requests with sendRequest<T>()
     * 3. Receive the matching response with getResponse<T>()
     */
    class Communicator
    {
    private:
        std::shared_ptr<zmq::context_t> context; ///< Shared when the caller supplies one (inproc)
        std::unique_ptr<zmq::socket_t> socket;
        std::string url;

    public:
        /**
         * @brief Connects a ZMQ_PAIR socket to `url`
         *
         * @param url Server URL, e.g. "tcp://127.0.0.1:10201"
         * @param context Context to create the socket in, a private one when null
         * @param timeout Receive timeout in milliseconds
         *
         * @throws zmq::error_t if the socket cannot be created or connected
         */
        explicit Communicator(const std::string &url, std::shared_ptr<zmq::context_t> context = nullptr, int timeout = 5000);

        ~Communicator();

        /**
         * @brief Receives and deserializes the next response
         *
         * @throws std::runtime_error when no response arrives within the timeout
         * @throws msgpack::unpack_error, msgpack::type_error if the response cannot be decoded
         */
        template <typename T>
        std::unique_ptr<T> getResponse()
        {
            zmq::message_t packedMessage;
            if (!socket->recv(packedMessage, zmq::recv_flags::none))
            {
                spdlog::error("Timeout waiting for response from gym server at {}", url);
                throw std::runtime_error("Timeout waiting for response from gym server at " + url);
            }

            try
            {
                return std::make_unique<T>(unpackMessage<T>(packedMessage));
            }
            catch (const msgpack::type_error &error)
            {
                spdlog::error("Unexpected response from gym server: {}", error.what());
                throw;
            }
            catch (const msgpack::unpack_error &error)
            {
                spdlog::error("Malformed response from gym server: {}", error.what());
                throw;
            }
        }

        /**
         * @brief Serializes and sends a request to the server
         */
        template<class T>
        void sendRequest(const Request<T> &request)
        {
            socket->send(packMessage(request), zmq::send_flags::none);
        }
    };
}

#endif //APEXACTORRL_COMMUNICATION_HPP
