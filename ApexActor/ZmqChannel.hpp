#pragma once
/**
 * @file ZmqChannel.hpp
 * @brief ZeroMQ implementations of the worker's experience and parameter channels
 */

#ifndef APEXACTORRL_ZMQCHANNEL_HPP
#define APEXACTORRL_ZMQCHANNEL_HPP

#include<cstdint>
#include<memory>
#include<optional>
#include<string>
#include<vector>

#include<torch/torch.h>
#include<zmq.hpp>

#include"../include/Channel.hpp"
#include"Request.hpp"

namespace WorkerClient
{
    /**
     * @brief Flattens a frozen batch and its priorities into a wire message
     */
    ExperienceMessage toExperienceMessage(const ApexActor::ExperienceBatch &batch);

    /**
     * @brief Rebuilds the batch tensors of a received message
     *
     * @throws std::invalid_argument if the field lengths disagree
     */
    ApexActor::ExperienceBatch fromExperienceMessage(const ExperienceMessage &message);

    ParameterMessage toParameterMessage(const std::vector<torch::Tensor> &parameters, int64_t version);

    /**
     * @brief Rebuilds the parameter tensors of a published message
     *
     * @throws std::invalid_argument if a value list does not match its shape
     */
    std::vector<torch::Tensor> toParameters(const ParameterMessage &message);

    /**
     * @class ZmqExperienceSink
     * @brief Sends batches to the replay side over a ZMQ_REQ socket
     *
     * Every emit() waits for the consumer's AckMessage before returning, so a
     * slow consumer throttles the worker instead of losing batches. By default
     * the wait is unbounded; a positive `ackTimeout` turns a consumer that never
     * answers into an error.
     */
    class ZmqExperienceSink : public ApexActor::ExperienceSink
    {
    private:
        std::string url;
        std::shared_ptr<zmq::context_t> context;
        std::unique_ptr<zmq::socket_t> socket;
        int ackTimeout;

    public:
        /**
         * @param url Consumer endpoint
         * @param context Context to create the socket in, a private one when null
         * @param ackTimeout Milliseconds to wait for an acknowledgement, -1 waits forever
         */
        explicit ZmqExperienceSink(std::string url, std::shared_ptr<zmq::context_t> context = nullptr, int ackTimeout = -1);

        ~ZmqExperienceSink() override;

        void connect() override;

        /**
         * @throws std::logic_error if connect() was not called
         * @throws std::runtime_error if no acknowledgement arrives within ackTimeout
         * @throws zmq::error_t on transport failures
         */
        void emit(const ApexActor::ExperienceBatch &batch) override;
    };

    /**
     * @class ZmqParameterSource
     * @brief Receives learner parameters over a ZMQ_SUB socket
     *
     * poll() never blocks. Every queued message is drained and only the newest
     * one is decoded. A message that cannot be decoded is logged and skipped.
     */
    class ZmqParameterSource : public ApexActor::ParameterSource
    {
    private:
        std::string url;
        std::shared_ptr<zmq::context_t> context;
        std::unique_ptr<zmq::socket_t> socket;
        int64_t version = -1;

    public:
        explicit ZmqParameterSource(std::string url, std::shared_ptr<zmq::context_t> context = nullptr);

        ~ZmqParameterSource() override;

        void connect() override;

        /**
         * @throws std::logic_error if connect() was not called
         */
        std::optional<std::vector<torch::Tensor>> poll() override;

        /**
         * @brief Version of the last applied message, -1 before the first one
         */
        inline int64_t getVersion() const
        {
            return version;
        }
    };
}

#endif //APEXACTORRL_ZMQCHANNEL_HPP
