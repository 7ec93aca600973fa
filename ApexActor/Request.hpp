#pragma once
/**
 * @file Request.hpp
 * @brief Wire structures exchanged by the worker process
 *
 * Two protocols share this file:
 * - the gym-server protocol: a `Request<T>` envelope carrying a method name
 *   ("make", "info", "seed", "reset", "step") and its parameters, answered by
 *   one of the response structures below;
 * - the replay/learner protocol: `ExperienceMessage` emitted by the worker and
 *   `ParameterMessage` published by the learner.
 *
 * Every structure is serialized as a MessagePack map. Tensors travel as flat
 * row-major value lists together with their shape.
 */

#ifndef APEXACTORRL_REQUEST_HPP
#define APEXACTORRL_REQUEST_HPP

#include<cstdint>
#include<memory>
#include<string>
#include<vector>

#include<msgpack.hpp>

/**
 * @namespace WorkerClient
 * @brief Process-level plumbing of a worker: wire formats and ZeroMQ transport
 */
namespace WorkerClient
{
    /**
     * @brief Envelope of every gym-server request
     * @tparam T The parameter structure of the requested method
     */
    template<class T>
    struct Request
    {
        std::string method; ///< Name of the gym operation
        std::shared_ptr<T> param; ///< Operation-specific parameters

        Request(const std::string &method, std::shared_ptr<T> param) : method(method), param(param)
        {
        }

        MSGPACK_DEFINE_MAP(method, param);
    };

    /**
     * @brief Creates the environment `envName` on the server
     */
    struct makeParam
    {
        std::string envName;
        MSGPACK_DEFINE_MAP(envName);
    };

    struct infoParam
    {
        int x = 0;
        MSGPACK_DEFINE_MAP(x);
    };

    /**
     * @brief Seeds the server-side environment
     */
    struct seedParam
    {
        unsigned int seed = 0;
        MSGPACK_DEFINE_MAP(seed);
    };

    struct resetParam
    {
        int x = 0;
        MSGPACK_DEFINE_MAP(x);
    };

    /**
     * @brief One discrete action, optionally rendered by the server
     */
    struct stepParam
    {
        int64_t action = 0;
        bool render = false;
        MSGPACK_DEFINE_MAP(action, render);
    };

    /**
     * @brief Action and observation spaces of the served environment
     */
    struct InfoResponse
    {
        std::string actionSpaceType; ///< "Discrete", "Box", ...
        std::vector<int64_t> actionSpaceShape; ///< Number of actions for "Discrete"
        std::string observationSpaceType;
        std::vector<int64_t> observationSpaceShape;
        MSGPACK_DEFINE_MAP(actionSpaceType, actionSpaceShape, observationSpaceType, observationSpaceShape);
    };

    /**
     * @brief Result of "make" and "seed" requests
     */
    struct MakeResponse
    {
        std::string result;
        MSGPACK_DEFINE_MAP(result);
    };

    struct ResetResponse
    {
        std::vector<float> observation; ///< Flat observation, reshaped by observationSpaceShape
        MSGPACK_DEFINE_MAP(observation);
    };

    struct StepResponse
    {
        std::vector<float> observation;
        float reward = 0;
        bool done = false;
        MSGPACK_DEFINE_MAP(observation, reward, done);
    };

    /**
     * @brief One emitted batch with its initial priorities
     *
     * `states` and `nextStates` hold `priorities.size()` observations of shape
     * `stateShape` back to back; `actionShape` is the per-entry action shape.
     */
    struct ExperienceMessage
    {
        int rank = 0;
        std::vector<int64_t> stateShape;
        std::vector<int64_t> actionShape;
        std::vector<float> states;
        std::vector<int64_t> actions;
        std::vector<float> rewards;
        std::vector<float> nextStates;
        std::vector<float> dones;
        std::vector<float> priorities;
        MSGPACK_DEFINE_MAP(rank, stateShape, actionShape, states, actions, rewards, nextStates, dones, priorities);
    };

    /**
     * @brief Acknowledgement sent back by the experience consumer
     */
    struct AckMessage
    {
        int rank = 0;
        int64_t received = 0;
        MSGPACK_DEFINE_MAP(rank, received);
    };

    /**
     * @brief Parameter set published by the learner, in parameter order
     */
    struct ParameterMessage
    {
        int64_t version = 0;
        std::vector<std::vector<int64_t>> shapes;
        std::vector<std::vector<float>> values;
        MSGPACK_DEFINE_MAP(version, shapes, values);
    };
}

#endif //APEXACTORRL_REQUEST_HPP
