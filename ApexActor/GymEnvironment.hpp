#pragma once
/**
 * @file GymEnvironment.hpp
 * @brief Environment backed by a remote gym server
 */

#ifndef APEXACTORRL_GYMENVIRONMENT_HPP
#define APEXACTORRL_GYMENVIRONMENT_HPP

#include<memory>
#include<random>
#include<string>

#include<torch/torch.h>

#include"../include/Environment/Environment.hpp"
#include"Communication.hpp"

namespace WorkerClient
{
    /**
     * @class GymEnvironment
     * @brief Single discrete-action gym environment served over ZeroMQ
     *
     * Construction sends "make" followed by "info"; the reported spaces are
     * cached. Observations arrive flat and are reshaped to the observation
     * shape. render() marks the next "step" request for rendering on the server.
     */
    class GymEnvironment : public ApexActor::Environment
    {
    private:
        std::unique_ptr<Communicator> communicator;
        ApexActor::ActionSpace actionSpace;
        ApexActor::ObservationSpace observationSpace;
        std::mt19937 sampler;
        bool renderNextStep = false;

        torch::Tensor toObservation(const std::vector<float> &observation) const;

    public:
        /**
         * @throws std::runtime_error if the server does not answer or does not serve a Discrete action space
         */
        GymEnvironment(std::unique_ptr<Communicator> communicator, const std::string &envName);

        torch::Tensor reset() override;

        ApexActor::StepResult step(const torch::Tensor &action) override;

        void seed(unsigned int seed) override;

        torch::Tensor sampleAction() override;

        ApexActor::ActionSpace getActionSpace() const override;

        ApexActor::ObservationSpace getObservationSpace() const override;

        void render() override;
    };
}

#endif //APEXACTORRL_GYMENVIRONMENT_HPP
