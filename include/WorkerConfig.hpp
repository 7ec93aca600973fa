#pragma once

#ifndef APEXACTORRL_WORKERCONFIG_HPP
#define APEXACTORRL_WORKERCONFIG_HPP

#include<cstdint>
#include<string>

namespace ApexActor
{
    /**
     * @brief Hyperparameters of a data-collection worker
     *
     * Defaults follow the DQN worker configuration used for distributed
     * (Ape-X style) collection.
     */
    struct WorkerConfig
    {
        double gamma = 0.99;                 /**< Discount factor for n-step folding and priority targets */
        unsigned int nStep = 1;              /**< N-step window length, 1 disables the window */
        double maxEpsilon = 1.0;             /**< Initial exploration rate */
        double minEpsilon = 0.01;            /**< Exploration floor */
        double epsilonDecay = 1e-5;          /**< Linear decay rate per action selection */
        double perEps = 1e-6;                /**< Priority floor added to every element-wise loss */
        std::size_t localBufferMaxSize = 1000; /**< Entries collected per emission */
        int64_t workerUpdateInterval = 50;   /**< Emission cycles between parameter polls */
        int64_t maxUpdateStep = 100000;      /**< Emission cycles before run() returns */
        std::string lossType = "DQNLoss";    /**< Loss used to compute priorities */
        bool render = false;                 /**< Render the environment before every action */

        /**
         * @brief Checks every field against its admissible range
         *
         * @throws std::invalid_argument naming the first offending field
         */
        void validate() const;
    };
}

#endif //APEXACTORRL_WORKERCONFIG_HPP
