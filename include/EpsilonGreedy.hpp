#pragma once

#ifndef APEXACTORRL_EPSILONGREEDY_HPP
#define APEXACTORRL_EPSILONGREEDY_HPP

#include<random>

namespace ApexActor
{
    /**
     * @brief Exploration state of an epsilon-greedy action selector
     *
     * Holds the current epsilon together with the random engine that draws the
     * explore/exploit coin. Epsilon starts at `maxEpsilon` and only ever moves
     * through decay():
     *
     *     epsilon <- max(epsilon - (maxEpsilon - minEpsilon) * epsilonDecay, minEpsilon)
     *
     * so it is non-increasing and bounded below by `minEpsilon` for the lifetime
     * of the object.
     */
    class EpsilonGreedy
    {
    private:
        double epsilon;
        double maxEpsilon;
        double minEpsilon;
        double epsilonDecay;
        std::mt19937 randomEngine;
        std::uniform_real_distribution<double> uniform;

    public:
        /**
         * @param maxEpsilon Initial epsilon
         * @param minEpsilon Lower bound of epsilon
         * @param epsilonDecay Fraction of (maxEpsilon - minEpsilon) removed per selection
         * @param seed Seed of the coin engine, the worker rank
         *
         * @throws std::invalid_argument unless 0 <= minEpsilon <= maxEpsilon <= 1 and epsilonDecay >= 0
         */
        EpsilonGreedy(double maxEpsilon, double minEpsilon, double epsilonDecay, unsigned int seed);

        /**
         * @brief Draws the coin: true with probability epsilon
         */
        bool shouldExplore();

        /**
         * @brief Applies one linear decay step
         */
        void decay();

        inline double getEpsilon() const
        {
            return epsilon;
        }

        inline double getMinEpsilon() const
        {
            return minEpsilon;
        }

        inline double getMaxEpsilon() const
        {
            return maxEpsilon;
        }
    };
}

#endif //APEXACTORRL_EPSILONGREEDY_HPP
