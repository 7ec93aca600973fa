#include<algorithm>
#include<stdexcept>

#include<doctest/doctest.h>

#include"../include/EpsilonGreedy.hpp"

namespace ApexActor
{
    EpsilonGreedy::EpsilonGreedy(double maxEpsilon, double minEpsilon, double epsilonDecay, unsigned int seed) :
    epsilon(maxEpsilon),
    maxEpsilon(maxEpsilon),
    minEpsilon(minEpsilon),
    epsilonDecay(epsilonDecay),
    randomEngine(seed),
    uniform(0.0, 1.0)
    {
        if (minEpsilon < 0 || minEpsilon > maxEpsilon || maxEpsilon > 1)
        {
            throw std::invalid_argument("Epsilon bounds must satisfy 0 <= minEpsilon <= maxEpsilon <= 1");
        }
        if (epsilonDecay < 0)
        {
            throw std::invalid_argument("epsilonDecay must be non-negative");
        }
    }

    bool EpsilonGreedy::shouldExplore()
    {
        return epsilon > uniform(randomEngine);
    }

    void EpsilonGreedy::decay()
    {
        epsilon = std::max(epsilon - (maxEpsilon - minEpsilon) * epsilonDecay, minEpsilon);
    }

    TEST_CASE("EpsilonGreedy")
    {
        SUBCASE("Starts at maxEpsilon")
        {
            EpsilonGreedy exploration(1.0, 0.01, 0.0001, 7);
            CHECK(exploration.getEpsilon() == doctest::Approx(1.0));
        }

        SUBCASE("Decays linearly and never below minEpsilon")
        {
            EpsilonGreedy exploration(1.0, 0.1, 0.25, 0);
            double previous = exploration.getEpsilon();
            for (int i = 0; i < 10; ++i)
            {
                exploration.decay();
                CHECK(exploration.getEpsilon() <= previous);
                CHECK(exploration.getEpsilon() >= 0.1);
                previous = exploration.getEpsilon();
            }
            CHECK(exploration.getEpsilon() == doctest::Approx(0.1));
        }

        SUBCASE("One decay step removes (max - min) * decay")
        {
            EpsilonGreedy exploration(1.0, 0.01, 0.0001, 0);
            exploration.decay();
            CHECK(exploration.getEpsilon() == doctest::Approx(1.0 - 0.99 * 0.0001));
        }

        SUBCASE("Always explores at epsilon 1 and never at epsilon 0")
        {
            EpsilonGreedy always(1.0, 1.0, 0.0, 3);
            EpsilonGreedy never(0.0, 0.0, 0.0, 3);
            for (int i = 0; i < 100; ++i)
            {
                CHECK(always.shouldExplore());
                CHECK_FALSE(never.shouldExplore());
            }
        }

        SUBCASE("Same seed gives the same coin sequence")
        {
            EpsilonGreedy first(0.5, 0.5, 0.0, 11);
            EpsilonGreedy second(0.5, 0.5, 0.0, 11);
            for (int i = 0; i < 50; ++i)
            {
                CHECK(first.shouldExplore() == second.shouldExplore());
            }
        }

        SUBCASE("Invalid bounds are rejected")
        {
            CHECK_THROWS_AS(EpsilonGreedy(0.1, 0.5, 0.0, 0), std::invalid_argument);
            CHECK_THROWS_AS(EpsilonGreedy(1.5, 0.5, 0.0, 0), std::invalid_argument);
            CHECK_THROWS_AS(EpsilonGreedy(1.0, 0.1, -1.0, 0), std::invalid_argument);
        }
    }
}
