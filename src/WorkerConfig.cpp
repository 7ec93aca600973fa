#include<stdexcept>

#include<doctest/doctest.h>

#include"../include/WorkerConfig.hpp"

namespace ApexActor
{
    void WorkerConfig::validate() const
    {
        if (gamma < 0 || gamma > 1)
        {
            throw std::invalid_argument("gamma must lie in [0, 1]");
        }
        if (nStep < 1)
        {
            throw std::invalid_argument("nStep must be at least 1");
        }
        if (minEpsilon < 0 || minEpsilon > maxEpsilon || maxEpsilon > 1)
        {
            throw std::invalid_argument("Epsilon bounds must satisfy 0 <= minEpsilon <= maxEpsilon <= 1");
        }
        if (epsilonDecay < 0)
        {
            throw std::invalid_argument("epsilonDecay must be non-negative");
        }
        if (!(perEps > 0))
        {
            throw std::invalid_argument("perEps must be strictly positive");
        }
        if (localBufferMaxSize < 1)
        {
            throw std::invalid_argument("localBufferMaxSize must be at least 1");
        }
        if (workerUpdateInterval < 1)
        {
            throw std::invalid_argument("workerUpdateInterval must be at least 1");
        }
        if (maxUpdateStep < 0)
        {
            throw std::invalid_argument("maxUpdateStep must be non-negative");
        }
        if (lossType.empty())
        {
            throw std::invalid_argument("lossType must name a registered loss");
        }
    }

    TEST_CASE("WorkerConfig")
    {
        WorkerConfig config;

        SUBCASE("Defaults are valid")
        {
            CHECK_NOTHROW(config.validate());
        }

        SUBCASE("Zero n-step is rejected")
        {
            config.nStep = 0;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }

        SUBCASE("Non-positive perEps is rejected")
        {
            config.perEps = 0;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }

        SUBCASE("minEpsilon above maxEpsilon is rejected")
        {
            config.minEpsilon = 0.5;
            config.maxEpsilon = 0.2;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }

        SUBCASE("Empty local buffer is rejected")
        {
            config.localBufferMaxSize = 0;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }

        SUBCASE("gamma outside [0, 1] is rejected")
        {
            config.gamma = 1.5;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }
    }
}
