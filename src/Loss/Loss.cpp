#include<stdexcept>

#include<doctest/doctest.h>

#include"../../include/Loss/Loss.hpp"
#include"../../include/Loss/DQNLoss.hpp"

namespace ApexActor
{
    LossFunction buildLoss(const std::string &lossType)
    {
        if (lossType == "DQNLoss")
        {
            return DQNLoss();
        }
        throw std::invalid_argument("Unsupported loss type: " + lossType);
    }

    TEST_CASE("buildLoss()")
    {
        SUBCASE("DQNLoss is registered")
        {
            auto loss = buildLoss("DQNLoss");
            CHECK(static_cast<bool>(loss));
        }

        SUBCASE("Unknown loss types are rejected")
        {
            CHECK_THROWS_AS(buildLoss("C51Loss"), std::invalid_argument);
        }
    }
}
