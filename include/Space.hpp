#pragma once

#ifndef APEXACTORRL_SPACE_HPP
#define APEXACTORRL_SPACE_HPP

#include<string>
#include<vector>
#include<cstdint>

namespace ApexActor
{
    /**
     * @brief Description of an environment's action space
     *
     * Only "Discrete" spaces are acted on by the epsilon-greedy workers; the
     * shape then holds a single entry, the number of actions.
     */
    struct ActionSpace
    {
        std::string type;
        std::vector<int64_t> shape;
    };

    /**
     * @brief Description of an environment's observation space
     */
    struct ObservationSpace
    {
        std::string type;
        std::vector<int64_t> shape;
    };
}

#endif //APEXACTORRL_SPACE_HPP
