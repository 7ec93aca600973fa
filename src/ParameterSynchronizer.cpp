/**
 * @file ParameterSynchronizer.cpp
 * @brief In-place replacement of a module's parameters
 */

#include<sstream>
#include<stdexcept>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/ParameterSynchronizer.hpp"
#include"../include/Model/brain.hpp"

namespace ApexActor
{
    /**
     * @brief Copies every incoming tensor into the matching module parameter
     *
     * All shapes are checked before the first copy so a mismatching set never
     * leaves the module half updated.
     */
    void synchronizeParameters(torch::nn::Module &module, const std::vector<torch::Tensor> &newParameters)
    {
        auto parameters = module.parameters();
        if (parameters.size() != newParameters.size())
        {
            throw std::invalid_argument("Parameter count mismatch: module has " +
                std::to_string(parameters.size()) + ", received " + std::to_string(newParameters.size()));
        }
        for (std::size_t i = 0; i < parameters.size(); ++i)
        {
            if (!newParameters[i].defined() || parameters[i].sizes() != newParameters[i].sizes())
            {
                std::ostringstream message;
                message << "Parameter " << i << " shape mismatch: module has " << parameters[i].sizes();
                if (newParameters[i].defined())
                {
                    message << ", received " << newParameters[i].sizes();
                }
                else
                {
                    message << ", received an undefined tensor";
                }
                throw std::invalid_argument(message.str());
            }
        }

        torch::NoGradGuard noGrad;
        for (std::size_t i = 0; i < parameters.size(); ++i)
        {
            parameters[i].copy_(newParameters[i].to(parameters[i].device(), parameters[i].scalar_type()));
        }
    }

    std::vector<torch::Tensor> snapshotParameters(const torch::nn::Module &module)
    {
        std::vector<torch::Tensor> snapshot;
        for (const auto &parameter : module.parameters())
        {
            snapshot.push_back(parameter.detach().clone());
        }
        return snapshot;
    }

    TEST_CASE("synchronizeParameters()")
    {
        torch::manual_seed(0);
        Brain brain(4, 2, std::vector<int64_t>{8});
        Brain source(4, 2, std::vector<int64_t>{8});
        auto newParameters = snapshotParameters(*source);

        SUBCASE("Copies values in enumeration order")
        {
            synchronizeParameters(*brain, newParameters);
            auto parameters = brain->parameters();
            REQUIRE(parameters.size() == newParameters.size());
            for (std::size_t i = 0; i < parameters.size(); ++i)
            {
                CHECK(torch::equal(parameters[i], newParameters[i]));
            }
        }

        SUBCASE("Held references observe the update")
        {
            Brain alias = brain;
            auto heldParameter = brain->parameters()[0];
            const auto *storage = heldParameter.data_ptr<float>();

            synchronizeParameters(*brain, newParameters);

            CHECK(heldParameter.data_ptr<float>() == storage);
            CHECK(torch::equal(heldParameter, newParameters[0]));
            CHECK(torch::equal(alias->parameters()[2], newParameters[2]));
        }

        SUBCASE("Forward pass reflects the new parameters")
        {
            synchronizeParameters(*brain, newParameters);
            torch::NoGradGuard guard;
            auto input = torch::rand({3, 4});
            CHECK(torch::allclose(brain->forward(input), source->forward(input)));
        }

        SUBCASE("Parameter count mismatch is rejected and nothing is copied")
        {
            auto before = snapshotParameters(*brain);
            newParameters.pop_back();
            CHECK_THROWS_AS(synchronizeParameters(*brain, newParameters), std::invalid_argument);
            CHECK(torch::equal(brain->parameters()[0], before[0]));
        }

        SUBCASE("Shape mismatch is rejected and nothing is copied")
        {
            auto before = snapshotParameters(*brain);
            newParameters.back() = torch::zeros({7});
            CHECK_THROWS_AS(synchronizeParameters(*brain, newParameters), std::invalid_argument);
            CHECK(torch::equal(brain->parameters()[0], before[0]));
        }

        SUBCASE("Double precision values are narrowed to the parameter dtype")
        {
            std::vector<torch::Tensor> doubles;
            for (const auto &parameter : newParameters)
            {
                doubles.push_back(parameter.to(torch::kDouble));
            }
            synchronizeParameters(*brain, doubles);
            CHECK(brain->parameters()[0].scalar_type() == torch::kFloat);
            CHECK(torch::allclose(brain->parameters()[0], newParameters[0]));
        }
    }
}
