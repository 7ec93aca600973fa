#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/modelUtils.hpp"

namespace ApexActor
{
    /**
     * @brief Orthogonal initialization through QR decomposition
     *
     * A ∈ ℝ^(rows × columns) is drawn from 𝒩(0, 1) and decomposed as A = QR.
     * The result is
     *
     *     W = gain × Q × diag(sign(diag(R)))
     *
     * which keeps WᵀW ≈ gain² I. When rows < columns the decomposition is done
     * on Aᵀ and transposed back, giving a semi-orthogonal matrix.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain)
    {
        torch::NoGradGuard guard;
        if (tensor.dim() < 2)
        {
            return tensor;
        }

        const auto rows = tensor.size(0);
        const auto columns = tensor.numel() / rows;
        auto flattened = torch::randn({rows, columns});
        if (rows < columns)
        {
            flattened.t_();
        }
        torch::Tensor q, r;
        std::tie(q, r) = torch::linalg_qr(flattened);
        auto d = torch::diag(r, 0);
        q *= d.sign();

        if (rows < columns)
        {
            q.t_();
        }

        tensor.view_as(q).copy_(q);
        tensor.mul_(gain);

        return tensor;
    }

    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters,
                  double weightGain,
                  double biasGain)
    {
        for (const auto &parameter : parameters)
        {
            if (parameter.value().size(0) != 0)
            {
                if (parameter.key().find("bias") != std::string::npos)
                {
                    torch::nn::init::constant_(parameter.value(), biasGain);
                }
                else if (parameter.key().find("weight") != std::string::npos)
                {
                    orthogonal_(parameter.value(), weightGain);
                }
            }
        }
    }

    TEST_CASE("initWeights()")
    {
        auto module = torch::nn::Sequential(
            torch::nn::Linear(5, 10),
            torch::nn::Functional(torch::relu),
            torch::nn::Linear(10, 8));

        initWeights(module->named_parameters(), 1, 0);

        SUBCASE("Bias weights are initialized to 0")
        {
            for (const auto &parameter : module->named_parameters())
            {
                if (parameter.key().find("bias") != std::string::npos)
                {
                    CHECK(parameter.value().abs().max().item().toDouble() == doctest::Approx(0));
                }
            }
        }

        SUBCASE("Weights are orthogonal")
        {
            torch::NoGradGuard guard;
            // First layer is 10 x 5: its columns are orthonormal
            auto weight = module->named_parameters()["0.weight"];
            auto product = torch::mm(weight.t(), weight);
            CHECK(torch::allclose(product, torch::eye(5), 1e-4, 1e-4));
        }
    }
}
