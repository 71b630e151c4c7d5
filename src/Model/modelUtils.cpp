#include<limits>
#include<stdexcept>
#include<string>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/modelUtils.hpp"

namespace TrustRegion
{
    /**
     * @brief In-place orthogonal initialization via QR decomposition, scaled by `gains`.
     *
     * Tensors with fewer than two dimensions are left untouched.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gains)
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
        // Sign correction makes the distribution uniform
        q *= torch::diag(r, 0).sign();

        if (rows < columns)
        {
            q.t_();
        }

        tensor.view_as(q).copy_(q);
        tensor.mul_(gains);

        return tensor;
    }

    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters,
                     double weightGain,
                     double biasGain)
    {
        for (const auto &parameter : parameters)
        {
            if (parameter.value().size(0) == 0)
            {
                continue;
            }
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

    torch::Tensor flattenParameters(const std::vector<torch::Tensor> &parameters)
    {
        return torch::nn::utils::parameters_to_vector(parameters).detach();
    }

    // Unlike torch::nn::utils::vector_to_parameters this copies into the existing
    // storage, so the parameters never alias `flat` and optimizer state stays attached.
    void assignFlatParameters(const std::vector<torch::Tensor> &parameters, const torch::Tensor &flat)
    {
        int64_t total = 0;
        for (const auto &parameter : parameters)
        {
            total += parameter.numel();
        }
        if (flat.dim() != 1 || flat.numel() != total)
        {
            throw std::invalid_argument("Flat parameter vector has " + std::to_string(flat.numel()) +
                                        " elements, expected " + std::to_string(total));
        }

        torch::NoGradGuard noGrad;
        int64_t offset = 0;
        for (const auto &parameter : parameters)
        {
            auto numElements = parameter.numel();
            parameter.copy_(flat.slice(0, offset, offset + numElements).view_as(parameter));
            offset += numElements;
        }
    }

    torch::Tensor flatGrad(const torch::Tensor &output,
                           const std::vector<torch::Tensor> &parameters,
                           bool createGraph,
                           bool retainGraph)
    {
        auto gradients = torch::autograd::grad({output},
                                               parameters,
                                               /*grad_outputs=*/{},
                                               /*retain_graph=*/retainGraph || createGraph,
                                               /*create_graph=*/createGraph,
                                               /*allow_unused=*/true);
        std::vector<torch::Tensor> flat;
        flat.reserve(gradients.size());
        for (size_t i = 0; i < gradients.size(); ++i)
        {
            if (gradients[i].defined())
            {
                flat.push_back(gradients[i].reshape({-1}));
            }
            else
            {
                flat.push_back(torch::zeros({parameters[i].numel()}, parameters[i].options()));
            }
        }
        return torch::cat(flat);
    }

    bool allFinite(const torch::Tensor &tensor)
    {
        return torch::isfinite(tensor).all().item<bool>();
    }

    TEST_CASE("initWeights()")
    {
        auto module = torch::nn::Sequential(
            torch::nn::Linear(5, 10),
            torch::nn::Functional(torch::relu),
            torch::nn::Linear(10, 8));

        initWeights(module->named_parameters(), 1, 0);

        SUBCASE("Biases are zero")
        {
            for (const auto &parameter : module->named_parameters())
            {
                if (parameter.key().find("bias") != std::string::npos)
                {
                    CHECK(parameter.value().abs().sum().item().toDouble() == 0);
                }
            }
        }

        SUBCASE("Weight rows are orthonormal")
        {
            auto weight = module->named_parameters()["1.weight"];
            auto gram = weight.matmul(weight.t()).detach();
            CHECK(torch::allclose(gram, torch::eye(8), 1e-4, 1e-4));
        }
    }

    TEST_CASE("Flat parameters")
    {
        auto linear = torch::nn::Linear(3, 2);
        auto parameters = linear->parameters();

        SUBCASE("Flattening then assigning is the identity")
        {
            auto flat = flattenParameters(parameters);
            CHECK(flat.numel() == 8);
            assignFlatParameters(parameters, flat * 2);
            CHECK(torch::allclose(flattenParameters(parameters), flat * 2));
        }

        SUBCASE("The flat vector is a detached copy in parameter order")
        {
            auto flat = flattenParameters(parameters);
            CHECK(!flat.requires_grad());
            CHECK(torch::equal(flat.slice(0, 0, 6), linear->weight.detach().reshape({-1})));
            CHECK(torch::equal(flat.slice(0, 6, 8), linear->bias.detach()));
        }

        SUBCASE("Assigning keeps the parameter storage")
        {
            auto storage = linear->weight.data_ptr();
            auto flat = torch::zeros({8});
            assignFlatParameters(parameters, flat);
            CHECK(linear->weight.data_ptr() == storage);
            flat.fill_(1);
            CHECK(linear->weight.abs().sum().item().toDouble() == 0);
        }

        SUBCASE("Assigning the wrong number of elements throws")
        {
            CHECK_THROWS_AS(assignFlatParameters(parameters, torch::zeros({7})), std::invalid_argument);
        }

        SUBCASE("flatGrad() fills unused parameters with zeros")
        {
            auto output = linear->weight.sum();
            auto gradient = flatGrad(output, parameters);
            REQUIRE(gradient.numel() == 8);
            CHECK(gradient.slice(0, 0, 6).sum().item().toDouble() == doctest::Approx(6));
            CHECK(gradient.slice(0, 6, 8).abs().sum().item().toDouble() == 0);
        }
    }

    TEST_CASE("allFinite()")
    {
        CHECK(allFinite(torch::ones({3})));
        CHECK(!allFinite(torch::tensor({1.0, std::numeric_limits<double>::quiet_NaN()})));
        CHECK(!allFinite(torch::tensor({1.0, std::numeric_limits<double>::infinity()})));
    }
}
