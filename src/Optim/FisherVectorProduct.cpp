#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Optim/FisherVectorProduct.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/Model/mlp_base.hpp"

namespace TrustRegion
{
    FisherVectorProduct::FisherVectorProduct(Policy &policy, const torch::Tensor &observations, double damping)
        : parameters(policy->parameters()),
          damping(damping)
    {
        auto current = policy->distribution(observations);
        auto old = current->detach();
        auto kl = old->klDivergence(*current).mean();
        klGradient = flatGrad(kl, parameters, /*createGraph=*/true);
    }

    torch::Tensor FisherVectorProduct::operator()(const torch::Tensor &direction) const
    {
        auto v = direction.detach().to(klGradient.dtype());
        auto gradientDotV = klGradient.dot(v);
        if (!gradientDotV.requires_grad())
        {
            // No parameter reaches the KL
            return damping * v;
        }
        auto product = flatGrad(gradientDotV, parameters, /*createGraph=*/false, /*retainGraph=*/true);
        return product.detach() + damping * v;
    }

    TEST_CASE("FisherVectorProduct")
    {
        torch::manual_seed(11);

        SUBCASE("Zero direction gives zero")
        {
            Policy policy(ActionSpace{"Discrete", {3}}, std::make_shared<MlpBase>(2, std::vector<unsigned int>{5}));
            FisherVectorProduct fisher(policy, torch::randn({16, 2}), 0.1);

            auto product = fisher(torch::zeros({policy->numParameters()}));
            CHECK(product.sizes().vec() == std::vector<int64_t>{policy->numParameters()});
            CHECK(product.abs().max().item().toDouble() == 0);
        }

        SUBCASE("Products are positive semi-definite and can be repeated")
        {
            Policy policy(ActionSpace{"Discrete", {3}}, std::make_shared<MlpBase>(2, std::vector<unsigned int>{5}));
            FisherVectorProduct fisher(policy, torch::randn({16, 2}), 0);

            for (int i = 0; i < 3; ++i)
            {
                auto v = torch::randn({policy->numParameters()});
                CHECK(v.dot(fisher(v)).item().toDouble() >= -1e-6);
            }
        }

        SUBCASE("Damping adds a multiple of the direction")
        {
            Policy policy(ActionSpace{"Discrete", {3}}, std::make_shared<MlpBase>(2, std::vector<unsigned int>{5}));
            auto observations = torch::randn({16, 2});
            FisherVectorProduct undamped(policy, observations, 0);
            FisherVectorProduct damped(policy, observations, 0.5);

            auto v = torch::randn({policy->numParameters()});
            CHECK(torch::allclose(damped(v), undamped(v) + 0.5 * v, 1e-5, 1e-6));
        }

        SUBCASE("Matches a finite-difference Hessian-vector product of the KL")
        {
            // Gaussian policy on the identity trunk: loc = w * x + b, log std
            Policy policy(ActionSpace{"Box", {1}}, std::make_shared<MlpBase>(1, std::vector<unsigned int>{}));
            policy->to(torch::kDouble);
            auto observations = torch::randn({32, 1}, torch::kDouble);
            auto parameters = policy->parameters();

            auto theta = policy->flatParameters();
            auto old = policy->distribution(observations)->detach();
            auto klGradientAt = [&](const torch::Tensor &point) {
                policy->setFlatParameters(point);
                auto kl = old->klDivergence(*policy->distribution(observations)).mean();
                return flatGrad(kl, parameters);
            };

            FisherVectorProduct fisher(policy, observations, 0);
            auto v = torch::randn({policy->numParameters()}, torch::kDouble);
            auto product = fisher(v);

            const double epsilon = 1e-5;
            auto finiteDifference = (klGradientAt(theta + epsilon * v) - klGradientAt(theta - epsilon * v)) /
                                    (2 * epsilon);
            policy->setFlatParameters(theta);

            INFO("FVP: " << product << "\nFD: " << finiteDifference);
            CHECK(torch::allclose(product, finiteDifference, 1e-4, 1e-6));
        }
    }
}
