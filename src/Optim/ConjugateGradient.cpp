#include<cmath>
#include<stdexcept>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Optim/ConjugateGradient.hpp"

namespace TrustRegion
{
    ConjugateGradientResult conjugateGradient(const MatrixVectorProduct &matrixVectorProduct,
                                              const torch::Tensor &b,
                                              int iterations,
                                              double residualTolerance)
    {
        if (b.dim() != 1)
        {
            throw std::invalid_argument("Conjugate gradient expects a flat right-hand side");
        }
        auto x = torch::zeros_like(b);
        auto r = b.clone();
        auto p = b.clone();
        double residualDot = r.dot(r).item().toDouble();

        int performed = 0;
        for (; performed < iterations; ++performed)
        {
            if (residualDot < residualTolerance)
            {
                break;
            }
            auto z = matrixVectorProduct(p).detach();
            double alpha = residualDot / p.dot(z).item().toDouble();
            x += alpha * p;
            r -= alpha * z;
            double newResidualDot = r.dot(r).item().toDouble();
            p = r + (newResidualDot / residualDot) * p;
            residualDot = newResidualDot;
        }

        return {x, performed, std::sqrt(residualDot)};
    }

    TEST_CASE("conjugateGradient")
    {
        auto b = torch::tensor({1., -2., 3., 0.5}, torch::kDouble);

        SUBCASE("Identity system is solved in one step")
        {
            auto result = conjugateGradient([](const torch::Tensor &v) { return v; }, b);

            CHECK(result.iterations == 1);
            CHECK(torch::allclose(result.solution, b));
            CHECK(result.residualNorm == doctest::Approx(0));
        }

        SUBCASE("Diagonal system")
        {
            auto diagonal = torch::tensor({1., 2., 4., 8.}, torch::kDouble);
            auto result = conjugateGradient([&](const torch::Tensor &v) { return diagonal * v; }, b);

            CHECK(torch::allclose(result.solution, b / diagonal, 1e-8, 1e-10));
            CHECK(result.iterations <= 4);
        }

        SUBCASE("Random symmetric positive definite system")
        {
            torch::manual_seed(3);
            auto m = torch::randn({6, 6}, torch::kDouble);
            auto a = m.mm(m.t()) + 6 * torch::eye(6, torch::kDouble);
            auto rhs = torch::randn({6}, torch::kDouble);
            MatrixVectorProduct product = [&](const torch::Tensor &v) { return a.mv(v); };

            auto exact = torch::linalg_solve(a, rhs);
            auto result = conjugateGradient(product, rhs, 6, 1e-20);
            CHECK(torch::allclose(result.solution, exact, 1e-6, 1e-8));

            SUBCASE("Error in the A-norm shrinks with more iterations")
            {
                auto energyError = [&](const torch::Tensor &x) {
                    auto error = x - exact;
                    return error.dot(a.mv(error)).item().toDouble();
                };
                auto coarse = conjugateGradient(product, rhs, 1, 0);
                auto finer = conjugateGradient(product, rhs, 3, 0);
                CHECK(energyError(finer.solution) < energyError(coarse.solution));
                CHECK(result.residualNorm < 1e-6);
            }
        }

        SUBCASE("Zero right-hand side needs no products")
        {
            int calls = 0;
            auto result = conjugateGradient([&](const torch::Tensor &v) { calls++; return v; },
                                            torch::zeros({3}));
            CHECK(calls == 0);
            CHECK(result.iterations == 0);
            CHECK(result.solution.abs().sum().item().toDouble() == 0);
        }
    }
}
