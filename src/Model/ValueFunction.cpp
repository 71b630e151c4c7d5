#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/ValueFunction.hpp"
#include"../../include/Model/mlp_base.hpp"
#include"../../include/Model/modelUtils.hpp"

namespace TrustRegion
{
    ValueFunctionImpl::ValueFunctionImpl(std::shared_ptr<NNBase> base)
        : base(register_module("base", base)),
          valueLinear(base->getOutputSize(), 1)
    {
        register_module("valueLinear", valueLinear);
        initWeights(valueLinear->named_parameters(), 1, 0);
    }

    torch::Tensor ValueFunctionImpl::forward(torch::Tensor observations)
    {
        return valueLinear(base->forward(observations));
    }

    TEST_CASE("ValueFunction")
    {
        auto base = std::make_shared<MlpBase>(4, std::vector<unsigned int>{8, 8});
        ValueFunction valueFunction(base);

        SUBCASE("Predicts one value per observation")
        {
            auto values = valueFunction->forward(torch::rand({6, 4}));
            CHECK(values.sizes().vec() == std::vector<int64_t>{6, 1});
        }

        SUBCASE("Can be regressed onto constant targets")
        {
            torch::manual_seed(0);
            torch::optim::Adam optimizer(valueFunction->parameters(), torch::optim::AdamOptions(1e-2));
            auto observations = torch::rand({32, 4});
            auto targets = torch::full({32, 1}, 3.0);

            for (int i = 0; i < 300; ++i)
            {
                auto loss = (valueFunction->forward(observations) - targets).pow(2).mean();
                optimizer.zero_grad();
                loss.backward();
                optimizer.step();
            }

            auto finalLoss = (valueFunction->forward(observations) - targets).pow(2).mean();
            CHECK(finalLoss.item().toDouble() < 0.05);
        }
    }
}
