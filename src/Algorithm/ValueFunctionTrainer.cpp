#include<algorithm>
#include<cmath>
#include<limits>
#include<stdexcept>

#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/ValueFunctionTrainer.hpp"
#include"../../include/Generator/FeedForwardGenerator.hpp"
#include"../../include/Model/mlp_base.hpp"
#include"../../include/Model/modelUtils.hpp"

namespace TrustRegion
{
    ValueFunctionTrainer::ValueFunctionTrainer(ValueFunction &valueFunction,
                                               double learningRate,
                                               int iterations,
                                               int miniBatches)
        : valueFunction(valueFunction),
          iterations(iterations),
          miniBatches(miniBatches),
          optimizer(std::make_unique<torch::optim::Adam>(valueFunction->parameters(),
                                                         torch::optim::AdamOptions(learningRate)))
    {
        if (iterations < 0 || miniBatches < 1)
        {
            throw std::invalid_argument("The value refit needs non-negative iterations and at least one mini-batch");
        }
    }

    std::vector<UpdateDatum> ValueFunctionTrainer::update(const TrainingBatch &batch)
    {
        float varianceExplained = explainedVariance(batch.valuePredictions, batch.returns);
        auto miniBatchSize = std::max<int64_t>(1, batch.size() / miniBatches);
        auto parameters = valueFunction->parameters();
        const auto skipped = std::numeric_limits<float>::quiet_NaN();

        if (!allFinite(batch.observations) || !allFinite(batch.returns))
        {
            spdlog::warn("Non-finite value targets, skipping the value refit");
            return {{"ValueLoss", skipped},
                    {"ExplainedVariance", varianceExplained}};
        }

        float valueLoss = 0;
        for (int iteration = 0; iteration < iterations; ++iteration)
        {
            FeedForwardGenerator generator(miniBatchSize,
                                           batch.observations,
                                           batch.actions,
                                           batch.valuePredictions,
                                           batch.returns,
                                           batch.actionLogProbs,
                                           batch.advantages);
            float passLoss = 0;
            while (!generator.done())
            {
                auto miniBatch = generator.next();
                auto loss = torch::mse_loss(valueFunction->forward(miniBatch.observations), miniBatch.returns);

                optimizer->zero_grad();
                loss.backward();

                bool finite = std::isfinite(loss.item().toFloat());
                for (const auto &parameter : parameters)
                {
                    finite = finite && (!parameter.grad().defined() || allFinite(parameter.grad()));
                }
                if (!finite)
                {
                    // The remaining passes would see the same targets
                    optimizer->zero_grad();
                    spdlog::warn("Non-finite value loss or gradient, stopping the value refit");
                    return {{"ValueLoss", skipped},
                            {"ExplainedVariance", varianceExplained}};
                }

                optimizer->step();
                passLoss += loss.item().toFloat();
            }
            valueLoss = passLoss / generator.numMiniBatches();
        }

        return {{"ValueLoss", valueLoss},
                {"ExplainedVariance", varianceExplained}};
    }

    void ValueFunctionTrainer::save(torch::serialize::OutputArchive &archive) const
    {
        optimizer->save(archive);
    }

    void ValueFunctionTrainer::load(torch::serialize::InputArchive &archive)
    {
        optimizer->load(archive);
    }

    float explainedVariance(const torch::Tensor &predictions, const torch::Tensor &targets)
    {
        auto targetVariance = targets.var().item().toFloat();
        if (!(targetVariance > 0))
        {
            return std::numeric_limits<float>::quiet_NaN();
        }
        return 1 - (targets - predictions).var().item().toFloat() / targetVariance;
    }

    TEST_CASE("ValueFunctionTrainer")
    {
        torch::manual_seed(0);
        ValueFunction valueFunction(std::make_shared<MlpBase>(2, std::vector<unsigned int>{16}));

        TrainingBatch batch;
        batch.observations = torch::rand({64, 2});
        batch.returns = batch.observations.sum(1, true) * 3;
        batch.actions = torch::zeros({64, 1}, torch::kLong);
        batch.actionLogProbs = torch::zeros({64, 1});
        batch.advantages = torch::zeros({64, 1});
        {
            torch::NoGradGuard noGrad;
            batch.valuePredictions = valueFunction->forward(batch.observations);
        }

        SUBCASE("Full-batch refit reduces the regression loss")
        {
            ValueFunctionTrainer trainer(valueFunction, 1e-2, 80);
            auto first = trainer.update(batch);
            auto second = trainer.update(batch);

            REQUIRE(first.size() == 2);
            CHECK(first[0].name == "ValueLoss");
            CHECK(second[0].value < first[0].value);
            CHECK(second[0].value < 1.0);
        }

        SUBCASE("Mini-batch refit")
        {
            ValueFunctionTrainer trainer(valueFunction, 1e-2, 20, 4);
            auto data = trainer.update(batch);
            auto predictions = valueFunction->forward(batch.observations).detach();
            CHECK(explainedVariance(predictions, batch.returns) > 0.5);
            CHECK(std::isfinite(data[1].value));
        }

        SUBCASE("A non-finite return leaves the value function and Adam untouched")
        {
            ValueFunctionTrainer trainer(valueFunction, 1e-2, 5);
            auto before = flattenParameters(valueFunction->parameters());

            auto badBatch = batch;
            badBatch.returns = batch.returns.clone();
            badBatch.returns[3][0] = std::numeric_limits<float>::quiet_NaN();
            auto data = trainer.update(badBatch);

            CHECK(data[0].name == "ValueLoss");
            CHECK(std::isnan(data[0].value));
            CHECK(torch::equal(flattenParameters(valueFunction->parameters()), before));
            CHECK(trainer.getOptimizer().state().empty());

            auto recovered = trainer.update(batch);
            CHECK(std::isfinite(recovered[0].value));
            CHECK(allFinite(flattenParameters(valueFunction->parameters())));
        }

        SUBCASE("An infinite loss stops the refit before the optimizer step")
        {
            ValueFunctionTrainer trainer(valueFunction, 1e-2, 5);
            trainer.update(batch);
            auto before = flattenParameters(valueFunction->parameters());

            auto badBatch = batch;
            badBatch.returns = torch::full_like(batch.returns, 1e30);
            auto data = trainer.update(badBatch);

            CHECK(std::isnan(data[0].value));
            CHECK(torch::equal(flattenParameters(valueFunction->parameters()), before));
        }

        SUBCASE("Explained variance")
        {
            CHECK(explainedVariance(batch.returns, batch.returns) == doctest::Approx(1));
            CHECK(explainedVariance(torch::zeros({64, 1}), batch.returns) <= 0);
            CHECK(std::isnan(explainedVariance(batch.returns, torch::ones({64, 1}))));
        }
    }
}
