#include<stdexcept>
#include<string>
#include<vector>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Generator/FeedForwardGenerator.hpp"

namespace TrustRegion
{
    FeedForwardGenerator::FeedForwardGenerator(int64_t miniBatchSize,
                                               torch::Tensor observations,
                                               torch::Tensor actions,
                                               torch::Tensor valuePredictions,
                                               torch::Tensor returns,
                                               torch::Tensor actionLogProbs,
                                               torch::Tensor advantages)
        : observations(observations),
          actions(actions),
          valuePredictions(valuePredictions),
          returns(returns),
          actionLogProbs(actionLogProbs),
          advantages(advantages),
          index(0)
    {
        int64_t batchSize = returns.size(0);
        if (miniBatchSize < 1 || miniBatchSize > batchSize)
        {
            throw std::invalid_argument("Mini-batch size " + std::to_string(miniBatchSize) +
                                        " does not fit a batch of " + std::to_string(batchSize));
        }
        int64_t numMiniBatches = batchSize / miniBatchSize;
        indices = torch::randperm(batchSize, torch::TensorOptions(torch::kLong).device(returns.device()))
                      .narrow(0, 0, numMiniBatches * miniBatchSize)
                      .view({numMiniBatches, miniBatchSize});
    }

    bool FeedForwardGenerator::done() const
    {
        return index >= indices.size(0);
    }

    MiniBatch FeedForwardGenerator::next()
    {
        if (done())
        {
            throw std::out_of_range("No mini-batches left in this pass");
        }
        auto sample = indices[index];
        index++;

        return MiniBatch(observations.index({sample}),
                         actions.index({sample}),
                         valuePredictions.index({sample}),
                         returns.index({sample}),
                         actionLogProbs.index({sample}),
                         advantages.index({sample}));
    }

    TEST_CASE("FeedForwardGenerator")
    {
        auto observations = torch::arange(24, torch::kFloat).view({12, 2});
        auto actions = torch::arange(12, torch::kLong).view({12, 1});
        auto returns = torch::arange(12, torch::kFloat).view({12, 1});
        auto zeros = torch::zeros({12, 1});

        SUBCASE("Every sample is handed out exactly once")
        {
            FeedForwardGenerator generator(4, observations, actions, zeros, returns, zeros, zeros);
            CHECK(generator.numMiniBatches() == 3);

            std::vector<torch::Tensor> seen;
            while (!generator.done())
            {
                auto miniBatch = generator.next();
                CHECK(miniBatch.observations.sizes().vec() == std::vector<int64_t>{4, 2});
                CHECK(miniBatch.returns.sizes().vec() == std::vector<int64_t>{4, 1});
                // Rows stay aligned across tensors
                CHECK(torch::equal(miniBatch.actions.to(torch::kFloat), miniBatch.returns));
                CHECK(torch::equal(miniBatch.observations.select(1, 0), miniBatch.returns.squeeze(1) * 2));
                seen.push_back(miniBatch.returns);
            }
            auto all = std::get<0>(torch::cat(seen).squeeze(1).sort());
            CHECK(torch::equal(all, torch::arange(12, torch::kFloat)));
        }

        SUBCASE("Left-over samples are skipped")
        {
            FeedForwardGenerator generator(5, observations, actions, zeros, returns, zeros, zeros);
            CHECK(generator.numMiniBatches() == 2);
        }

        SUBCASE("next() after the last mini-batch throws")
        {
            FeedForwardGenerator generator(12, observations, actions, zeros, returns, zeros, zeros);
            generator.next();
            CHECK(generator.done());
            CHECK_THROWS_AS(generator.next(), std::out_of_range);
        }

        SUBCASE("Rejects mini-batches larger than the batch")
        {
            CHECK_THROWS_AS(FeedForwardGenerator(13, observations, actions, zeros, returns, zeros, zeros),
                            std::invalid_argument);
        }
    }
}
