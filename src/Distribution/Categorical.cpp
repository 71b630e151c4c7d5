#include<stdexcept>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Distribution/Categorical.hpp"
#include"../../include/Distribution/Normal.hpp"


namespace TrustRegion
{
    /**
     * @brief Constructs a Categorical distribution from probabilities or logits.
     *
     * @details If `probs` are provided they are normalized, clamped away from zero and
     * turned into logits with log(). If `logits` are provided they are normalized with
     * log-sum-exp and turned into probabilities with softmax.
     */
    Categorical::Categorical(const torch::Tensor *probs, const torch::Tensor *logits)
    {
        if ((probs == nullptr) == (logits == nullptr))
        {
            throw std::runtime_error("Exactly one of probs or logits must be provided");
        }
        if (probs != nullptr)
        {
            if (probs->dim() < 1)
            {
                throw std::runtime_error("Categorical probs need at least one dimension");
            }
            this->probs = *probs / probs->sum(-1, true);
            this->probs = this->probs.clamp(1.21e-7, 1. - 1.21e-7);
            this->logits = torch::log(this->probs);
        }
        else
        {
            if (logits->dim() < 1)
            {
                throw std::runtime_error("Categorical logits need at least one dimension");
            }
            this->logits = *logits - logits->logsumexp(-1, true);
            this->probs = torch::softmax(this->logits, -1);
        }
        param = probs != nullptr ? *probs : *logits;
        numEvents = param.size(-1);
        batch_shape = param.sizes().vec();
        batch_shape.resize(batch_shape.size() - 1);
    }

    torch::Tensor Categorical::entropy()
    {
        auto pLogP = logits * probs;
        return -pLogP.sum(-1);
    }

    torch::Tensor Categorical::logProbability(torch::Tensor value)
    {
        value = value.to(torch::kLong).unsqueeze(-1);
        auto broadcastedTensors = torch::broadcast_tensors({value, logits});
        value = broadcastedTensors[0];
        value = value.narrow(-1, 0, 1);
        return broadcastedTensors[1].gather(-1, value).squeeze(-1);
    }

    /**
     * @details The probabilities are expanded to the requested sample shape, flattened
     * to 2D for torch::multinomial and reshaped back afterwards.
     */
    torch::Tensor Categorical::sample(c10::ArrayRef<int64_t> sampleShape)
    {
        auto extrSampleShape = extendedShape(sampleShape);
        auto paramShape = extrSampleShape;
        paramShape.insert(paramShape.end(), {numEvents});

        torch::Tensor probsExpanded = probs;
        for (size_t i = 0; i < sampleShape.size(); ++i)
        {
            probsExpanded = probsExpanded.unsqueeze(0);
        }

        auto probs2D = probsExpanded.expand(paramShape).contiguous().view({-1, numEvents});
        auto sample2D = torch::multinomial(probs2D, 1, true);
        return sample2D.contiguous().view(extrSampleShape);
    }

    torch::Tensor Categorical::klDivergence(Distribution &other)
    {
        auto *categorical = dynamic_cast<Categorical *>(&other);
        if (categorical == nullptr)
        {
            throw std::invalid_argument("KL divergence between a Categorical and a different family is undefined");
        }
        return (probs * (logits - categorical->logits)).sum(-1);
    }

    torch::Tensor Categorical::flatParameters()
    {
        return logits;
    }

    std::unique_ptr<Distribution> Categorical::detach()
    {
        auto detachedLogits = logits.detach();
        return std::make_unique<Categorical>(nullptr, &detachedLogits);
    }

    TEST_CASE("Categorical")
    {
        SUBCASE("Rejects both probs and logits")
        {
            auto tensor = torch::Tensor();
            CHECK_THROWS(Categorical(&tensor, &tensor));
            CHECK_THROWS(Categorical(nullptr, nullptr));
        }

        SUBCASE("Samples stay inside the action range")
        {
            auto uniform = torch::full({5}, 0.2);
            auto dist = Categorical(&uniform, nullptr);

            auto samples = dist.sample({100});
            CHECK(samples.sizes().vec() == std::vector<int64_t>{100});
            CHECK(samples.max().item().toLong() <= 4);
            CHECK(samples.min().item().toLong() >= 0);
        }

        SUBCASE("Batched probabilities")
        {
            float probabilities[2][4] = {{0.5, 0.5, 0.0, 0.0},
                                         {0.25, 0.25, 0.25, 0.25}};
            auto probabilitiesTensor = torch::from_blob(probabilities, {2, 4});
            auto dist = Categorical(&probabilitiesTensor, nullptr);

            SUBCASE("Sample shape is [sample, batch]")
            {
                CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{2});
                CHECK(dist.sample({10, 5}).sizes().vec() == std::vector<int64_t>{10, 5, 2});
            }

            SUBCASE("Entropy is computed per batch element")
            {
                auto entropies = dist.entropy();
                CHECK(entropies.sizes().vec() == std::vector<int64_t>{2});
                CHECK(entropies[0].item().toDouble() == doctest::Approx(0.6931).epsilon(1e-3));
                CHECK(entropies[1].item().toDouble() == doctest::Approx(1.3863).epsilon(1e-3));
            }

            SUBCASE("Log probabilities of chosen actions")
            {
                int64_t actions[2] = {1, 3};
                auto actionsTensor = torch::from_blob(actions, {2}, torch::kLong);
                auto logProbs = dist.logProbability(actionsTensor);

                INFO(logProbs << "\n");
                CHECK(logProbs.sizes().vec() == std::vector<int64_t>{2});
                CHECK(logProbs[0].item().toDouble() == doctest::Approx(-0.6931).epsilon(1e-3));
                CHECK(logProbs[1].item().toDouble() == doctest::Approx(-1.3863).epsilon(1e-3));
            }
        }

        SUBCASE("Deterministic probabilities always sample the same action")
        {
            float probabilities[2][4] = {{0, 1, 0, 0},
                                         {0, 0, 0, 1}};
            auto probabilitiesTensor = torch::from_blob(probabilities, {2, 4});
            auto dist = Categorical(&probabilitiesTensor, nullptr);

            auto sum = dist.sample({5}).sum({0});
            CHECK(sum[0].item().toInt() == 5);
            CHECK(sum[1].item().toInt() == 15);
        }

        SUBCASE("klDivergence()")
        {
            float p[2] = {0.5, 0.5};
            float q[2] = {0.25, 0.75};
            auto pTensor = torch::from_blob(p, {1, 2});
            auto qTensor = torch::from_blob(q, {1, 2});
            auto pDist = Categorical(&pTensor, nullptr);
            auto qDist = Categorical(&qTensor, nullptr);

            SUBCASE("Matches the closed form")
            {
                auto kl = pDist.klDivergence(qDist);
                CHECK(kl.sizes().vec() == std::vector<int64_t>{1});
                CHECK(kl[0].item().toDouble() == doctest::Approx(0.1438).epsilon(1e-3));
            }

            SUBCASE("Is zero against itself")
            {
                CHECK(pDist.klDivergence(pDist)[0].item().toDouble() == doctest::Approx(0).epsilon(1e-6));
            }

            SUBCASE("Rejects a different family")
            {
                auto normal = Normal(torch::zeros({1, 2}), torch::ones({1, 2}));
                CHECK_THROWS_AS(pDist.klDivergence(normal), std::invalid_argument);
            }
        }

        SUBCASE("Flat parameters rebuild the same distribution")
        {
            auto logits = torch::randn({3, 4}, torch::requires_grad());
            auto dist = Categorical(nullptr, &logits);
            auto parameters = dist.flatParameters();
            auto rebuilt = Categorical(nullptr, &parameters);

            CHECK(torch::allclose(rebuilt.getProbability(), dist.getProbability()));
            CHECK(!dist.detach()->flatParameters().requires_grad());
        }
    }
}
