#pragma once

#ifndef TRUSTREGIONRL_MATCHINGENVIRONMENT_HPP
#define TRUSTREGIONRL_MATCHINGENVIRONMENT_HPP

#include"Environment.hpp"

namespace TrustRegion
{
    /**
     * @class MatchingEnvironment
     * @brief Toy task whose observation alternates between 0 and 1.
     *
     * The agent earns +1 when its discrete action equals the current observation and
     * -1 otherwise. Episodes last a fixed number of steps. `phase` selects whether the
     * first observation of an episode is 0 or 1. The task is deterministic and ignores
     * seed().
     */
    class MatchingEnvironment : public Environment
    {
    private:
        int episodeLength;
        int phase;
        int stepCount;

        float currentObservation() const;

    public:
        /**
         * @throws std::invalid_argument If episodeLength < 1.
         */
        explicit MatchingEnvironment(int episodeLength = 5, int phase = 0);

        torch::Tensor reset() override;

        StepResult step(const torch::Tensor &action) override;

        void seed(uint64_t seed) override;

        std::vector<int64_t> observationShape() const override;

        ActionSpace actionSpace() const override;
    };
}

#endif //TRUSTREGIONRL_MATCHINGENVIRONMENT_HPP
