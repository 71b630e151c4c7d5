#pragma once

#ifndef TRUSTREGIONRL_REMOTEENVIRONMENT_HPP
#define TRUSTREGIONRL_REMOTEENVIRONMENT_HPP

#include<memory>
#include<string>

#include"Environment.hpp"
#include"Communication.hpp"

namespace TrustRegion
{
    /**
     * @class RemoteEnvironment
     * @brief One environment hosted by a gym server.
     *
     * The constructor connects, asks the server to create `environmentName` and queries
     * its spaces. Every reset() and step() is one request/response round trip.
     * Only flat (1-D) observation spaces are supported.
     */
    class RemoteEnvironment : public Environment
    {
    private:
        std::unique_ptr<GymClient::Communicator> communicator;
        ActionSpace space;
        std::vector<int64_t> observationDims;

        torch::Tensor toObservation(const std::vector<std::vector<float>> &observation) const;

    public:
        /**
         * @throws EnvironmentError If the server does not answer or reports unsupported spaces.
         */
        RemoteEnvironment(const std::string &url, const std::string &environmentName, int timeoutMs = 5000);

        torch::Tensor reset() override;

        StepResult step(const torch::Tensor &action) override;

        /**
         * @brief The gym protocol carries no seed; the server seeds its own environments.
         */
        void seed(uint64_t seed) override;

        std::vector<int64_t> observationShape() const override;

        ActionSpace actionSpace() const override;
    };
}

#endif //TRUSTREGIONRL_REMOTEENVIRONMENT_HPP
