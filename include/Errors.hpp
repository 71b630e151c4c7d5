#pragma once

#ifndef TRUSTREGIONRL_ERRORS_HPP
#define TRUSTREGIONRL_ERRORS_HPP

#include<stdexcept>
#include<string>

namespace TrustRegion
{
    /**
     * @brief Raised when an environment or the environment pool fails to reset or step.
     *
     * Failures in a worker thread are captured and rethrown as EnvironmentError on the
     * thread that called VectorEnvironment::reset() or VectorEnvironment::step().
     */
    class EnvironmentError : public std::runtime_error
    {
    public:
        explicit EnvironmentError(const std::string &message) : std::runtime_error(message) {}
    };

    /**
     * @brief Raised when a checkpoint cannot be written, found or decoded.
     */
    class CheckpointError : public std::runtime_error
    {
    public:
        explicit CheckpointError(const std::string &message) : std::runtime_error(message) {}
    };

    /**
     * @brief Raised when a configuration file cannot be parsed or holds invalid values.
     */
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
    };
}

#endif //TRUSTREGIONRL_ERRORS_HPP
