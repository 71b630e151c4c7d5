#pragma once

#ifndef TRUSTREGIONRL_CONFIG_HPP
#define TRUSTREGIONRL_CONFIG_HPP

#include<cstdint>
#include<string>
#include<vector>

#include<yaml-cpp/yaml.h>

namespace TrustRegion
{
    /**
     * @brief Which environments to run and how to drive them.
     */
    struct EnvironmentConfig
    {
        std::string name = "Matching";     ///< Matching, CartPole, Pendulum or Remote
        int numEnvs = 4;
        int numThreads = 0;                ///< Worker threads of the pool, 0 means one per environment
        int episodeLength = 5;             ///< Only used by the Matching environment
        std::string serverAddress = "tcp://127.0.0.1";
        int basePort = 10201;              ///< Remote environment i connects to basePort + i
        std::string gymEnvironment = "LunarLander-v3";
        uint64_t seed = 0;

        void validate() const;
    };

    struct ModelConfig
    {
        std::vector<unsigned int> hiddenSizes{64, 64};
        std::string activation = "tanh";

        void validate() const;
    };

    /**
     * @brief Policy update rule and its hyperparameters.
     *
     * `type` selects the updater: "Vanilla", "Natural", "TNPG" or "TRPO". The two
     * trust-region variants share every field, TRPO additionally runs the line search.
     */
    struct AlgorithmConfig
    {
        std::string type = "TRPO";
        double maxKl = 0.01;
        double klSubsampleRatio = 1.0;
        int cgIterations = 10;
        double cgResidualTolerance = 1e-10;
        double damping = 1e-3;
        int maxBacktracks = 10;
        double backtrackRatio = 0.8;
        double acceptRatio = 0.1;
        double learningRate = 1e-2;        ///< Adam step size of Vanilla and Natural

        void validate() const;
    };

    struct AdvantageConfig
    {
        float gamma = 0.99f;
        float lambda = 0.97f;
        bool normalize = true;
        bool useGae = true;

        void validate() const;
    };

    struct ValueFunctionConfig
    {
        double learningRate = 1e-3;
        int iterations = 80;
        int miniBatches = 1;

        void validate() const;
    };

    struct TrainerSettings
    {
        int numIterations = 100;
        int horizon = 125;
        int checkpointInterval = 1;        ///< 0 disables checkpoints
        std::string logDirectory = "runs/trpo";
        bool resume = false;
        uint64_t seed = 0;
        int torchThreads = 1;
        int rewardWindow = 100;            ///< Episodes averaged into the reward statistics
        std::string logLevel = "info";

        void validate() const;
    };

    /**
     * @brief Complete configuration of a training run.
     */
    struct TrainerConfig
    {
        EnvironmentConfig environment;
        ModelConfig model;
        AlgorithmConfig algorithm;
        AdvantageConfig advantage;
        ValueFunctionConfig valueFunction;
        TrainerSettings trainer;

        /**
         * @brief Validates every section.
         *
         * @throws ConfigError Naming the first offending field.
         */
        void validate() const;
    };

    /**
     * @brief Builds a configuration from a parsed YAML document.
     *
     * Missing sections and keys keep their defaults. The result is validated.
     *
     * @throws ConfigError On a value of the wrong type or an invalid setting.
     */
    TrainerConfig parseConfig(const YAML::Node &root);

    /**
     * @brief Reads and parses a YAML configuration file.
     *
     * @throws ConfigError If the file cannot be read or parsed.
     */
    TrainerConfig loadConfig(const std::string &filename);
}

#endif //TRUSTREGIONRL_CONFIG_HPP
