#include<algorithm>
#include<string>

#include<yaml-cpp/yaml.h>
#include<doctest/doctest.h>

#include"../include/Config.hpp"
#include"../include/Errors.hpp"

namespace TrustRegion
{
    namespace
    {
        template<typename T>
        void readValue(const YAML::Node &section, const std::string &sectionName, const char *key, T &value)
        {
            if (!section || !section[key])
            {
                return;
            }
            try
            {
                value = section[key].as<T>();
            }
            catch (const YAML::Exception &exception)
            {
                throw ConfigError("Invalid value for " + sectionName + "." + key + ": " + exception.what());
            }
        }

        void require(bool condition, const std::string &message)
        {
            if (!condition)
            {
                throw ConfigError(message);
            }
        }
    }

    void EnvironmentConfig::validate() const
    {
        const std::vector<std::string> names{"Matching", "CartPole", "Pendulum", "Remote"};
        require(std::find(names.begin(), names.end(), name) != names.end(),
                "environment.name must be one of Matching, CartPole, Pendulum or Remote, got " + name);
        require(numEnvs >= 1, "environment.num_envs must be >= 1");
        require(numThreads >= 0, "environment.num_threads must be >= 0");
        require(episodeLength >= 1, "environment.episode_length must be >= 1");
    }

    void ModelConfig::validate() const
    {
        require(activation == "tanh" || activation == "relu", "model.activation must be tanh or relu");
        for (auto size : hiddenSizes)
        {
            require(size > 0, "model.hidden_sizes entries must be > 0");
        }
    }

    void AlgorithmConfig::validate() const
    {
        require(type == "Vanilla" || type == "Natural" || type == "TNPG" || type == "TRPO",
                "algorithm.type must be one of Vanilla, Natural, TNPG or TRPO, got " + type);
        require(maxKl >= 0, "algorithm.max_kl must be >= 0");
        require(klSubsampleRatio > 0 && klSubsampleRatio <= 1, "algorithm.kl_subsample_ratio must be in (0, 1]");
        require(cgIterations >= 1, "algorithm.cg_iterations must be >= 1");
        require(cgResidualTolerance >= 0, "algorithm.cg_residual_tolerance must be >= 0");
        require(damping >= 0, "algorithm.damping must be >= 0");
        require(maxBacktracks >= 1, "algorithm.max_backtracks must be >= 1");
        require(backtrackRatio > 0 && backtrackRatio < 1, "algorithm.backtrack_ratio must be in (0, 1)");
        require(acceptRatio >= 0, "algorithm.accept_ratio must be >= 0");
        require(learningRate > 0, "algorithm.learning_rate must be > 0");
    }

    void AdvantageConfig::validate() const
    {
        require(gamma > 0 && gamma < 1, "advantage.gamma must be in (0, 1)");
        require(lambda >= 0 && lambda <= 1, "advantage.lambda must be in [0, 1]");
    }

    void ValueFunctionConfig::validate() const
    {
        require(learningRate > 0, "value_function.learning_rate must be > 0");
        require(iterations >= 0, "value_function.iterations must be >= 0");
        require(miniBatches >= 1, "value_function.mini_batches must be >= 1");
    }

    void TrainerSettings::validate() const
    {
        require(numIterations >= 0, "trainer.iterations must be >= 0");
        require(horizon >= 1, "trainer.horizon must be >= 1");
        require(checkpointInterval >= 0, "trainer.checkpoint_interval must be >= 0");
        require(torchThreads >= 1, "trainer.torch_threads must be >= 1");
        require(rewardWindow >= 1, "trainer.reward_window must be >= 1");
        require(!logDirectory.empty(), "trainer.log_directory must not be empty");
    }

    void TrainerConfig::validate() const
    {
        environment.validate();
        model.validate();
        algorithm.validate();
        advantage.validate();
        valueFunction.validate();
        trainer.validate();
    }

    TrainerConfig parseConfig(const YAML::Node &root)
    {
        TrainerConfig config;

        auto environment = root["environment"];
        readValue(environment, "environment", "name", config.environment.name);
        readValue(environment, "environment", "num_envs", config.environment.numEnvs);
        readValue(environment, "environment", "num_threads", config.environment.numThreads);
        readValue(environment, "environment", "episode_length", config.environment.episodeLength);
        readValue(environment, "environment", "server_address", config.environment.serverAddress);
        readValue(environment, "environment", "base_port", config.environment.basePort);
        readValue(environment, "environment", "gym_environment", config.environment.gymEnvironment);
        readValue(environment, "environment", "seed", config.environment.seed);

        auto model = root["model"];
        readValue(model, "model", "hidden_sizes", config.model.hiddenSizes);
        readValue(model, "model", "activation", config.model.activation);

        auto algorithm = root["algorithm"];
        readValue(algorithm, "algorithm", "type", config.algorithm.type);
        readValue(algorithm, "algorithm", "max_kl", config.algorithm.maxKl);
        readValue(algorithm, "algorithm", "kl_subsample_ratio", config.algorithm.klSubsampleRatio);
        readValue(algorithm, "algorithm", "cg_iterations", config.algorithm.cgIterations);
        readValue(algorithm, "algorithm", "cg_residual_tolerance", config.algorithm.cgResidualTolerance);
        readValue(algorithm, "algorithm", "damping", config.algorithm.damping);
        readValue(algorithm, "algorithm", "max_backtracks", config.algorithm.maxBacktracks);
        readValue(algorithm, "algorithm", "backtrack_ratio", config.algorithm.backtrackRatio);
        readValue(algorithm, "algorithm", "accept_ratio", config.algorithm.acceptRatio);
        readValue(algorithm, "algorithm", "learning_rate", config.algorithm.learningRate);

        auto advantage = root["advantage"];
        readValue(advantage, "advantage", "gamma", config.advantage.gamma);
        readValue(advantage, "advantage", "lambda", config.advantage.lambda);
        readValue(advantage, "advantage", "normalize", config.advantage.normalize);
        readValue(advantage, "advantage", "use_gae", config.advantage.useGae);

        auto valueFunction = root["value_function"];
        readValue(valueFunction, "value_function", "learning_rate", config.valueFunction.learningRate);
        readValue(valueFunction, "value_function", "iterations", config.valueFunction.iterations);
        readValue(valueFunction, "value_function", "mini_batches", config.valueFunction.miniBatches);

        auto trainer = root["trainer"];
        readValue(trainer, "trainer", "iterations", config.trainer.numIterations);
        readValue(trainer, "trainer", "horizon", config.trainer.horizon);
        readValue(trainer, "trainer", "checkpoint_interval", config.trainer.checkpointInterval);
        readValue(trainer, "trainer", "log_directory", config.trainer.logDirectory);
        readValue(trainer, "trainer", "resume", config.trainer.resume);
        readValue(trainer, "trainer", "seed", config.trainer.seed);
        readValue(trainer, "trainer", "torch_threads", config.trainer.torchThreads);
        readValue(trainer, "trainer", "reward_window", config.trainer.rewardWindow);
        readValue(trainer, "trainer", "log_level", config.trainer.logLevel);

        config.validate();
        return config;
    }

    TrainerConfig loadConfig(const std::string &filename)
    {
        YAML::Node root;
        try
        {
            root = YAML::LoadFile(filename);
        }
        catch (const YAML::Exception &exception)
        {
            throw ConfigError("Could not load " + filename + ": " + exception.what());
        }
        return parseConfig(root);
    }

    TEST_CASE("parseConfig()")
    {
        SUBCASE("An empty document yields the defaults")
        {
            auto config = parseConfig(YAML::Load("{}"));

            CHECK(config.algorithm.type == "TRPO");
            CHECK(config.algorithm.maxKl == doctest::Approx(0.01));
            CHECK(config.advantage.gamma == doctest::Approx(0.99));
            CHECK(config.advantage.lambda == doctest::Approx(0.97));
            CHECK(config.valueFunction.iterations == 80);
            CHECK(config.trainer.horizon == 125);
        }

        SUBCASE("Values override the defaults")
        {
            auto config = parseConfig(YAML::Load(
                "environment: {name: CartPole, num_envs: 8}\n"
                "model: {hidden_sizes: [32, 16], activation: relu}\n"
                "algorithm: {type: TNPG, max_kl: 0.05, kl_subsample_ratio: 0.2}\n"
                "trainer: {horizon: 50, resume: true}\n"));

            CHECK(config.environment.name == "CartPole");
            CHECK(config.environment.numEnvs == 8);
            CHECK(config.model.hiddenSizes == std::vector<unsigned int>{32, 16});
            CHECK(config.model.activation == "relu");
            CHECK(config.algorithm.type == "TNPG");
            CHECK(config.algorithm.klSubsampleRatio == doctest::Approx(0.2));
            CHECK(config.trainer.horizon == 50);
            CHECK(config.trainer.resume);
        }

        SUBCASE("Out of range discount is rejected")
        {
            CHECK_THROWS_AS(parseConfig(YAML::Load("advantage: {gamma: 1.0}")), ConfigError);
            CHECK_THROWS_AS(parseConfig(YAML::Load("advantage: {lambda: 1.5}")), ConfigError);
        }

        SUBCASE("Unknown algorithm is rejected")
        {
            CHECK_THROWS_AS(parseConfig(YAML::Load("algorithm: {type: PPO}")), ConfigError);
        }

        SUBCASE("Values of the wrong type are rejected")
        {
            CHECK_THROWS_AS(parseConfig(YAML::Load("trainer: {horizon: many}")), ConfigError);
        }

        SUBCASE("A missing file is reported")
        {
            CHECK_THROWS_AS(loadConfig("/nonexistent/config.yaml"), ConfigError);
        }
    }
}
