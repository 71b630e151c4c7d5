#include<exception>
#include<stdexcept>
#include<string>

#include<ATen/Parallel.h>
#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../include/TrustRegion.hpp"

using namespace TrustRegion;

int main(int argc, char *argv[])
{
    spdlog::set_pattern("%^[%T %7l] %v%$");

    if (argc > 2)
    {
        spdlog::error("Usage: {} [config.yaml]", argv[0]);
        return 1;
    }

    try
    {
        TrainerConfig config;
        if (argc == 2)
        {
            config = loadConfig(argv[1]);
        }
        spdlog::set_level(spdlog::level::from_str(config.trainer.logLevel));

        at::set_num_threads(config.trainer.torchThreads);
        torch::manual_seed(config.trainer.seed);

        spdlog::info("Creating {} {} environments", config.environment.numEnvs, config.environment.name);
        VectorEnvironment environments(makeEnvironments(config.environment),
                                       static_cast<unsigned int>(config.environment.numThreads));
        environments.seed(config.environment.seed);

        const auto &observationShape = environments.observationShape();
        if (observationShape.size() != 1)
        {
            throw std::invalid_argument("Only flat observations are supported");
        }
        auto observationSize = static_cast<unsigned int>(observationShape[0]);
        const auto &actionSpace = environments.actionSpace();
        spdlog::info("Observation size {}, action space {} [{}]", observationSize, actionSpace.type, actionSpace.shape[0]);

        Policy policy = makePolicy(config.model, observationSize, actionSpace);
        ValueFunction valueFunction = makeValueFunction(config.model, observationSize);
        auto policyUpdater = makePolicyUpdater(config.algorithm, policy);
        AdvantageEstimator advantageEstimator(config.advantage.gamma,
                                              config.advantage.lambda,
                                              config.advantage.normalize,
                                              config.advantage.useGae);
        ValueFunctionTrainer valueFunctionTrainer(valueFunction,
                                                  config.valueFunction.learningRate,
                                                  config.valueFunction.iterations,
                                                  config.valueFunction.miniBatches);
        RolloutCollector collector(environments, config.trainer.horizon, config.trainer.rewardWindow);
        MetricsLogger metrics(config.trainer.logDirectory);
        CheckpointManager checkpoints(config.trainer.logDirectory);

        Trainer trainer(TrainerContext{collector,
                                       policy,
                                       valueFunction,
                                       *policyUpdater,
                                       advantageEstimator,
                                       valueFunctionTrainer,
                                       metrics,
                                       &checkpoints,
                                       config.trainer.checkpointInterval});
        InterruptBinding interruptBinding(trainer);

        spdlog::info("Training {} for {} iterations", config.algorithm.type, config.trainer.numIterations);
        auto lastIteration = trainer.run(config.trainer.numIterations, config.trainer.resume);
        spdlog::info("Finished after iteration {}", lastIteration);
    }
    catch (const EnvironmentError &error)
    {
        spdlog::error("Environment failure: {}", error.what());
        return 1;
    }
    catch (const CheckpointError &error)
    {
        spdlog::error("Checkpoint failure: {}", error.what());
        return 1;
    }
    catch (const ConfigError &error)
    {
        spdlog::error("Invalid configuration: {}", error.what());
        return 1;
    }
    catch (const std::exception &error)
    {
        spdlog::error("{}", error.what());
        return 1;
    }

    return 0;
}
