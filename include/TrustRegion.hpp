#pragma once

#ifndef TRUSTREGIONRL_TRUSTREGION_HPP
#define TRUSTREGIONRL_TRUSTREGION_HPP

#include"Algorithms/Algorithm.hpp"
#include"Algorithms/NaturalPG.hpp"
#include"Algorithms/TrustRegionPG.hpp"
#include"Algorithms/UpdaterFactory.hpp"
#include"Algorithms/ValueFunctionTrainer.hpp"
#include"Algorithms/VanillaPG.hpp"

#include"Distribution/Categorical.hpp"
#include"Distribution/Distribution.hpp"
#include"Distribution/Normal.hpp"

#include"Environment/Environment.hpp"
#include"Environment/EnvironmentFactory.hpp"
#include"Environment/VectorEnvironment.hpp"

#include"Generator/FeedForwardGenerator.hpp"
#include"Generator/Generator.hpp"

#include"Model/ModelFactory.hpp"
#include"Model/mlp_base.hpp"
#include"Model/modelUtils.hpp"
#include"Model/nnBase.hpp"
#include"Model/OutputLayers.hpp"
#include"Model/policy.hpp"
#include"Model/ValueFunction.hpp"

#include"Optim/ConjugateGradient.hpp"
#include"Optim/FisherVectorProduct.hpp"
#include"Optim/LineSearch.hpp"

#include"AdvantageEstimator.hpp"
#include"Checkpoint.hpp"
#include"Config.hpp"
#include"Errors.hpp"
#include"MetricsLogger.hpp"
#include"RolloutCollector.hpp"
#include"Space.hpp"
#include"Storage.hpp"
#include"Trainer.hpp"

#endif //TRUSTREGIONRL_TRUSTREGION_HPP
