#pragma once

#ifndef TRUSTREGIONRL_CHECKPOINT_HPP
#define TRUSTREGIONRL_CHECKPOINT_HPP

#include<cstdint>
#include<optional>
#include<string>

#include<torch/torch.h>

#include"Algorithms/Algorithm.hpp"
#include"Algorithms/ValueFunctionTrainer.hpp"
#include"Model/policy.hpp"
#include"Model/ValueFunction.hpp"

namespace TrustRegion
{
    /**
     * @struct TrainingState
     * @brief Everything a resumed run needs, by reference to the live objects.
     *
     * Loading restores the modules and optimizers in place, so the optimizers keep
     * pointing at the same parameters.
     */
    struct TrainingState
    {
        Policy policy{nullptr};
        ValueFunction valueFunction{nullptr};
        PolicyUpdater *policyUpdater = nullptr;
        ValueFunctionTrainer *valueFunctionTrainer = nullptr;
        int64_t lastIteration = -1;
    };

    /**
     * @class CheckpointManager
     * @brief Writes and restores checkpoint_<k>.pt files in one directory.
     *
     * A checkpoint is a torch::serialize archive with the sub-archives policy,
     * value_function, policy_optimizer and value_optimizer and the tensors last_iteration
     * and rng_state (the default CPU generator). Files are written to a temporary name
     * first and renamed once complete.
     */
    class CheckpointManager
    {
    private:
        std::string directory;

    public:
        explicit CheckpointManager(std::string directory);

        /**
         * @brief Saves the state reached after `iteration`.
         * @throws CheckpointError When the directory or file cannot be written.
         */
        void save(int64_t iteration, const TrainingState &state) const;

        /**
         * @brief Restores checkpoint `iteration` into `state` and sets state.lastIteration.
         * @throws CheckpointError When the file is missing, unreadable or incomplete.
         */
        void load(int64_t iteration, TrainingState &state) const;

        /// Highest k with a checkpoint_<k>.pt in the directory.
        std::optional<int64_t> latestIteration() const;

        std::string checkpointPath(int64_t iteration) const;

        inline const std::string &getDirectory() const
        {
            return directory;
        }
    };
}

#endif //TRUSTREGIONRL_CHECKPOINT_HPP
