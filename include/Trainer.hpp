#pragma once

#ifndef TRUSTREGIONRL_TRAINER_HPP
#define TRUSTREGIONRL_TRAINER_HPP

#include<atomic>
#include<cstdint>
#include<string>

#include"AdvantageEstimator.hpp"
#include"Checkpoint.hpp"
#include"MetricsLogger.hpp"
#include"RolloutCollector.hpp"
#include"Algorithms/Algorithm.hpp"
#include"Algorithms/ValueFunctionTrainer.hpp"

namespace TrustRegion
{
    enum class TrainerPhase
    {
        Init,
        Collecting,
        Computing,
        Updating,
        Refitting,
        Checkpointing,
        Finished
    };

    std::string phaseName(TrainerPhase phase);

    /**
     * @struct TrainerContext
     * @brief The collaborators of a training run. All of them must outlive the Trainer.
     */
    struct TrainerContext
    {
        RolloutCollector &collector;
        Policy policy;
        ValueFunction valueFunction;
        PolicyUpdater &policyUpdater;
        const AdvantageEstimator &advantageEstimator;
        ValueFunctionTrainer &valueFunctionTrainer;
        MetricsLogger &metrics;
        CheckpointManager *checkpoints = nullptr;   ///< nullptr disables checkpoints
        int checkpointInterval = 1;                 ///< Save every k iterations, 0 disables
    };

    /**
     * @class Trainer
     * @brief Runs the collect, estimate, update, refit, log and checkpoint cycle.
     *
     * Iterations are numbered from 0. A checkpoint is written every checkpointInterval
     * iterations, after the last iteration, and after the iteration a stop request
     * interrupted.
     */
    class Trainer
    {
    private:
        TrainerContext context;
        std::atomic<TrainerPhase> currentPhase;
        std::atomic<bool> stopRequested;

        int64_t restore();

        void checkpoint(int64_t iteration);

        void runIteration(int64_t iteration);

    public:
        explicit Trainer(TrainerContext context);

        /**
         * @brief Trains until iteration numIterations - 1 has completed or a stop is requested.
         *
         * @param numIterations Total number of iterations of the run, resumed ones included.
         * @param resume Continue after the latest checkpoint, if there is one.
         * @return The last completed iteration, -1 if none.
         * @throws EnvironmentError, CheckpointError From the collaborators.
         */
        int64_t run(int64_t numIterations, bool resume = false);

        /// Ends run() at the next iteration boundary. Safe to call from another thread.
        void requestStop();

        inline TrainerPhase phase() const
        {
            return currentPhase.load();
        }
    };

    /**
     * @class InterruptBinding
     * @brief Turns SIGINT into Trainer::requestStop() while the binding lives.
     *
     * Only one binding may be active at a time. The default SIGINT handler is restored on
     * destruction.
     */
    class InterruptBinding
    {
    public:
        explicit InterruptBinding(Trainer &trainer);

        ~InterruptBinding();

        InterruptBinding(const InterruptBinding &) = delete;
        InterruptBinding &operator=(const InterruptBinding &) = delete;
    };
}

#endif //TRUSTREGIONRL_TRAINER_HPP
