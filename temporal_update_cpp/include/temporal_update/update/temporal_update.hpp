#pragma once

#include "temporal_update/solvers/solver_interfaces.hpp"
#include "temporal_update/update/parameters.hpp"
#include "temporal_update/update/update_rules.hpp"

#include <memory>
#include <random>
#include <vector>

namespace temporal_update::update {

// Shapes, index sets and per-pixel noise. Throws ValidationError.
void validate_problem(const TemporalProblem& problem, const TemporalParameters& params);

// Scalar options and kernel availability for the selected method. Throws ConfigError.
void validate_parameters(const TemporalParameters& params, int n_sources);

/**
 * Block-coordinate temporal update.
 *
 *   INIT -> ITERATING -> CONVERGED | ITERATION_LIMIT_REACHED
 *
 * Each sweep visits every source and the background once, in a fresh random
 * permutation (or in index order for SweepOrder::SEQUENTIAL). A sweep ends
 * the run when ||C_prev - C||_F / ||C||_F over the augmented trace matrix
 * drops to the convergence threshold.
 */
class BlockCoordinateDriver {
public:
    BlockCoordinateDriver(const TemporalParameters& params,
                          const solvers::SolverSet& solvers,
                          ProgressCallback progress_cb = nullptr);

    TemporalUpdateResult run(const TemporalProblem& problem);

    DriverState state() const { return state_; }

private:
    std::vector<int> visit_order(int n, std::mt19937_64& rng) const;

    const TemporalParameters& params_;
    const solvers::SolverSet& solvers_;
    ProgressCallback progress_cb_;
    DriverState state_ = DriverState::INIT;
};

TemporalUpdateResult update_temporal_components(const TemporalProblem& problem,
                                                const TemporalParameters& params,
                                                const solvers::SolverSet& solvers,
                                                ProgressCallback progress_cb = nullptr);

} // namespace temporal_update::update
