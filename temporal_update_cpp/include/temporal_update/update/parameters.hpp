#pragma once

#include "temporal_update/config/configuration.hpp"
#include "temporal_update/core/types.hpp"
#include "temporal_update/kernel/ar_kernel.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace temporal_update {

// Read-only options of one update call.
struct TemporalParameters {
    UpdateMethod method = UpdateMethod::CONSTRAINED_FOOPSI;
    bool restimate_kernel = true;
    int outer_iterations = 2;
    double convergence_threshold = config::kDefaultConvergenceThreshold;
    SweepOrder sweep_order = SweepOrder::RANDOM;
    std::optional<std::uint64_t> random_seed;

    SparseMatrixd interpolation;                    // pixels x time, 0x0 = none
    std::optional<std::vector<int>> unsaturated_pixels;  // absent = all pixels

    kernel::KernelSpec kernel;
    std::optional<int> kernel_order;
    std::optional<double> fudge_factor;

    VectorXd per_pixel_noise;  // indexed by original pixel; required by the dual rule

    int dual_max_pixels = config::kDefaultDualMaxPixels;
    double dual_initial_multiplier = config::kDefaultDualInitialMultiplier;

    int mcmc_samples = 400;
    int mcmc_burn_in = 300;

    int progress_interval = 10;
};

// Caller-owned data of one update call.
struct TemporalProblem {
    Matrix2Dd observation;        // pixels x time
    Matrix2Dd footprints;         // pixels x sources
    VectorXd background_shape;    // pixels
    Matrix2Dd traces;             // sources x time
    VectorXd background_trace;    // time
    std::optional<Matrix2Dd> lagrange_multipliers;  // constraints x sources
};

struct TemporalUpdateResult {
    Matrix2Dd traces;
    VectorXd background_trace;
    Matrix2Dd residual;  // original pixel order
    std::vector<SourceEstimate> sources;
    std::optional<Matrix2Dd> lagrange_multipliers;

    DriverState state = DriverState::INIT;
    int sweeps = 0;
    std::vector<double> sweep_changes;
    std::vector<std::string> warnings;
};

using ProgressCallback = std::function<void(int visited, int total)>;

} // namespace temporal_update
