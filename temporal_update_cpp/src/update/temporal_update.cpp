#include "temporal_update/update/temporal_update.hpp"
#include "temporal_update/core/errors.hpp"
#include "temporal_update/core/utils.hpp"
#include "temporal_update/mixture/bookkeeper.hpp"
#include "temporal_update/pixels/partition.hpp"
#include "temporal_update/reconstruction/reconstruction.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <sstream>

namespace temporal_update::update {

namespace {

std::string shape(Eigen::Index rows, Eigen::Index cols) {
    return std::to_string(rows) + "x" + std::to_string(cols);
}

bool needs_kernel_for_every_source(const TemporalParameters& params) {
    switch (params.method) {
        case UpdateMethod::PROJECT:
        case UpdateMethod::MCEM_FOOPSI:
        case UpdateMethod::MCMC:
        case UpdateMethod::NOISE_CONSTRAINED:
            return true;
        case UpdateMethod::CONSTRAINED_FOOPSI:
            return !params.restimate_kernel;
    }
    return true;
}

} // namespace

void validate_problem(const TemporalProblem& problem, const TemporalParameters& params) {
    const auto d = problem.observation.rows();
    const auto T = problem.observation.cols();
    if (d == 0 || T == 0) {
        throw ValidationError("observation must be non-empty, got " + shape(d, T));
    }
    if (problem.footprints.rows() != d) {
        throw ValidationError("footprints must have " + std::to_string(d) + " rows, got " +
                              shape(problem.footprints.rows(), problem.footprints.cols()));
    }
    if (problem.background_shape.size() != d) {
        throw ValidationError("background shape must have " + std::to_string(d) +
                              " entries, got " + std::to_string(problem.background_shape.size()));
    }
    const auto K = problem.footprints.cols();
    if (problem.traces.rows() != K || problem.traces.cols() != T) {
        throw ValidationError("traces must be " + shape(K, T) + ", got " +
                              shape(problem.traces.rows(), problem.traces.cols()));
    }
    if (problem.background_trace.size() != T) {
        throw ValidationError("background trace must have " + std::to_string(T) +
                              " entries, got " + std::to_string(problem.background_trace.size()));
    }
    if (!problem.footprints.allFinite() || !problem.background_shape.allFinite() ||
        !problem.traces.allFinite() || !problem.background_trace.allFinite()) {
        throw ValidationError("footprints, background and initial traces must be finite");
    }

    if (params.unsaturated_pixels) {
        pixels::validate_pixel_indices(static_cast<int>(d), *params.unsaturated_pixels);
    }

    if (params.method == UpdateMethod::NOISE_CONSTRAINED) {
        if (params.per_pixel_noise.size() != d) {
            throw ValidationError("noise_constrained requires per_pixel_noise with " +
                                  std::to_string(d) + " entries, got " +
                                  std::to_string(params.per_pixel_noise.size()));
        }
        if (!params.per_pixel_noise.allFinite() || params.per_pixel_noise.minCoeff() < 0.0) {
            throw ValidationError("per_pixel_noise must be finite and nonnegative");
        }
    }
}

void validate_parameters(const TemporalParameters& params, int n_sources) {
    if (params.outer_iterations < 1) {
        throw ConfigError("outer_iterations must be >= 1");
    }
    if (!(params.convergence_threshold >= 0.0)) {
        throw ConfigError("convergence_threshold must be >= 0");
    }
    if (params.progress_interval < 0) {
        throw ConfigError("progress_interval must be >= 0");
    }
    if (params.dual_max_pixels < 1) {
        throw ConfigError("dual max_pixels must be >= 1");
    }
    if (params.dual_initial_multiplier < 0.0) {
        throw ConfigError("dual initial multiplier must be >= 0");
    }
    if (params.mcmc_samples < 1 || params.mcmc_burn_in < 0) {
        throw ConfigError("mcmc samples must be >= 1 and burn-in >= 0");
    }
    if (params.kernel_order && *params.kernel_order < 1) {
        throw ConfigError("kernel order must be >= 1");
    }

    for (const auto& [idx, g] : params.kernel.per_source) {
        if (idx < 0 || idx >= n_sources) {
            throw ConfigError("kernel given for source " + std::to_string(idx) +
                              " but there are " + std::to_string(n_sources) + " sources");
        }
        if (g.empty()) {
            throw ConfigError("empty kernel for source " + std::to_string(idx));
        }
    }

    const std::string method = update_method_to_string(params.method);
    if (needs_kernel_for_every_source(params)) {
        for (int k = 0; k < n_sources; ++k) {
            if (!params.kernel.has_kernel(k)) {
                throw ConfigError("method " + method + " requires kernel coefficients for source " +
                                  std::to_string(k));
            }
        }
    } else if (!params.kernel_order) {
        // Re-estimation takes the order from the configured coefficients
        for (int k = 0; k < n_sources; ++k) {
            if (!params.kernel.has_kernel(k)) {
                throw ConfigError("method " + method + " requires a kernel order or kernel "
                                  "coefficients for source " + std::to_string(k));
            }
        }
    }
}

BlockCoordinateDriver::BlockCoordinateDriver(const TemporalParameters& params,
                                             const solvers::SolverSet& solvers,
                                             ProgressCallback progress_cb)
    : params_(params), solvers_(solvers), progress_cb_(std::move(progress_cb)) {}

std::vector<int> BlockCoordinateDriver::visit_order(int n, std::mt19937_64& rng) const {
    std::vector<int> order(static_cast<size_t>(n));
    std::iota(order.begin(), order.end(), 0);
    if (params_.sweep_order == SweepOrder::RANDOM) {
        std::shuffle(order.begin(), order.end(), rng);
    }
    return order;
}

TemporalUpdateResult BlockCoordinateDriver::run(const TemporalProblem& problem) {
    state_ = DriverState::INIT;

    validate_problem(problem, params_);
    const int K = static_cast<int>(problem.footprints.cols());
    validate_parameters(params_, K);

    // INIT
    const Matrix2Dd observation = pixels::apply_interpolation(problem.observation,
                                                              params_.interpolation);
    const pixels::PixelPartition part = pixels::partition_pixels(
        observation, problem.footprints, problem.background_shape, params_.unsaturated_pixels);
    if (!part.fit_observation.allFinite()) {
        throw ValidationError("observation has non-finite entries in fit pixels; "
                              "supply them through the interpolation map");
    }

    const Matrix2Dd footprints = mixture::augment_footprints(part.fit_footprints, part.fit_background);
    Matrix2Dd C = mixture::augment_traces(problem.traces, problem.background_trace);

    std::unique_ptr<ComponentUpdateRule> rule =
        make_update_rule(params_, solvers_, problem.lagrange_multipliers);
    rule->initialize(part, footprints, C);

    TemporalUpdateResult result;
    std::vector<SourceEstimate> sources(static_cast<size_t>(K));

    std::mt19937_64 rng(params_.random_seed ? *params_.random_seed
                                            : static_cast<std::uint64_t>(std::random_device{}()));

    const int n = K + 1;
    std::vector<bool> skipped(static_cast<size_t>(n), false);
    for (int i = 0; i < n; ++i) {
        if (!(rule->squared_norm(i) > 0.0)) {
            skipped[static_cast<size_t>(i)] = true;
            std::ostringstream msg;
            if (i == K) {
                msg << "background shape has zero norm over the fit pixels; background trace kept";
            } else {
                msg << "component " << i << " has zero footprint norm over the fit pixels; trace kept";
            }
            std::cerr << "[TEMPORAL] " << msg.str() << std::endl;
            result.warnings.push_back(msg.str());
        }
    }

    // ITERATING
    state_ = DriverState::ITERATING;
    Matrix2Dd C_prev = C;
    for (int iter = 0; iter < params_.outer_iterations; ++iter) {
        const std::vector<int> order = visit_order(n, rng);
        int visited = 0;
        for (int idx : order) {
            const std::uint64_t component_seed = rng();
            if (!skipped[static_cast<size_t>(idx)]) {
                if (idx == K) {
                    rule->update_background(C);
                } else {
                    rule->update_source(idx, C, sources, component_seed);
                }
            }
            ++visited;
            if (progress_cb_ && params_.progress_interval > 0 &&
                visited % params_.progress_interval == 0) {
                progress_cb_(visited, n);
            }
        }

        ++result.sweeps;
        const double change = core::relative_frobenius_change(C_prev, C);
        result.sweep_changes.push_back(change);
        if (change <= params_.convergence_threshold) {
            state_ = DriverState::CONVERGED;
            break;
        }
        C_prev = C;
    }
    if (state_ == DriverState::ITERATING) {
        state_ = DriverState::ITERATION_LIMIT_REACHED;
    }

    // Reconstruction
    result.traces = C.topRows(K);
    result.background_trace = C.row(K).transpose();

    const Matrix2Dd fit_residual = rule->fit_residual(C);
    const Matrix2Dd excluded_residual = reconstruction::mixture_residual(
        part.excluded_observation, part.excluded_footprints, part.excluded_background,
        result.traces, result.background_trace);
    result.residual = reconstruction::merge_residual(part.n_pixels, part.fit_pixels, fit_residual,
                                                     part.excluded_pixels, excluded_residual);

    result.sources = std::move(sources);
    result.lagrange_multipliers = rule->lagrange_multipliers();
    result.state = state_;
    return result;
}

TemporalUpdateResult update_temporal_components(const TemporalProblem& problem,
                                                const TemporalParameters& params,
                                                const solvers::SolverSet& solvers,
                                                ProgressCallback progress_cb) {
    BlockCoordinateDriver driver(params, solvers, std::move(progress_cb));
    return driver.run(problem);
}

} // namespace temporal_update::update
