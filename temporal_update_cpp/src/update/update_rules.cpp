#include "temporal_update/update/update_rules.hpp"
#include "temporal_update/core/errors.hpp"
#include "temporal_update/kernel/ar_kernel.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace temporal_update::update {

namespace {

void check_trace(const VectorXd& trace, int expected, int k, const std::string& method) {
    if (trace.size() != expected) {
        throw SolverError(k, method, "returned trace of length " + std::to_string(trace.size()) +
                                         ", expected " + std::to_string(expected));
    }
    if (!trace.allFinite()) {
        throw SolverError(k, method, "returned non-finite values");
    }
}

// c + b + c1 gd^t
VectorXd compose_trace(const solvers::DeconvolutionResult& res) {
    const int T = static_cast<int>(res.trace.size());
    VectorXd out = res.trace;
    out.array() += res.baseline;
    out += res.initial_amplitude * kernel::decay_vector(kernel::dominant_root(res.kernel), T);
    return out;
}

void store_estimate(const solvers::DeconvolutionResult& res, SourceEstimate& estimate) {
    estimate.kernel = res.kernel;
    estimate.baseline = res.baseline;
    estimate.initial_amplitude = res.initial_amplitude;
    estimate.noise = res.noise;
    estimate.updated = true;
}

// Kernel carried over from an earlier sweep, else the configured one.
ArKernel warm_kernel(const TemporalParameters& params, int k, const SourceEstimate& estimate) {
    if (estimate.updated && !estimate.kernel.empty()) {
        return estimate.kernel;
    }
    return params.kernel.kernel_for(k);
}

} // namespace

// ---------------------------------------------------------------------------
// IsolatedTraceRule
// ---------------------------------------------------------------------------

IsolatedTraceRule::IsolatedTraceRule(const TemporalParameters& params,
                                     const solvers::SolverSet& solvers)
    : params_(params), solvers_(solvers) {}

void IsolatedTraceRule::initialize(const pixels::PixelPartition& partition,
                                   const Matrix2Dd& augmented_footprints,
                                   const Matrix2Dd& augmented_traces) {
    observation_ = &partition.fit_observation;
    footprints_ = augmented_footprints;
    book_ = std::make_unique<mixture::CorrelationBookkeeper>(partition.fit_observation,
                                                             augmented_footprints,
                                                             augmented_traces);
}

double IsolatedTraceRule::squared_norm(int k) const {
    return book_->squared_norm(k);
}

void IsolatedTraceRule::update_source(int k, Matrix2Dd& augmented_traces,
                                      std::vector<SourceEstimate>& sources,
                                      std::uint64_t seed) {
    const int T = book_->timesteps();
    const VectorXd current = augmented_traces.row(k).transpose();
    const VectorXd isolated = book_->isolate(k, current);

    VectorXd fitted;
    try {
        fitted = fit_isolated(k, isolated, sources[static_cast<size_t>(k)], seed);
    } catch (const SolverError&) {
        throw;
    } catch (const std::exception& e) {
        throw SolverError(k, name(), e.what());
    }
    check_trace(fitted, T, k, name());

    augmented_traces.row(k) = fitted.transpose();
    book_->reabsorb(k, fitted);
}

void IsolatedTraceRule::update_background(Matrix2Dd& augmented_traces) {
    const int K = book_->components() - 1;
    const VectorXd current = augmented_traces.row(K).transpose();
    const VectorXd updated = book_->isolate(K, current).cwiseMax(0.0);
    augmented_traces.row(K) = updated.transpose();
    book_->reabsorb(K, updated);
}

Matrix2Dd IsolatedTraceRule::fit_residual(const Matrix2Dd& augmented_traces) const {
    Matrix2Dd residual = *observation_;
    residual.noalias() -= footprints_ * augmented_traces;
    return residual;
}

// ---------------------------------------------------------------------------
// Arms
// ---------------------------------------------------------------------------

VectorXd ProjectionRule::fit_isolated(int k, const VectorXd& isolated,
                                      SourceEstimate& estimate, std::uint64_t /*seed*/) {
    const ArKernel& g = params_.kernel.kernel_for(k);
    auto it = kernel_cache_.find(k);
    if (it == kernel_cache_.end()) {
        it = kernel_cache_.emplace(k, kernel::make_kernel_matrix(g, static_cast<int>(isolated.size())))
                 .first;
    }

    const double scale = isolated.size() > 0 ? isolated.maxCoeff() : 0.0;
    VectorXd out;
    if (scale > 0.0) {
        out = solvers_.projector->project(isolated / scale, it->second) * scale;
    } else {
        out = solvers_.projector->project(isolated, it->second);
    }

    estimate.kernel = g;
    estimate.updated = true;
    return out;
}

VectorXd ConstrainedDeconvolutionRule::fit_isolated(int k, const VectorXd& isolated,
                                                    SourceEstimate& estimate, std::uint64_t seed) {
    solvers::DeconvolutionRequest req;
    req.seed = seed;
    req.fudge_factor = params_.fudge_factor;
    if (params_.restimate_kernel) {
        if (params_.kernel_order) {
            req.order = *params_.kernel_order;
        } else {
            req.order = params_.kernel.kernel_for(k).order();
        }
    } else {
        req.kernel = params_.kernel.kernel_for(k);
        req.order = req.kernel->order();
    }

    const solvers::DeconvolutionResult res = solvers_.deconvolver->deconvolve(isolated, req);
    check_trace(res.trace, static_cast<int>(isolated.size()), k, name());
    store_estimate(res, estimate);
    return compose_trace(res);
}

VectorXd MonteCarloRule::fit_isolated(int k, const VectorXd& isolated,
                                      SourceEstimate& estimate, std::uint64_t seed) {
    solvers::DeconvolutionRequest req;
    req.kernel = warm_kernel(params_, k, estimate);
    req.order = req.kernel->order();
    req.fudge_factor = params_.fudge_factor;
    req.seed = seed;

    const solvers::DeconvolutionResult res = solvers_.kernel_reestimator->deconvolve(isolated, req);
    check_trace(res.trace, static_cast<int>(isolated.size()), k, name());
    store_estimate(res, estimate);
    return compose_trace(res);
}

VectorXd BayesianSamplingRule::fit_isolated(int k, const VectorXd& isolated,
                                            SourceEstimate& estimate, std::uint64_t seed) {
    solvers::SamplerRequest req;
    req.kernel = warm_kernel(params_, k, estimate);
    req.samples = params_.mcmc_samples;
    req.burn_in = params_.mcmc_burn_in;
    req.seed = seed;

    const solvers::PosteriorSamples samples = solvers_.sampler->sample(isolated, req);
    const size_t n = samples.traces.size();
    if (n == 0 || samples.baselines.size() != n || samples.initial_amplitudes.size() != n ||
        samples.noise_variances.size() != n || samples.kernels.size() != n) {
        throw SolverError(k, name(), "sampler returned no or inconsistent samples");
    }

    const int T = static_cast<int>(isolated.size());
    VectorXd mean_trace = VectorXd::Zero(T);
    double baseline = 0.0;
    double initial = 0.0;
    double noise_var = 0.0;
    std::vector<double> g(static_cast<size_t>(req.kernel.order()), 0.0);
    for (size_t i = 0; i < n; ++i) {
        check_trace(samples.traces[i], T, k, name());
        mean_trace += samples.traces[i];
        baseline += samples.baselines[i];
        initial += samples.initial_amplitudes[i];
        noise_var += samples.noise_variances[i];
        if (samples.kernels[i].coefficients.size() != g.size()) {
            throw SolverError(k, name(), "sampled kernel changed order");
        }
        for (size_t j = 0; j < g.size(); ++j) {
            g[j] += samples.kernels[i].coefficients[j];
        }
    }
    const double inv = 1.0 / static_cast<double>(n);
    for (double& v : g) v *= inv;

    estimate.kernel = ArKernel{g};
    estimate.baseline = baseline * inv;
    estimate.initial_amplitude = initial * inv;
    estimate.noise = std::sqrt(noise_var * inv);
    estimate.updated = true;
    return mean_trace * inv;
}

// ---------------------------------------------------------------------------
// NoiseConstrainedDualRule
// ---------------------------------------------------------------------------

std::vector<int> brightest_pixels(const VectorXd& footprint, int count) {
    std::vector<int> order(static_cast<size_t>(footprint.size()));
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](int a, int b) { return footprint[a] > footprint[b]; });
    order.resize(static_cast<size_t>(std::min<Eigen::Index>(count, footprint.size())));
    return order;
}

NoiseConstrainedDualRule::NoiseConstrainedDualRule(const TemporalParameters& params,
                                                   const solvers::SolverSet& solvers,
                                                   std::optional<Matrix2Dd> initial_multipliers)
    : params_(params), solvers_(solvers), initial_multipliers_(std::move(initial_multipliers)) {}

void NoiseConstrainedDualRule::initialize(const pixels::PixelPartition& partition,
                                          const Matrix2Dd& augmented_footprints,
                                          const Matrix2Dd& augmented_traces) {
    const int K = static_cast<int>(augmented_footprints.cols()) - 1;
    const int T = static_cast<int>(augmented_traces.cols());
    const int n_fit = static_cast<int>(partition.fit_pixels.size());
    const int mc = std::min(n_fit, params_.dual_max_pixels);

    if (initial_multipliers_) {
        if (initial_multipliers_->rows() != mc || initial_multipliers_->cols() != K) {
            throw ValidationError("lagrange multipliers must be " + std::to_string(mc) + "x" +
                                  std::to_string(K) + ", got " +
                                  std::to_string(initial_multipliers_->rows()) + "x" +
                                  std::to_string(initial_multipliers_->cols()));
        }
        multipliers_ = *initial_multipliers_;
    } else {
        multipliers_ = Matrix2Dd::Constant(mc, K, params_.dual_initial_multiplier);
    }

    pixels_.assign(static_cast<size_t>(K), {});
    budgets_.assign(static_cast<size_t>(K), VectorXd());
    for (int k = 0; k < K; ++k) {
        const VectorXd column = augmented_footprints.col(k);
        pixels_[static_cast<size_t>(k)] = brightest_pixels(column, mc);

        VectorXd budget(mc);
        for (int i = 0; i < mc; ++i) {
            const int original = partition.fit_pixels[static_cast<size_t>(pixels_[static_cast<size_t>(k)][static_cast<size_t>(i)])];
            const double sn = params_.per_pixel_noise[original];
            budget[i] = static_cast<double>(T) * sn * sn;
        }
        budgets_[static_cast<size_t>(k)] = budget;
    }

    book_ = std::make_unique<mixture::ResidualBookkeeper>(partition.fit_observation,
                                                          augmented_footprints,
                                                          augmented_traces);
}

double NoiseConstrainedDualRule::squared_norm(int k) const {
    return book_->squared_norm(k);
}

void NoiseConstrainedDualRule::update_source(int k, Matrix2Dd& augmented_traces,
                                             std::vector<SourceEstimate>& sources,
                                             std::uint64_t /*seed*/) {
    const int T = static_cast<int>(augmented_traces.cols());
    const std::vector<int>& rows = pixels_[static_cast<size_t>(k)];

    const VectorXd current = augmented_traces.row(k).transpose();
    book_->add_back(k, current);

    VectorXd weights(static_cast<Eigen::Index>(rows.size()));
    for (size_t i = 0; i < rows.size(); ++i) {
        weights[static_cast<Eigen::Index>(i)] = book_->footprints()(rows[i], k);
    }

    solvers::DualResult res;
    try {
        const ArKernel& g = params_.kernel.kernel_for(k);
        auto it = kernel_cache_.find(k);
        if (it == kernel_cache_.end()) {
            it = kernel_cache_.emplace(k, kernel::make_kernel_matrix(g, T)).first;
        }
        res = solvers_.dual->solve(book_->residual_rows(rows), weights,
                                   budgets_[static_cast<size_t>(k)], it->second,
                                   multipliers_.col(k));
        SourceEstimate& estimate = sources[static_cast<size_t>(k)];
        estimate.kernel = g;
        estimate.updated = true;
    } catch (const SolverError&) {
        throw;
    } catch (const std::exception& e) {
        throw SolverError(k, name(), e.what());
    }
    check_trace(res.trace, T, k, name());
    if (res.multipliers.size() != multipliers_.rows()) {
        throw SolverError(k, name(), "returned " + std::to_string(res.multipliers.size()) +
                                         " multipliers, expected " +
                                         std::to_string(multipliers_.rows()));
    }

    multipliers_.col(k) = res.multipliers;
    augmented_traces.row(k) = res.trace.transpose();
    book_->subtract_out(k, res.trace);
}

void NoiseConstrainedDualRule::update_background(Matrix2Dd& augmented_traces) {
    const int K = book_->components() - 1;
    const VectorXd current = augmented_traces.row(K).transpose();
    book_->add_back(K, current);
    const VectorXd updated = book_->project(K).cwiseMax(0.0);
    augmented_traces.row(K) = updated.transpose();
    book_->subtract_out(K, updated);
}

Matrix2Dd NoiseConstrainedDualRule::fit_residual(const Matrix2Dd& /*augmented_traces*/) const {
    return book_->residual();
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

std::unique_ptr<ComponentUpdateRule> make_update_rule(const TemporalParameters& params,
                                                      const solvers::SolverSet& solvers,
                                                      const std::optional<Matrix2Dd>& multipliers) {
    auto require = [&](bool present, const char* what) {
        if (!present) {
            throw ConfigError(std::string("method ") + update_method_to_string(params.method) +
                              " requires a " + what);
        }
    };

    switch (params.method) {
        case UpdateMethod::PROJECT:
            require(static_cast<bool>(solvers.projector), "trace projector");
            return std::make_unique<ProjectionRule>(params, solvers);
        case UpdateMethod::CONSTRAINED_FOOPSI:
            require(static_cast<bool>(solvers.deconvolver), "constrained deconvolver");
            return std::make_unique<ConstrainedDeconvolutionRule>(params, solvers);
        case UpdateMethod::MCEM_FOOPSI:
            require(static_cast<bool>(solvers.kernel_reestimator), "kernel re-estimator");
            return std::make_unique<MonteCarloRule>(params, solvers);
        case UpdateMethod::MCMC:
            require(static_cast<bool>(solvers.sampler), "posterior sampler");
            return std::make_unique<BayesianSamplingRule>(params, solvers);
        case UpdateMethod::NOISE_CONSTRAINED:
            require(static_cast<bool>(solvers.dual), "lagrangian dual solver");
            return std::make_unique<NoiseConstrainedDualRule>(params, solvers, multipliers);
    }
    throw ConfigError("unknown update method");
}

} // namespace temporal_update::update
