#pragma once

#include "temporal_update/config/configuration.hpp"
#include "temporal_update/solvers/event_fit.hpp"
#include "temporal_update/solvers/solver_interfaces.hpp"

#include <memory>
#include <random>

namespace temporal_update::solvers {

// Nearest trace with a nonnegative event train, solved in the event domain.
class NonnegativeProjector : public TraceProjector {
public:
    explicit NonnegativeProjector(const config::ProjectionConfig& cfg = {});

    VectorXd project(const VectorXd& y, const SparseMatrixd& G) const override;

private:
    EventFitOptions options_;
};

/**
 * Noise-constrained deconvolution:
 *
 *   min sum(s)  s.t.  ||y - b - c1 gd^t - G^-1 s||^2 <= sn^2 T,  s >= 0, c1 >= 0
 *
 * sn comes from the power spectral density of y. The L1 multiplier is found by
 * bisection: each candidate is an unconstrained FISTA solve, and the largest
 * multiplier whose residual still meets the budget wins. If even the
 * unpenalized fit misses the budget it is returned as is.
 */
class NoiseConstrainedDeconvolver : public ConstrainedDeconvolver {
public:
    explicit NoiseConstrainedDeconvolver(const config::DeconvolutionConfig& cfg = {});

    DeconvolutionResult deconvolve(const VectorXd& y,
                                   const DeconvolutionRequest& request) const override;

    // Same problem with a known noise level.
    DeconvolutionResult deconvolve_with_noise(const VectorXd& y, const ArKernel& kernel,
                                              double noise) const;

    double estimate_noise(const VectorXd& y) const;

private:
    config::DeconvolutionConfig cfg_;
};

// Alternates fixed-kernel deconvolution with Metropolis-Hastings moves on the
// AR coefficients given the current event train.
class MonteCarloKernelReestimator : public KernelReestimator {
public:
    MonteCarloKernelReestimator(const config::DeconvolutionConfig& deconvolution,
                                const config::McemConfig& cfg);

    DeconvolutionResult deconvolve(const VectorXd& y,
                                   const DeconvolutionRequest& request) const override;

private:
    NoiseConstrainedDeconvolver deconvolver_;
    config::McemConfig cfg_;
};

// Gibbs sampler over event train, baseline, initial amplitude, noise variance
// and AR coefficients (Metropolis step).
class GibbsTraceSampler : public PosteriorSampler {
public:
    GibbsTraceSampler(const config::DeconvolutionConfig& deconvolution,
                      const config::McmcConfig& cfg);

    PosteriorSamples sample(const VectorXd& y, const SamplerRequest& request) const override;

private:
    config::DeconvolutionConfig deconvolution_;
    config::McmcConfig cfg_;
};

// Dual ascent on per-pixel noise constraints. The primal step projects the
// multiplier-weighted pixel average onto G c >= 0.
class ProjectedDualSolver : public LagrangianDualSolver {
public:
    ProjectedDualSolver(const config::DualConfig& cfg,
                        std::shared_ptr<const TraceProjector> projector);

    DualResult solve(const Matrix2Dd& residual_rows,
                     const VectorXd& weights,
                     const VectorXd& budgets,
                     const SparseMatrixd& G,
                     const VectorXd& multipliers) const override;

private:
    config::DualConfig cfg_;
    std::shared_ptr<const TraceProjector> projector_;
};

// Draw from N(mean, sd^2) truncated to [0, inf).
double sample_truncated_normal(double mean, double sd, std::mt19937_64& rng);

SolverSet make_default_solvers(const config::Config& cfg);

} // namespace temporal_update::solvers
