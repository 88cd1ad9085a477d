#pragma once

#include "temporal_update/core/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace temporal_update::solvers {

struct DeconvolutionRequest {
    std::optional<ArKernel> kernel;  // held fixed when set, estimated otherwise
    int order = 0;                   // AR order used when estimating
    std::optional<double> fudge_factor;
    std::uint64_t seed = 0;
};

struct DeconvolutionResult {
    VectorXd trace;  // event-driven part, G * trace >= 0
    double baseline = 0.0;
    double initial_amplitude = 0.0;
    ArKernel kernel;
    double noise = 0.0;
};

struct SamplerRequest {
    ArKernel kernel;
    int samples = 400;
    int burn_in = 300;
    std::uint64_t seed = 0;
};

// Retained (post burn-in) samples; traces include baseline and initial decay.
struct PosteriorSamples {
    std::vector<VectorXd> traces;
    std::vector<double> baselines;
    std::vector<double> initial_amplitudes;
    std::vector<double> noise_variances;
    std::vector<ArKernel> kernels;
};

struct DualResult {
    VectorXd trace;
    VectorXd multipliers;
};

// min ||c - y||^2 subject to G c >= 0
class TraceProjector {
public:
    virtual ~TraceProjector() = default;
    virtual VectorXd project(const VectorXd& y, const SparseMatrixd& G) const = 0;
};

// min sum(G c) subject to G c >= 0, ||y - c - b - c1 gd^t|| <= sn sqrt(T)
class ConstrainedDeconvolver {
public:
    virtual ~ConstrainedDeconvolver() = default;
    virtual DeconvolutionResult deconvolve(const VectorXd& y,
                                           const DeconvolutionRequest& request) const = 0;
};

// Deconvolution with Monte-Carlo re-estimation of the kernel.
class KernelReestimator {
public:
    virtual ~KernelReestimator() = default;
    virtual DeconvolutionResult deconvolve(const VectorXd& y,
                                           const DeconvolutionRequest& request) const = 0;
};

class PosteriorSampler {
public:
    virtual ~PosteriorSampler() = default;
    virtual PosteriorSamples sample(const VectorXd& y, const SamplerRequest& request) const = 0;
};

// Per-pixel noise-constrained fit of one component over a pixel subset.
// residual_rows: m x T, weights: footprint values of those pixels,
// budgets: T * sn_i^2, multipliers: warm-start dual variables (m).
class LagrangianDualSolver {
public:
    virtual ~LagrangianDualSolver() = default;
    virtual DualResult solve(const Matrix2Dd& residual_rows,
                             const VectorXd& weights,
                             const VectorXd& budgets,
                             const SparseMatrixd& G,
                             const VectorXd& multipliers) const = 0;
};

struct SolverSet {
    std::shared_ptr<const TraceProjector> projector;
    std::shared_ptr<const ConstrainedDeconvolver> deconvolver;
    std::shared_ptr<const KernelReestimator> kernel_reestimator;
    std::shared_ptr<const PosteriorSampler> sampler;
    std::shared_ptr<const LagrangianDualSolver> dual;
};

} // namespace temporal_update::solvers
