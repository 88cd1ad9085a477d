#pragma once

#include "temporal_update/core/types.hpp"
#include "temporal_update/kernel/ar_kernel.hpp"
#include "temporal_update/solvers/solver_interfaces.hpp"
#include "temporal_update/update/parameters.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

namespace temporal_update::testing {

// Three sources on disjoint pixel blocks plus an uneven background shape.
struct SyntheticMixture {
    TemporalProblem problem;    // zero initial traces
    Matrix2Dd true_traces;
    VectorXd true_background_trace;
    ArKernel kernel;
};

inline SyntheticMixture make_synthetic_mixture(int n_pixels = 20, int n_time = 50) {
    SyntheticMixture m;
    m.kernel.coefficients = {0.9};
    const int K = 3;

    Matrix2Dd A = Matrix2Dd::Zero(n_pixels, K);
    const int block = n_pixels / K;
    for (int p = 0; p < n_pixels; ++p) {
        const int k = std::min(p / block, K - 1);
        A(p, k) = 0.5 + 0.1 * static_cast<double>(p % block);
    }
    VectorXd b(n_pixels);
    for (int p = 0; p < n_pixels; ++p) {
        b[p] = 0.1 + 0.05 * static_cast<double>((3 * p) % 7);
    }

    const SparseMatrixd G = kernel::make_kernel_matrix(m.kernel, n_time);
    m.true_traces = Matrix2Dd::Zero(K, n_time);
    for (int k = 0; k < K; ++k) {
        VectorXd s = VectorXd::Zero(n_time);
        for (int t = 3 + 4 * k; t < n_time; t += 11 + 2 * k) {
            s[t] = 1.0 + 0.5 * static_cast<double>(k);
        }
        m.true_traces.row(k) = kernel::apply_kernel_inverse(G, s).transpose();
    }
    m.true_background_trace = VectorXd::Constant(n_time, 1.0);

    m.problem.observation = A * m.true_traces + b * m.true_background_trace.transpose();
    m.problem.footprints = A;
    m.problem.background_shape = b;
    m.problem.traces = Matrix2Dd::Zero(K, n_time);
    m.problem.background_trace = VectorXd::Zero(n_time);
    return m;
}

inline double relative_error(const Matrix2Dd& estimate, const Matrix2Dd& truth) {
    return (estimate - truth).norm() / truth.norm();
}

// Returns the isolated trace clipped at zero; kernel passed through.
class ClippingDeconvolver : public solvers::ConstrainedDeconvolver {
public:
    solvers::DeconvolutionResult deconvolve(const VectorXd& y,
                                            const solvers::DeconvolutionRequest& request) const override {
        ++calls;
        solvers::DeconvolutionResult out;
        out.trace = y.cwiseMax(0.0);
        if (request.kernel) out.kernel = *request.kernel;
        out.noise = 0.0;
        return out;
    }
    mutable int calls = 0;
};

class ThrowingDeconvolver : public solvers::ConstrainedDeconvolver {
public:
    solvers::DeconvolutionResult deconvolve(const VectorXd&,
                                            const solvers::DeconvolutionRequest&) const override {
        throw std::runtime_error("deconvolution did not converge");
    }
};

class TruncatingDeconvolver : public solvers::ConstrainedDeconvolver {
public:
    solvers::DeconvolutionResult deconvolve(const VectorXd& y,
                                            const solvers::DeconvolutionRequest&) const override {
        solvers::DeconvolutionResult out;
        out.trace = y.head(y.size() - 1);
        return out;
    }
};

// Clipped multiplier-weighted average; multipliers returned unchanged.
class AveragingDualSolver : public solvers::LagrangianDualSolver {
public:
    solvers::DualResult solve(const Matrix2Dd& residual_rows,
                              const VectorXd& weights,
                              const VectorXd& /*budgets*/,
                              const SparseMatrixd& /*G*/,
                              const VectorXd& multipliers) const override {
        const VectorXd lw = multipliers.cwiseProduct(weights);
        const double denom = lw.dot(weights);
        solvers::DualResult out;
        out.trace = (residual_rows.transpose() * lw / denom).cwiseMax(0.0);
        out.multipliers = multipliers;
        return out;
    }
};

inline TemporalParameters deterministic_parameters(const ArKernel& kernel) {
    TemporalParameters p;
    p.method = UpdateMethod::CONSTRAINED_FOOPSI;
    p.restimate_kernel = false;
    p.kernel.shared = kernel;
    p.sweep_order = SweepOrder::SEQUENTIAL;
    p.random_seed = 7;
    p.outer_iterations = 400;
    p.convergence_threshold = 1.0e-10;
    return p;
}

inline solvers::SolverSet clipping_solvers() {
    solvers::SolverSet set;
    set.deconvolver = std::make_shared<ClippingDeconvolver>();
    return set;
}

} // namespace temporal_update::testing
