#include "temporal_update/core/errors.hpp"
#include "temporal_update/solvers/default_solvers.hpp"

#include <algorithm>
#include <cmath>

namespace temporal_update::solvers {

ProjectedDualSolver::ProjectedDualSolver(const config::DualConfig& cfg,
                                         std::shared_ptr<const TraceProjector> projector)
    : cfg_(cfg), projector_(std::move(projector)) {
    if (!projector_) {
        throw ConfigError("dual solver requires a trace projector");
    }
}

DualResult ProjectedDualSolver::solve(const Matrix2Dd& residual_rows,
                                      const VectorXd& weights,
                                      const VectorXd& budgets,
                                      const SparseMatrixd& G,
                                      const VectorXd& multipliers) const {
    const int m = static_cast<int>(residual_rows.rows());
    const int T = static_cast<int>(residual_rows.cols());
    if (weights.size() != m || budgets.size() != m || multipliers.size() != m) {
        throw ValidationError("dual solver: pixel count mismatch");
    }
    if (G.rows() != T || G.cols() != T) {
        throw ValidationError("dual solver: kernel matrix does not match trace length");
    }

    // d/dc sum(G c) = G^T 1
    const VectorXd cost = G.transpose() * VectorXd::Ones(T);

    DualResult out;
    out.multipliers = multipliers.cwiseMax(0.0);
    out.trace = VectorXd::Zero(T);

    for (int it = 0; it < cfg_.iterations; ++it) {
        VectorXd lam = out.multipliers;
        double denom = lam.dot(weights.cwiseAbs2());
        if (!(denom > 0.0)) {
            lam = VectorXd::Ones(m);
            denom = weights.squaredNorm();
        }
        if (!(denom > 0.0)) break;

        const VectorXd weighted = residual_rows.transpose() * lam.cwiseProduct(weights);
        const VectorXd target = (weighted - 0.5 * cost) / denom;
        out.trace = projector_->project(target, G).cwiseMax(0.0);

        for (int i = 0; i < m; ++i) {
            const double misfit = (residual_rows.row(i).transpose() - weights[i] * out.trace).squaredNorm();
            const double violation = misfit - budgets[i];
            const double scale = std::max(budgets[i], 1.0e-12);
            out.multipliers[i] = std::max(0.0, out.multipliers[i] + cfg_.step * violation / scale);
        }
    }
    return out;
}

SolverSet make_default_solvers(const config::Config& cfg) {
    SolverSet set;
    auto projector = std::make_shared<NonnegativeProjector>(cfg.projection);
    set.projector = projector;
    set.deconvolver = std::make_shared<NoiseConstrainedDeconvolver>(cfg.deconvolution);
    set.kernel_reestimator = std::make_shared<MonteCarloKernelReestimator>(cfg.deconvolution, cfg.mcem);
    set.sampler = std::make_shared<GibbsTraceSampler>(cfg.deconvolution, cfg.mcmc);
    set.dual = std::make_shared<ProjectedDualSolver>(cfg.dual, projector);
    return set;
}

} // namespace temporal_update::solvers
