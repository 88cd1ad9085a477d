#include "temporal_update/core/errors.hpp"
#include "temporal_update/kernel/ar_kernel.hpp"
#include "temporal_update/solvers/default_solvers.hpp"
#include "temporal_update/solvers/noise_estimation.hpp"

#include <algorithm>
#include <cmath>

namespace temporal_update::solvers {

NonnegativeProjector::NonnegativeProjector(const config::ProjectionConfig& cfg) {
    options_.max_iterations = cfg.max_iterations;
    options_.tolerance = cfg.tolerance;
    options_.fit_baseline = false;
    options_.fit_initial = false;
}

VectorXd NonnegativeProjector::project(const VectorXd& y, const SparseMatrixd& G) const {
    if (G.rows() != y.size() || G.cols() != y.size()) {
        throw ValidationError("projector: kernel matrix does not match trace length");
    }
    const VectorXd no_decay = VectorXd::Zero(y.size());
    return fit_event_train(y, G, no_decay, 0.0, options_).trace;
}

NoiseConstrainedDeconvolver::NoiseConstrainedDeconvolver(const config::DeconvolutionConfig& cfg)
    : cfg_(cfg) {}

double NoiseConstrainedDeconvolver::estimate_noise(const VectorXd& y) const {
    return estimate_noise_psd(y, cfg_.noise_freq_low, cfg_.noise_freq_high);
}

DeconvolutionResult NoiseConstrainedDeconvolver::deconvolve(const VectorXd& y,
                                                            const DeconvolutionRequest& request) const {
    if (y.size() < 2) {
        throw ValidationError("deconvolution needs at least two timesteps");
    }
    const double sn = estimate_noise(y);

    ArKernel g;
    if (request.kernel) {
        g = *request.kernel;
    } else {
        if (request.order < 1) {
            throw ValidationError("deconvolution: AR order must be >= 1 to estimate the kernel");
        }
        g = estimate_ar_coefficients(y, request.order, sn, cfg_.autocovariance_lags,
                                     request.fudge_factor);
    }
    if (g.empty()) {
        throw ValidationError("deconvolution: empty kernel");
    }
    return deconvolve_with_noise(y, g, sn);
}

DeconvolutionResult NoiseConstrainedDeconvolver::deconvolve_with_noise(const VectorXd& y,
                                                                       const ArKernel& kernel,
                                                                       double noise) const {
    const int T = static_cast<int>(y.size());
    const SparseMatrixd G = kernel::make_kernel_matrix(kernel, T);
    const VectorXd decay = kernel::decay_vector(kernel::dominant_root(kernel), T);

    EventFitOptions opt;
    opt.max_iterations = cfg_.max_iterations;
    opt.tolerance = cfg_.tolerance;
    opt.fit_baseline = true;
    opt.fit_initial = true;

    const double budget = noise * noise * static_cast<double>(T);

    EventFit best = fit_event_train(y, G, decay, 0.0, opt);
    if (best.residual_sq < budget) {
        // Smallest multiplier at which no events are needed
        const VectorXd centered = y.array() - y.mean();
        double hi = kernel::apply_kernel_inverse_transpose(G, centered).maxCoeff();
        double lo = 0.0;
        if (hi > 0.0) {
            EventFit last = best;
            for (int step = 0; step < cfg_.bisection_steps; ++step) {
                const double mid = 0.5 * (lo + hi);
                EventFit fit = fit_event_train(y, G, decay, mid, opt, &last);
                last = fit;
                if (fit.residual_sq <= budget) {
                    lo = mid;
                    best = fit;
                } else {
                    hi = mid;
                }
            }
        }
    }

    DeconvolutionResult out;
    out.trace = best.trace;
    out.baseline = best.baseline;
    out.initial_amplitude = best.initial_amplitude;
    out.kernel = kernel;
    out.noise = noise;
    return out;
}

} // namespace temporal_update::solvers
