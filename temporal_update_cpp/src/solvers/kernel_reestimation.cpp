#include "temporal_update/core/errors.hpp"
#include "temporal_update/kernel/ar_kernel.hpp"
#include "temporal_update/solvers/default_solvers.hpp"
#include "temporal_update/solvers/noise_estimation.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace temporal_update::solvers {

namespace {

// Residual energy of y under kernel g with the event train held fixed.
double residual_energy(const VectorXd& y, const VectorXd& events, const ArKernel& g,
                       double baseline, double initial_amplitude) {
    const int T = static_cast<int>(y.size());
    const SparseMatrixd G = kernel::make_kernel_matrix(g, T);
    VectorXd model = kernel::apply_kernel_inverse(G, events);
    model.array() += baseline;
    model += initial_amplitude * kernel::decay_vector(kernel::dominant_root(g), T);
    return (y - model).squaredNorm();
}

} // namespace

MonteCarloKernelReestimator::MonteCarloKernelReestimator(
    const config::DeconvolutionConfig& deconvolution, const config::McemConfig& cfg)
    : deconvolver_(deconvolution), cfg_(cfg) {}

DeconvolutionResult MonteCarloKernelReestimator::deconvolve(const VectorXd& y,
                                                            const DeconvolutionRequest& request) const {
    const int T = static_cast<int>(y.size());
    std::mt19937_64 rng(request.seed);
    std::normal_distribution<double> step(0.0, cfg_.proposal_scale);
    std::uniform_real_distribution<double> unif(0.0, 1.0);

    DeconvolutionResult res = deconvolver_.deconvolve(y, request);
    const double sigma2 = std::max(res.noise * res.noise, 1.0e-12);

    ArKernel g = res.kernel;
    for (int iter = 0; iter < cfg_.iterations; ++iter) {
        const SparseMatrixd G = kernel::make_kernel_matrix(g, T);
        const VectorXd events = G * res.trace;

        double energy = residual_energy(y, events, g, res.baseline, res.initial_amplitude);
        for (int m = 0; m < cfg_.mh_steps; ++m) {
            ArKernel proposal = g;
            for (double& c : proposal.coefficients) {
                c += step(rng);
            }
            if (!kernel::is_stable(proposal)) continue;

            const double e_new = residual_energy(y, events, proposal, res.baseline,
                                                 res.initial_amplitude);
            const double log_ratio = (energy - e_new) / (2.0 * sigma2);
            if (log_ratio >= 0.0 || std::log(unif(rng)) < log_ratio) {
                g = proposal;
                energy = e_new;
            }
        }
        res = deconvolver_.deconvolve_with_noise(y, g, res.noise);
    }
    return res;
}

} // namespace temporal_update::solvers
