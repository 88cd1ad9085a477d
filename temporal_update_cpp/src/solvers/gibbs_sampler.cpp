#include "temporal_update/core/errors.hpp"
#include "temporal_update/kernel/ar_kernel.hpp"
#include "temporal_update/solvers/default_solvers.hpp"
#include "temporal_update/solvers/noise_estimation.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace temporal_update::solvers {

double sample_truncated_normal(double mean, double sd, std::mt19937_64& rng) {
    if (!std::isfinite(mean) || !std::isfinite(sd)) {
        throw std::invalid_argument("truncated normal with non-finite mean or scale");
    }
    if (!(sd > 0.0)) return std::max(mean, 0.0);

    std::uniform_real_distribution<double> unif(0.0, 1.0);
    const double alpha = -mean / sd;

    if (alpha < 0.5) {
        // Acceptance >= 0.3
        std::normal_distribution<double> normal(0.0, 1.0);
        for (;;) {
            const double z = normal(rng);
            if (z >= alpha) return mean + sd * z;
        }
    }

    // Robert (1995) exponential proposal for the far tail
    const double lambda = 0.5 * (alpha + std::sqrt(alpha * alpha + 4.0));
    std::exponential_distribution<double> expo(lambda);
    for (;;) {
        const double z = alpha + expo(rng);
        const double rho = std::exp(-0.5 * (z - lambda) * (z - lambda));
        if (unif(rng) <= rho) return mean + sd * z;
    }
}

namespace {

struct KernelState {
    ArKernel g;
    SparseMatrixd G;
    VectorXd impulse;   // response to a unit event at t = 0
    VectorXd head_sq;   // head_sq[n] = ||impulse.head(n)||^2
    VectorXd decay;
    int support = 0;    // impulse samples above round-off
};

KernelState make_kernel_state(const ArKernel& g, int T) {
    KernelState k;
    k.g = g;
    k.G = kernel::make_kernel_matrix(g, T);
    VectorXd e0 = VectorXd::Zero(T);
    e0[0] = 1.0;
    k.impulse = kernel::apply_kernel_inverse(k.G, e0);
    k.decay = kernel::decay_vector(kernel::dominant_root(g), T);

    const double peak = k.impulse.cwiseAbs().maxCoeff();
    k.support = T;
    while (k.support > 1 && std::abs(k.impulse[k.support - 1]) < 1.0e-12 * peak) {
        --k.support;
    }

    k.head_sq.resize(T + 1);
    k.head_sq[0] = 0.0;
    for (int j = 0; j < T; ++j) {
        k.head_sq[j + 1] = k.head_sq[j] + k.impulse[j] * k.impulse[j];
    }
    return k;
}

// y - b - c1 d - G^-1 s
VectorXd model_residual(const VectorXd& y, const KernelState& k, const VectorXd& events,
                        double baseline, double initial_amplitude) {
    VectorXd r = y - kernel::apply_kernel_inverse(k.G, events);
    r.array() -= baseline;
    r -= initial_amplitude * k.decay;
    return r;
}

} // namespace

GibbsTraceSampler::GibbsTraceSampler(const config::DeconvolutionConfig& deconvolution,
                                     const config::McmcConfig& cfg)
    : deconvolution_(deconvolution), cfg_(cfg) {}

PosteriorSamples GibbsTraceSampler::sample(const VectorXd& y, const SamplerRequest& request) const {
    const int T = static_cast<int>(y.size());
    if (T < 2) {
        throw ValidationError("sampler needs at least two timesteps");
    }
    if (request.kernel.empty()) {
        throw ValidationError("sampler: empty kernel");
    }
    if (request.samples < 1 || request.burn_in < 0) {
        throw ValidationError("sampler: samples must be >= 1 and burn-in >= 0");
    }

    std::mt19937_64 rng(request.seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    std::uniform_real_distribution<double> unif(0.0, 1.0);

    KernelState k = make_kernel_state(request.kernel, T);

    // Start from the unpenalized nonnegative fit
    EventFitOptions opt;
    opt.max_iterations = deconvolution_.max_iterations;
    opt.tolerance = deconvolution_.tolerance;
    opt.fit_baseline = true;
    opt.fit_initial = true;
    const EventFit init = fit_event_train(y, k.G, k.decay, 0.0, opt);

    VectorXd s = init.events;
    double b = init.baseline;
    double c1 = init.initial_amplitude;
    const double sn = estimate_noise_psd(y, deconvolution_.noise_freq_low,
                                         deconvolution_.noise_freq_high);
    double sigma2 = std::max(sn * sn, 1.0e-12);

    VectorXd r = model_residual(y, k, s, b, c1);

    PosteriorSamples out;
    const int total = request.burn_in + request.samples;
    out.traces.reserve(static_cast<size_t>(request.samples));

    for (int iter = 0; iter < total; ++iter) {
        const double sd_scale = std::sqrt(sigma2);

        // Event train, one site at a time
        for (int t = 0; t < T; ++t) {
            const int len = std::min(T - t, k.support);
            const double h2 = k.head_sq[len];
            if (!(h2 > 0.0)) continue;
            auto seg = r.segment(t, len);
            const auto h = k.impulse.head(len);

            seg += s[t] * h;
            const double mean = (h.dot(seg) - sigma2 * cfg_.spike_prior_rate) / h2;
            s[t] = sample_truncated_normal(mean, sd_scale / std::sqrt(h2), rng);
            seg -= s[t] * h;
        }

        // Baseline
        r.array() += b;
        b = r.mean() + sd_scale / std::sqrt(static_cast<double>(T)) * normal(rng);
        r.array() -= b;

        // Initial amplitude
        const double d2 = k.decay.squaredNorm();
        if (d2 > 0.0) {
            r += c1 * k.decay;
            c1 = sample_truncated_normal(k.decay.dot(r) / d2, sd_scale / std::sqrt(d2), rng);
            r -= c1 * k.decay;
        }

        // Noise variance, inverse gamma
        {
            const double shape = cfg_.noise_prior_shape + 0.5 * static_cast<double>(T);
            const double rate = cfg_.noise_prior_rate + 0.5 * r.squaredNorm();
            std::gamma_distribution<double> gamma(shape, 1.0);
            sigma2 = std::max(rate / gamma(rng), 1.0e-12);
        }

        // AR coefficients, random-walk Metropolis
        {
            ArKernel proposal = k.g;
            for (double& c : proposal.coefficients) {
                c += cfg_.proposal_scale * normal(rng);
            }
            if (kernel::is_stable(proposal)) {
                KernelState kp = make_kernel_state(proposal, T);
                VectorXd rp = model_residual(y, kp, s, b, c1);
                const double log_ratio = (r.squaredNorm() - rp.squaredNorm()) / (2.0 * sigma2);
                if (log_ratio >= 0.0 || std::log(unif(rng)) < log_ratio) {
                    k = std::move(kp);
                    r = std::move(rp);
                }
            }
        }

        if (iter >= request.burn_in) {
            out.traces.push_back(y - r);
            out.baselines.push_back(b);
            out.initial_amplitudes.push_back(c1);
            out.noise_variances.push_back(sigma2);
            out.kernels.push_back(k.g);
        }
    }
    return out;
}

} // namespace temporal_update::solvers
