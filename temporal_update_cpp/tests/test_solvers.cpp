#include "temporal_update/config/configuration.hpp"
#include "temporal_update/kernel/ar_kernel.hpp"
#include "temporal_update/solvers/default_solvers.hpp"
#include "temporal_update/solvers/event_fit.hpp"
#include "temporal_update/solvers/noise_estimation.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <random>

using namespace temporal_update;

namespace {

VectorXd spike_trace(int T, const ArKernel& g) {
    VectorXd s = VectorXd::Zero(T);
    for (int t = 5; t < T; t += 37) s[t] = 1.0;
    return kernel::apply_kernel_inverse(kernel::make_kernel_matrix(g, T), s);
}

VectorXd white_noise(int T, double sd, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> normal(0.0, sd);
    VectorXd n(T);
    for (int t = 0; t < T; ++t) n[t] = normal(rng);
    return n;
}

} // namespace

TEST_CASE("projector_keeps_feasible_traces") {
    ArKernel g{{0.9}};
    const int T = 60;
    const VectorXd c = spike_trace(T, g);
    const SparseMatrixd G = kernel::make_kernel_matrix(g, T);

    solvers::NonnegativeProjector projector;
    const VectorXd out = projector.project(c, G);
    REQUIRE((out - c).norm() / c.norm() < 5.0e-2);
}

TEST_CASE("projector_output_has_nonnegative_events") {
    ArKernel g{{0.8}};
    const int T = 50;
    const SparseMatrixd G = kernel::make_kernel_matrix(g, T);
    const VectorXd y = spike_trace(T, g) + white_noise(T, 0.3, 3);

    solvers::NonnegativeProjector projector;
    const VectorXd out = projector.project(y, G);
    REQUIRE((G * out).minCoeff() >= -1.0e-9);
    // Never farther from y than the zero trace
    REQUIRE((out - y).norm() <= y.norm() + 1.0e-9);
}

TEST_CASE("psd_noise_estimate_is_log_mean_exp_of_white_noise") {
    // exp(E[log X]) = exp(-gamma) for unit-mean exponential periodogram bins
    const double euler_gamma = 0.5772156649015329;
    const double expected = 0.3 * std::exp(-0.5 * euler_gamma);
    for (std::uint64_t seed : {42u, 43u, 44u}) {
        const VectorXd n = white_noise(2000, 0.3, seed);
        REQUIRE(solvers::estimate_noise_psd(n) == Catch::Approx(expected).epsilon(0.12));
    }
}

TEST_CASE("psd_noise_estimate_is_robust_to_spike_power") {
    const int T = 2000;
    const VectorXd n = white_noise(T, 0.3, 5);
    VectorXd s = VectorXd::Zero(T);
    for (int t = 5; t < T; t += 37) s[t] = 3.0;
    const VectorXd c = kernel::apply_kernel_inverse(kernel::make_kernel_matrix(ArKernel{{0.9}}, T), s);

    const double noise_only = solvers::estimate_noise_psd(n);
    const double with_spikes = solvers::estimate_noise_psd(c + n);
    REQUIRE(with_spikes >= noise_only * 0.9);
    REQUIRE(with_spikes < noise_only * 1.2);

    REQUIRE(solvers::estimate_noise_psd(VectorXd::Constant(64, 2.0)) < 1.0e-6);
}

TEST_CASE("yule_walker_estimate_is_stable_and_respects_fudge") {
    ArKernel g{{0.9}};
    const int T = 1500;
    const VectorXd y = spike_trace(T, g) + white_noise(T, 0.05, 9);

    ArKernel est = solvers::estimate_ar_coefficients(y, 1, 0.05, 5, std::nullopt);
    REQUIRE(est.order() == 1);
    REQUIRE(est.coefficients[0] > 0.0);
    REQUIRE(est.coefficients[0] < 1.0);

    ArKernel fudged = solvers::estimate_ar_coefficients(y, 1, 0.05, 5, 0.5);
    REQUIRE(fudged.coefficients[0] == Catch::Approx(0.5 * est.coefficients[0]));
}

TEST_CASE("event_fit_without_penalty_reproduces_clean_trace") {
    ArKernel g{{0.9}};
    const int T = 80;
    const SparseMatrixd G = kernel::make_kernel_matrix(g, T);
    const VectorXd decay = kernel::decay_vector(0.9, T);
    const VectorXd y = spike_trace(T, g).array() + 0.4;

    solvers::EventFitOptions opt;
    opt.max_iterations = 2000;
    opt.tolerance = 1.0e-10;
    opt.fit_baseline = true;
    opt.fit_initial = true;
    const auto fit = solvers::fit_event_train(y, G, decay, 0.0, opt);

    REQUIRE(fit.events.minCoeff() >= 0.0);
    REQUIRE(fit.initial_amplitude >= 0.0);
    REQUIRE(fit.residual_sq < 1.0e-3 * y.squaredNorm());
}

TEST_CASE("constrained_deconvolution_meets_noise_budget") {
    ArKernel g{{0.9}};
    const int T = 300;
    const VectorXd y = spike_trace(T, g).array() + 0.2 + white_noise(T, 0.05, 5).array();

    solvers::NoiseConstrainedDeconvolver deconvolver;
    solvers::DeconvolutionRequest req;
    req.kernel = g;
    const auto res = deconvolver.deconvolve(y, req);

    REQUIRE(res.trace.size() == T);
    REQUIRE(res.kernel.coefficients == g.coefficients);
    REQUIRE(res.noise > 0.0);
    const SparseMatrixd G = kernel::make_kernel_matrix(g, T);
    REQUIRE((G * res.trace).minCoeff() >= -1.0e-9);
    REQUIRE(res.initial_amplitude >= 0.0);
}

TEST_CASE("constrained_deconvolution_estimates_kernel_from_order") {
    ArKernel g{{0.9}};
    const int T = 400;
    const VectorXd y = spike_trace(T, g) + white_noise(T, 0.05, 6);

    solvers::NoiseConstrainedDeconvolver deconvolver;
    solvers::DeconvolutionRequest req;
    req.order = 2;
    const auto res = deconvolver.deconvolve(y, req);
    REQUIRE(res.kernel.order() == 2);

    solvers::DeconvolutionRequest no_order;
    REQUIRE_THROWS(deconvolver.deconvolve(y, no_order));
}

TEST_CASE("kernel_reestimator_is_reproducible_for_a_seed") {
    ArKernel g{{0.85}};
    const int T = 120;
    const VectorXd y = spike_trace(T, g) + white_noise(T, 0.05, 8);

    config::DeconvolutionConfig dcfg;
    dcfg.max_iterations = 100;
    dcfg.bisection_steps = 6;
    config::McemConfig mcfg;
    mcfg.iterations = 2;
    mcfg.mh_steps = 10;
    solvers::MonteCarloKernelReestimator reestimator(dcfg, mcfg);

    solvers::DeconvolutionRequest req;
    req.kernel = g;
    req.seed = 99;
    const auto a = reestimator.deconvolve(y, req);
    const auto b = reestimator.deconvolve(y, req);

    REQUIRE(a.kernel.coefficients == b.kernel.coefficients);
    REQUIRE(a.trace == b.trace);
    REQUIRE(kernel::is_stable(a.kernel));
}

TEST_CASE("gibbs_sampler_returns_requested_sample_count") {
    ArKernel g{{0.9}};
    const int T = 40;
    const VectorXd y = spike_trace(T, g).array() + 0.1 + white_noise(T, 0.05, 10).array();

    config::McmcConfig mcfg;
    solvers::GibbsTraceSampler sampler(config::DeconvolutionConfig{}, mcfg);
    solvers::SamplerRequest req;
    req.kernel = g;
    req.samples = 15;
    req.burn_in = 5;
    req.seed = 3;
    const auto samples = sampler.sample(y, req);

    REQUIRE(samples.traces.size() == 15);
    REQUIRE(samples.baselines.size() == 15);
    REQUIRE(samples.kernels.size() == 15);
    for (size_t i = 0; i < samples.traces.size(); ++i) {
        REQUIRE(samples.traces[i].size() == T);
        REQUIRE(samples.noise_variances[i] > 0.0);
        REQUIRE(samples.initial_amplitudes[i] >= 0.0);
        REQUIRE(kernel::is_stable(samples.kernels[i]));
    }
}

TEST_CASE("truncated_normal_draws_are_nonnegative") {
    std::mt19937_64 rng(17);
    double sum = 0.0;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
        const double v = solvers::sample_truncated_normal(2.0, 1.0, rng);
        REQUIRE(v >= 0.0);
        sum += v;
    }
    // E[X | X >= 0] for N(2, 1)
    REQUIRE(sum / n == Catch::Approx(2.055).margin(0.05));

    for (int i = 0; i < 1000; ++i) {
        REQUIRE(solvers::sample_truncated_normal(-3.0, 0.5, rng) >= 0.0);
    }
}

TEST_CASE("dual_solver_returns_nonnegative_trace_and_multipliers") {
    ArKernel g{{0.9}};
    const int T = 60;
    const SparseMatrixd G = kernel::make_kernel_matrix(g, T);
    const VectorXd c = spike_trace(T, g);

    Matrix2Dd rows(3, T);
    VectorXd weights(3);
    weights << 1.0, 0.6, 0.3;
    for (int i = 0; i < 3; ++i) {
        rows.row(i) = (weights[i] * c + white_noise(T, 0.02, 20 + i)).transpose();
    }
    const VectorXd budgets = VectorXd::Constant(3, T * 0.02 * 0.02);

    auto projector = std::make_shared<solvers::NonnegativeProjector>();
    solvers::ProjectedDualSolver dual(config::DualConfig{}, projector);
    const auto res = dual.solve(rows, weights, budgets, G, VectorXd::Constant(3, 10.0));

    REQUIRE(res.trace.size() == T);
    REQUIRE(res.trace.minCoeff() >= 0.0);
    REQUIRE(res.multipliers.size() == 3);
    REQUIRE(res.multipliers.minCoeff() >= 0.0);
    REQUIRE((res.trace - c).norm() / c.norm() < 0.5);
}

TEST_CASE("default_solver_set_is_complete") {
    const auto set = solvers::make_default_solvers(config::Config{});
    REQUIRE(set.projector);
    REQUIRE(set.deconvolver);
    REQUIRE(set.kernel_reestimator);
    REQUIRE(set.sampler);
    REQUIRE(set.dual);
}
