#include "temporal_update/solvers/event_fit.hpp"
#include "temporal_update/kernel/ar_kernel.hpp"

#include <algorithm>
#include <cmath>

namespace temporal_update::solvers {

namespace {

struct EventState {
    VectorXd s;
    double b = 0.0;
    double c1 = 0.0;
};

VectorXd forward(const SparseMatrixd& G, const VectorXd& decay, const EventState& x,
                 const EventFitOptions& opt) {
    VectorXd out = kernel::apply_kernel_inverse(G, x.s);
    if (opt.fit_baseline) out.array() += x.b;
    if (opt.fit_initial) out += x.c1 * decay;
    return out;
}

double state_norm(const EventState& x) {
    return std::sqrt(x.s.squaredNorm() + x.b * x.b + x.c1 * x.c1);
}

} // namespace

double event_operator_lipschitz(const SparseMatrixd& G, const VectorXd& decay,
                                const EventFitOptions& options) {
    const int T = static_cast<int>(G.rows());
    EventState v;
    v.s = VectorXd::Ones(T);
    v.b = options.fit_baseline ? 1.0 : 0.0;
    v.c1 = options.fit_initial ? 1.0 : 0.0;

    double lambda_max = 1.0;
    for (int it = 0; it < 30; ++it) {
        const double n = state_norm(v);
        if (!(n > 0.0)) break;
        v.s /= n;
        v.b /= n;
        v.c1 /= n;

        const VectorXd mv = forward(G, decay, v, options);
        EventState w;
        w.s = kernel::apply_kernel_inverse_transpose(G, mv);
        w.b = options.fit_baseline ? mv.sum() : 0.0;
        w.c1 = options.fit_initial ? decay.dot(mv) : 0.0;
        lambda_max = state_norm(w);
        v = w;
    }
    // Power iteration underestimates; pad the step bound
    return 1.1 * lambda_max;
}

EventFit fit_event_train(const VectorXd& y,
                         const SparseMatrixd& G,
                         const VectorXd& decay,
                         double lambda,
                         const EventFitOptions& options,
                         const EventFit* warm_start) {
    const int T = static_cast<int>(y.size());
    const double L = std::max(event_operator_lipschitz(G, decay, options), 1.0e-12);
    const double step = 1.0 / L;

    EventState x;
    if (warm_start && warm_start->events.size() == T) {
        x.s = warm_start->events;
        x.b = warm_start->baseline;
        x.c1 = warm_start->initial_amplitude;
    } else {
        x.s = VectorXd::Zero(T);
        x.b = options.fit_baseline ? y.mean() : 0.0;
        x.c1 = 0.0;
    }
    if (!options.fit_baseline) x.b = 0.0;
    if (!options.fit_initial) x.c1 = 0.0;

    EventState z = x;
    double t = 1.0;
    int it = 0;
    for (; it < options.max_iterations; ++it) {
        const VectorXd r = forward(G, decay, z, options) - y;

        EventState next;
        next.s = (z.s - step * (kernel::apply_kernel_inverse_transpose(G, r).array() + lambda).matrix())
                     .cwiseMax(0.0);
        next.b = options.fit_baseline ? z.b - step * r.sum() : 0.0;
        next.c1 = options.fit_initial ? std::max(0.0, z.c1 - step * decay.dot(r)) : 0.0;

        const double t_next = 0.5 * (1.0 + std::sqrt(1.0 + 4.0 * t * t));
        const double momentum = (t - 1.0) / t_next;

        EventState delta;
        delta.s = next.s - x.s;
        delta.b = next.b - x.b;
        delta.c1 = next.c1 - x.c1;

        z.s = next.s + momentum * delta.s;
        z.b = next.b + momentum * delta.b;
        z.c1 = next.c1 + momentum * delta.c1;
        x = next;
        t = t_next;

        if (state_norm(delta) <= options.tolerance * std::max(1.0, state_norm(x))) {
            ++it;
            break;
        }
    }

    EventFit fit;
    fit.events = x.s;
    fit.trace = kernel::apply_kernel_inverse(G, x.s);
    fit.baseline = x.b;
    fit.initial_amplitude = x.c1;
    VectorXd model = fit.trace;
    if (options.fit_baseline) model.array() += x.b;
    if (options.fit_initial) model += x.c1 * decay;
    fit.residual_sq = (y - model).squaredNorm();
    fit.iterations = it;
    return fit;
}

} // namespace temporal_update::solvers
