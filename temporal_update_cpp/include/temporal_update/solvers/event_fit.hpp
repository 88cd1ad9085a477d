#pragma once

#include "temporal_update/core/types.hpp"

namespace temporal_update::solvers {

struct EventFitOptions {
    int max_iterations = 300;
    double tolerance = 1.0e-6;
    bool fit_baseline = false;
    bool fit_initial = false;
};

struct EventFit {
    VectorXd events;  // s >= 0
    VectorXd trace;   // G^-1 s
    double baseline = 0.0;
    double initial_amplitude = 0.0;
    double residual_sq = 0.0;
    int iterations = 0;
};

// Accelerated projected gradient (FISTA) for
//
//   min 1/2 ||y - G^-1 s - b - c1 d||^2 + lambda * sum(s),  s >= 0, c1 >= 0
//
// b and c1 take part only when enabled in the options; d is the initial
// condition decay (ignored when fit_initial is false).
EventFit fit_event_train(const VectorXd& y,
                         const SparseMatrixd& G,
                         const VectorXd& decay,
                         double lambda,
                         const EventFitOptions& options,
                         const EventFit* warm_start = nullptr);

// Largest eigenvalue of M^T M for M = [G^-1, 1, d] (power iteration).
double event_operator_lipschitz(const SparseMatrixd& G, const VectorXd& decay,
                                const EventFitOptions& options);

} // namespace temporal_update::solvers
