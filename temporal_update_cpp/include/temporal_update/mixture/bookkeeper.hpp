#pragma once

#include "temporal_update/core/types.hpp"

#include <vector>

namespace temporal_update::mixture {

// Appends the background shape as the last footprint column.
Matrix2Dd augment_footprints(const Matrix2Dd& footprints, const VectorXd& background);

// Appends the background trace as the last row.
Matrix2Dd augment_traces(const Matrix2Dd& traces, const VectorXd& background_trace);

/**
 * Correlation of the residual against every footprint,
 *
 *   R = A^T Y - (A^T A) C,
 *
 * stored one row per component. isolate(k) adds component k's own term back
 * into row k and remembers the trace it removed; reabsorb(k) takes row k back
 * out and applies the rank-one change gram(:, k) (new - old)^T to every row,
 * so R always matches the current C. Both are O(K T) per call.
 */
class CorrelationBookkeeper {
public:
    CorrelationBookkeeper(const Matrix2Dd& observation,
                          const Matrix2Dd& augmented_footprints,
                          const Matrix2Dd& augmented_traces);

    int components() const { return static_cast<int>(correlation_.rows()); }
    int timesteps() const { return static_cast<int>(correlation_.cols()); }
    double squared_norm(int k) const { return gram_(k, k); }

    // a_k^T (Y - sum_{j != k} a_j c_j) / ||a_k||^2
    VectorXd isolate(int k, const VectorXd& current_trace);
    // Must follow isolate() for the same component.
    void reabsorb(int k, const VectorXd& new_trace);

    const Matrix2Dd& correlation() const { return correlation_; }
    const Eigen::MatrixXd& gram() const { return gram_; }

private:
    Matrix2Dd correlation_;  // (K+1) x T
    Eigen::MatrixXd gram_;   // (K+1) x (K+1)
    int isolated_ = -1;
    VectorXd isolated_trace_;
};

/**
 * Explicit residual Y - A C over the fit partition, updated one rank-one
 * term at a time. Used by the noise-constrained dual rule, which needs the
 * residual rows of individual pixels rather than a projected trace.
 */
class ResidualBookkeeper {
public:
    ResidualBookkeeper(const Matrix2Dd& observation,
                       const Matrix2Dd& augmented_footprints,
                       const Matrix2Dd& augmented_traces);

    int components() const { return static_cast<int>(footprints_.cols()); }
    double squared_norm(int k) const { return squared_norms_[k]; }

    void add_back(int k, const VectorXd& trace);
    void subtract_out(int k, const VectorXd& trace);

    // a_k^T R / ||a_k||^2
    VectorXd project(int k) const;

    Matrix2Dd residual_rows(const std::vector<int>& rows) const;
    const Matrix2Dd& residual() const { return residual_; }
    const Matrix2Dd& footprints() const { return footprints_; }

private:
    Matrix2Dd residual_;    // pixels x T
    Matrix2Dd footprints_;  // pixels x (K+1)
    VectorXd squared_norms_;
};

} // namespace temporal_update::mixture
