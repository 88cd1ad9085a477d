#include "temporal_update/mixture/bookkeeper.hpp"
#include "temporal_update/core/errors.hpp"

#include <string>

namespace temporal_update::mixture {

Matrix2Dd augment_footprints(const Matrix2Dd& footprints, const VectorXd& background) {
    Matrix2Dd out(footprints.rows(), footprints.cols() + 1);
    out.leftCols(footprints.cols()) = footprints;
    out.col(footprints.cols()) = background;
    return out;
}

Matrix2Dd augment_traces(const Matrix2Dd& traces, const VectorXd& background_trace) {
    Matrix2Dd out(traces.rows() + 1, background_trace.size());
    out.topRows(traces.rows()) = traces;
    out.row(traces.rows()) = background_trace.transpose();
    return out;
}

CorrelationBookkeeper::CorrelationBookkeeper(const Matrix2Dd& observation,
                                             const Matrix2Dd& augmented_footprints,
                                             const Matrix2Dd& augmented_traces) {
    if (augmented_footprints.rows() != observation.rows() ||
        augmented_traces.rows() != augmented_footprints.cols() ||
        augmented_traces.cols() != observation.cols()) {
        throw ValidationError("correlation bookkeeping: inconsistent mixture shapes");
    }

    // Only full product of the call: (K+1) x d times d x T
    gram_ = augmented_footprints.transpose() * augmented_footprints;
    correlation_ = augmented_footprints.transpose() * observation;
    correlation_.noalias() -= gram_ * augmented_traces;
}

VectorXd CorrelationBookkeeper::isolate(int k, const VectorXd& current_trace) {
    if (k < 0 || k >= components() || current_trace.size() != correlation_.cols()) {
        throw ValidationError("correlation bookkeeping: bad component or trace length");
    }
    correlation_.row(k) += gram_(k, k) * current_trace.transpose();
    isolated_ = k;
    isolated_trace_ = current_trace;
    return correlation_.row(k).transpose() / gram_(k, k);
}

void CorrelationBookkeeper::reabsorb(int k, const VectorXd& new_trace) {
    if (k != isolated_) {
        throw ValidationError("correlation bookkeeping: component " + std::to_string(k) +
                              " was not isolated");
    }
    if (new_trace.size() != correlation_.cols()) {
        throw ValidationError("correlation bookkeeping: trace length mismatch");
    }
    correlation_.row(k) -= gram_(k, k) * isolated_trace_.transpose();
    const VectorXd delta = new_trace - isolated_trace_;
    correlation_.noalias() -= gram_.col(k) * delta.transpose();
    isolated_ = -1;
}

ResidualBookkeeper::ResidualBookkeeper(const Matrix2Dd& observation,
                                       const Matrix2Dd& augmented_footprints,
                                       const Matrix2Dd& augmented_traces)
    : footprints_(augmented_footprints) {
    if (augmented_footprints.rows() != observation.rows() ||
        augmented_traces.rows() != augmented_footprints.cols() ||
        augmented_traces.cols() != observation.cols()) {
        throw ValidationError("residual bookkeeping: inconsistent mixture shapes");
    }

    residual_ = observation;
    residual_.noalias() -= augmented_footprints * augmented_traces;
    squared_norms_ = augmented_footprints.colwise().squaredNorm().transpose();
}

void ResidualBookkeeper::add_back(int k, const VectorXd& trace) {
    residual_.noalias() += footprints_.col(k) * trace.transpose();
}

void ResidualBookkeeper::subtract_out(int k, const VectorXd& trace) {
    residual_.noalias() -= footprints_.col(k) * trace.transpose();
}

VectorXd ResidualBookkeeper::project(int k) const {
    return residual_.transpose() * footprints_.col(k) / squared_norms_[k];
}

Matrix2Dd ResidualBookkeeper::residual_rows(const std::vector<int>& rows) const {
    Matrix2Dd out(static_cast<Eigen::Index>(rows.size()), residual_.cols());
    for (size_t i = 0; i < rows.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) = residual_.row(rows[i]);
    }
    return out;
}

} // namespace temporal_update::mixture
