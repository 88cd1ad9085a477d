#include "temporal_update/reconstruction/reconstruction.hpp"
#include "temporal_update/core/errors.hpp"

namespace temporal_update::reconstruction {

Matrix2Dd mixture_residual(const Matrix2Dd& observation,
                           const Matrix2Dd& footprints,
                           const VectorXd& background,
                           const Matrix2Dd& traces,
                           const VectorXd& background_trace) {
    Matrix2Dd residual = observation;
    if (observation.rows() == 0) {
        return residual;
    }
    residual.noalias() -= footprints * traces;
    residual.noalias() -= background * background_trace.transpose();
    return residual;
}

Matrix2Dd merge_residual(int n_pixels,
                         const std::vector<int>& fit_pixels,
                         const Matrix2Dd& fit_residual,
                         const std::vector<int>& excluded_pixels,
                         const Matrix2Dd& excluded_residual) {
    if (static_cast<int>(fit_pixels.size() + excluded_pixels.size()) != n_pixels ||
        fit_residual.rows() != static_cast<Eigen::Index>(fit_pixels.size()) ||
        excluded_residual.rows() != static_cast<Eigen::Index>(excluded_pixels.size())) {
        throw ValidationError("residual partition does not cover the pixel set");
    }

    const Eigen::Index T = fit_residual.cols();
    Matrix2Dd out(n_pixels, T);
    for (size_t i = 0; i < fit_pixels.size(); ++i) {
        out.row(fit_pixels[i]) = fit_residual.row(static_cast<Eigen::Index>(i));
    }
    for (size_t i = 0; i < excluded_pixels.size(); ++i) {
        out.row(excluded_pixels[i]) = excluded_residual.row(static_cast<Eigen::Index>(i));
    }
    return out;
}

} // namespace temporal_update::reconstruction
