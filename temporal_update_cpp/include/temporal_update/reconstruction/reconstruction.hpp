#pragma once

#include "temporal_update/core/types.hpp"

#include <vector>

namespace temporal_update::reconstruction {

// Y - A C - b f
Matrix2Dd mixture_residual(const Matrix2Dd& observation,
                           const Matrix2Dd& footprints,
                           const VectorXd& background,
                           const Matrix2Dd& traces,
                           const VectorXd& background_trace);

// Scatter fit and excluded residual rows back to their original pixel indices.
Matrix2Dd merge_residual(int n_pixels,
                         const std::vector<int>& fit_pixels,
                         const Matrix2Dd& fit_residual,
                         const std::vector<int>& excluded_pixels,
                         const Matrix2Dd& excluded_residual);

} // namespace temporal_update::reconstruction
