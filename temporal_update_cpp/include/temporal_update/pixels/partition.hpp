#pragma once

#include "temporal_update/core/types.hpp"

#include <optional>
#include <vector>

namespace temporal_update::pixels {

// Observation, footprints and background split into the rows used for the fit
// (unsaturated pixels) and the rows only reconstructed afterwards.
struct PixelPartition {
    int n_pixels = 0;
    std::vector<int> fit_pixels;       // original pixel indices, caller order
    std::vector<int> excluded_pixels;  // ascending

    Matrix2Dd fit_observation;
    Matrix2Dd fit_footprints;
    VectorXd fit_background;

    Matrix2Dd excluded_observation;
    Matrix2Dd excluded_footprints;
    VectorXd excluded_background;
};

// Overwrites every stored entry of the (pixels x time) interpolation map.
// An empty (0 x 0) map leaves the observation unchanged.
Matrix2Dd apply_interpolation(const Matrix2Dd& observation, const SparseMatrixd& interpolation);

// Pixels in [0, n_pixels) that are not listed as unsaturated.
std::vector<int> excluded_pixel_indices(int n_pixels, const std::vector<int>& unsaturated);

// Throws ValidationError for out-of-range or duplicate indices or an empty list.
void validate_pixel_indices(int n_pixels, const std::vector<int>& unsaturated);

Matrix2Dd select_rows(const Matrix2Dd& m, const std::vector<int>& rows);
VectorXd select_rows(const VectorXd& v, const std::vector<int>& rows);

PixelPartition partition_pixels(const Matrix2Dd& observation,
                                const Matrix2Dd& footprints,
                                const VectorXd& background,
                                const std::optional<std::vector<int>>& unsaturated);

} // namespace temporal_update::pixels
