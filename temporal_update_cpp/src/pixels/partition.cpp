#include "temporal_update/pixels/partition.hpp"
#include "temporal_update/core/errors.hpp"

#include <numeric>

namespace temporal_update::pixels {

Matrix2Dd apply_interpolation(const Matrix2Dd& observation, const SparseMatrixd& interpolation) {
    Matrix2Dd out = observation;
    if (interpolation.rows() == 0 && interpolation.cols() == 0) {
        return out;
    }
    if (interpolation.rows() != observation.rows() || interpolation.cols() != observation.cols()) {
        throw ValidationError("interpolation map must be " +
                              std::to_string(observation.rows()) + "x" +
                              std::to_string(observation.cols()));
    }

    for (int k = 0; k < interpolation.outerSize(); ++k) {
        for (SparseMatrixd::InnerIterator it(interpolation, k); it; ++it) {
            out(it.row(), it.col()) = it.value();
        }
    }
    return out;
}

void validate_pixel_indices(int n_pixels, const std::vector<int>& unsaturated) {
    if (unsaturated.empty()) {
        throw ValidationError("unsaturated pixel list is empty; nothing to fit");
    }
    std::vector<bool> seen(static_cast<size_t>(n_pixels), false);
    for (int p : unsaturated) {
        if (p < 0 || p >= n_pixels) {
            throw ValidationError("unsaturated pixel index " + std::to_string(p) +
                                  " out of range [0," + std::to_string(n_pixels) + ")");
        }
        if (seen[static_cast<size_t>(p)]) {
            throw ValidationError("duplicate unsaturated pixel index " + std::to_string(p));
        }
        seen[static_cast<size_t>(p)] = true;
    }
}

std::vector<int> excluded_pixel_indices(int n_pixels, const std::vector<int>& unsaturated) {
    std::vector<bool> keep(static_cast<size_t>(n_pixels), false);
    for (int p : unsaturated) {
        if (p >= 0 && p < n_pixels) keep[static_cast<size_t>(p)] = true;
    }
    std::vector<int> out;
    for (int p = 0; p < n_pixels; ++p) {
        if (!keep[static_cast<size_t>(p)]) out.push_back(p);
    }
    return out;
}

Matrix2Dd select_rows(const Matrix2Dd& m, const std::vector<int>& rows) {
    Matrix2Dd out(static_cast<Eigen::Index>(rows.size()), m.cols());
    for (size_t i = 0; i < rows.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) = m.row(rows[i]);
    }
    return out;
}

VectorXd select_rows(const VectorXd& v, const std::vector<int>& rows) {
    VectorXd out(static_cast<Eigen::Index>(rows.size()));
    for (size_t i = 0; i < rows.size(); ++i) {
        out[static_cast<Eigen::Index>(i)] = v[rows[i]];
    }
    return out;
}

PixelPartition partition_pixels(const Matrix2Dd& observation,
                                const Matrix2Dd& footprints,
                                const VectorXd& background,
                                const std::optional<std::vector<int>>& unsaturated) {
    const int d = static_cast<int>(observation.rows());

    PixelPartition part;
    part.n_pixels = d;
    if (unsaturated) {
        validate_pixel_indices(d, *unsaturated);
        part.fit_pixels = *unsaturated;
    } else {
        part.fit_pixels.resize(static_cast<size_t>(d));
        std::iota(part.fit_pixels.begin(), part.fit_pixels.end(), 0);
    }
    part.excluded_pixels = excluded_pixel_indices(d, part.fit_pixels);

    part.fit_observation = select_rows(observation, part.fit_pixels);
    part.fit_footprints = select_rows(footprints, part.fit_pixels);
    part.fit_background = select_rows(background, part.fit_pixels);

    part.excluded_observation = select_rows(observation, part.excluded_pixels);
    part.excluded_footprints = select_rows(footprints, part.excluded_pixels);
    part.excluded_background = select_rows(background, part.excluded_pixels);
    return part;
}

} // namespace temporal_update::pixels
