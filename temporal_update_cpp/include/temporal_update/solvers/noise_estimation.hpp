#pragma once

#include "temporal_update/core/types.hpp"

#include <optional>

namespace temporal_update::solvers {

// Noise standard deviation from the one-sided power spectral density:
// sqrt(exp(mean(log(psd / 2)))) over normalized frequencies in
// (freq_low, freq_high]. White noise of deviation sigma reads as
// sigma * exp(-gamma / 2), gamma the Euler-Mascheroni constant.
// Zero-power bins are skipped; 0 when the band holds no power at all.
double estimate_noise_psd(const VectorXd& y, double freq_low = 0.25, double freq_high = 0.5);

// Yule-Walker fit of an AR(order) kernel on the noise-corrected biased
// autocovariance. Roots outside (0, 1) are clamped to 0.95 / 0.15 before the
// optional fudge factor scales them.
ArKernel estimate_ar_coefficients(const VectorXd& y, int order, double noise, int lags,
                                  std::optional<double> fudge_factor);

} // namespace temporal_update::solvers
