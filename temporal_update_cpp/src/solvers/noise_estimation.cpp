#include "temporal_update/solvers/noise_estimation.hpp"
#include "temporal_update/kernel/ar_kernel.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace temporal_update::solvers {

double estimate_noise_psd(const VectorXd& y, double freq_low, double freq_high) {
    const int N = static_cast<int>(y.size());
    if (N < 2) return 0.0;

    cv::Mat src(1, N, CV_64F);
    for (int t = 0; t < N; ++t) {
        src.at<double>(0, t) = y[t];
    }
    cv::Mat F;
    cv::dft(src, F, cv::DFT_COMPLEX_OUTPUT);

    // One-sided density, interior bins doubled; log-mean-exp over the band
    double log_sum = 0.0;
    int count = 0;
    int in_band = 0;
    const int half = N / 2;
    for (int k = 0; k <= half; ++k) {
        const double f = static_cast<double>(k) / static_cast<double>(N);
        if (!(f > freq_low && f <= freq_high)) continue;
        ++in_band;
        const cv::Vec2d X = F.at<cv::Vec2d>(0, k);
        double psd = (X[0] * X[0] + X[1] * X[1]) / static_cast<double>(N);
        const bool edge = (k == 0) || (N % 2 == 0 && k == half);
        if (!edge) psd *= 2.0;
        if (!(psd > 0.0)) continue;
        log_sum += std::log(psd / 2.0);
        ++count;
    }

    if (in_band == 0) {
        // Too short for the band: first-difference variance
        const VectorXd diff = y.tail(N - 1) - y.head(N - 1);
        const double mean = diff.mean();
        const double var = (diff.array() - mean).square().mean();
        return std::sqrt(var / 2.0);
    }
    if (count == 0) return 0.0;
    return std::sqrt(std::exp(log_sum / static_cast<double>(count)));
}

ArKernel estimate_ar_coefficients(const VectorXd& y, int order, double noise, int lags,
                                  std::optional<double> fudge_factor) {
    const int T = static_cast<int>(y.size());
    const int p = std::max(1, order);
    const int L = std::min(lags + p, std::max(1, T - 1));

    const VectorXd centered = y.array() - y.mean();
    std::vector<double> acov(static_cast<size_t>(L + 1), 0.0);
    for (int k = 0; k <= L; ++k) {
        double s = 0.0;
        for (int t = 0; t + k < T; ++t) {
            s += centered[t] * centered[t + k];
        }
        acov[static_cast<size_t>(k)] = s / static_cast<double>(T);
    }

    Eigen::MatrixXd A(L, p);
    Eigen::VectorXd rhs(L);
    for (int i = 0; i < L; ++i) {
        for (int j = 0; j < p; ++j) {
            A(i, j) = acov[static_cast<size_t>(std::abs(i - j))];
        }
        if (i < p) A(i, i) -= noise * noise;
        rhs[i] = acov[static_cast<size_t>(i + 1)];
    }
    const Eigen::VectorXd g = A.completeOrthogonalDecomposition().solve(rhs);

    ArKernel raw;
    raw.coefficients.assign(g.data(), g.data() + g.size());

    std::vector<double> roots;
    for (const auto& r : kernel::characteristic_roots(raw)) {
        double v = r.real();
        if (!std::isfinite(v)) v = 0.95;
        if (v > 1.0) v = 0.95;
        if (v < 0.0) v = 0.15;
        roots.push_back(v * fudge_factor.value_or(1.0));
    }
    return kernel::kernel_from_roots(roots);
}

} // namespace temporal_update::solvers
