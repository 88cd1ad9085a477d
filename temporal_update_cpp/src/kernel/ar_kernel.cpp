#include "temporal_update/kernel/ar_kernel.hpp"
#include "temporal_update/core/errors.hpp"

#include <Eigen/Eigenvalues>

#include <cmath>

namespace temporal_update::kernel {

bool KernelSpec::has_kernel(int source) const {
    if (per_source.count(source) > 0) return true;
    return shared.has_value() && !shared->empty();
}

const ArKernel& KernelSpec::kernel_for(int source) const {
    auto it = per_source.find(source);
    if (it != per_source.end()) {
        return it->second;
    }
    if (shared && !shared->empty()) {
        return *shared;
    }
    throw ConfigError("no kernel coefficients for source " + std::to_string(source));
}

SparseMatrixd make_kernel_matrix(const ArKernel& kernel, int length) {
    const int p = kernel.order();
    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(static_cast<size_t>(length) * static_cast<size_t>(p + 1));
    for (int t = 0; t < length; ++t) {
        triplets.emplace_back(t, t, 1.0);
        for (int j = 1; j <= p && t - j >= 0; ++j) {
            const double g = kernel.coefficients[static_cast<size_t>(j - 1)];
            if (g != 0.0) {
                triplets.emplace_back(t, t - j, -g);
            }
        }
    }

    SparseMatrixd G(length, length);
    G.setFromTriplets(triplets.begin(), triplets.end());
    G.makeCompressed();
    return G;
}

std::vector<std::complex<double>> characteristic_roots(const ArKernel& kernel) {
    const int p = kernel.order();
    std::vector<std::complex<double>> roots;
    if (p == 0) return roots;
    if (p == 1) {
        roots.emplace_back(kernel.coefficients[0], 0.0);
        return roots;
    }

    // Companion matrix of the characteristic polynomial
    Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(p, p);
    for (int j = 0; j < p; ++j) {
        companion(0, j) = kernel.coefficients[static_cast<size_t>(j)];
    }
    for (int i = 1; i < p; ++i) {
        companion(i, i - 1) = 1.0;
    }

    Eigen::EigenSolver<Eigen::MatrixXd> solver(companion, false);
    const auto& ev = solver.eigenvalues();
    roots.reserve(static_cast<size_t>(p));
    for (int i = 0; i < ev.size(); ++i) {
        roots.push_back(ev[i]);
    }
    return roots;
}

double dominant_root(const ArKernel& kernel) {
    const auto roots = characteristic_roots(kernel);
    if (roots.empty()) return 0.0;

    const double imag_tol = 1.0e-10;
    bool have_real = false;
    double best_real = 0.0;
    double best_mod = -1.0;
    std::complex<double> best_any(0.0, 0.0);

    for (const auto& r : roots) {
        if (std::abs(r.imag()) <= imag_tol) {
            if (!have_real || r.real() > best_real) {
                best_real = r.real();
                have_real = true;
            }
        }
        if (std::abs(r) > best_mod) {
            best_mod = std::abs(r);
            best_any = r;
        }
    }
    return have_real ? best_real : best_any.real();
}

bool is_stable(const ArKernel& kernel) {
    if (kernel.empty()) return false;
    for (const auto& r : characteristic_roots(kernel)) {
        if (!(std::abs(r) < 1.0)) return false;
    }
    return dominant_root(kernel) > 0.0;
}

ArKernel kernel_from_roots(const std::vector<double>& roots) {
    // poly[i] is the coefficient of z^(p-i); poly[0] = 1
    std::vector<double> poly{1.0};
    for (double r : roots) {
        std::vector<double> next(poly.size() + 1, 0.0);
        for (size_t i = 0; i < poly.size(); ++i) {
            next[i] += poly[i];
            next[i + 1] -= r * poly[i];
        }
        poly.swap(next);
    }

    ArKernel out;
    out.coefficients.reserve(roots.size());
    for (size_t i = 1; i < poly.size(); ++i) {
        out.coefficients.push_back(-poly[i]);
    }
    return out;
}

VectorXd decay_vector(double gd, int length) {
    VectorXd d(length);
    double v = 1.0;
    for (int t = 0; t < length; ++t) {
        d[t] = v;
        v *= gd;
    }
    return d;
}

VectorXd apply_kernel_inverse(const SparseMatrixd& G, const VectorXd& events) {
    return G.triangularView<Eigen::Lower>().solve(events);
}

VectorXd apply_kernel_inverse_transpose(const SparseMatrixd& G, const VectorXd& residual) {
    return G.transpose().triangularView<Eigen::Upper>().solve(residual);
}

} // namespace temporal_update::kernel
