#pragma once

#include "temporal_update/core/types.hpp"

#include <complex>
#include <map>
#include <optional>
#include <vector>

namespace temporal_update::kernel {

// Kernel coefficients shared by all sources and/or overridden per source.
struct KernelSpec {
    std::optional<ArKernel> shared;
    std::map<int, ArKernel> per_source;

    bool has_kernel(int source) const;
    // Throws ConfigError when neither a per-source nor a shared kernel exists.
    const ArKernel& kernel_for(int source) const;
};

// Sparse lower-triangular operator G with G(t,t) = 1 and G(t,t-j) = -g_j,
// so that G * c is the event train driving trace c.
SparseMatrixd make_kernel_matrix(const ArKernel& kernel, int length);

// Roots of z^p - g_1 z^(p-1) - ... - g_p.
std::vector<std::complex<double>> characteristic_roots(const ArKernel& kernel);

// Largest real root (by value, not magnitude); falls back to the real part
// of the largest-modulus root when all roots are complex. 0 for an empty kernel.
double dominant_root(const ArKernel& kernel);

// All roots strictly inside the unit circle and a positive dominant root.
bool is_stable(const ArKernel& kernel);

// Monic polynomial with the given real roots, returned as AR coefficients.
ArKernel kernel_from_roots(const std::vector<double>& roots);

// gd^t for t = 0 .. length-1.
VectorXd decay_vector(double gd, int length);

// c = G^-1 s
VectorXd apply_kernel_inverse(const SparseMatrixd& G, const VectorXd& events);

// G^-T r
VectorXd apply_kernel_inverse_transpose(const SparseMatrixd& G, const VectorXd& residual);

} // namespace temporal_update::kernel
