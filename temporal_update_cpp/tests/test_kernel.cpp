#include "temporal_update/core/errors.hpp"
#include "temporal_update/kernel/ar_kernel.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using namespace temporal_update;

TEST_CASE("kernel_matrix_is_lower_bidiagonal_for_ar1") {
    ArKernel g{{0.9}};
    SparseMatrixd G = kernel::make_kernel_matrix(g, 4);

    REQUIRE(G.rows() == 4);
    REQUIRE(G.cols() == 4);
    REQUIRE(G.nonZeros() == 7);
    REQUIRE(G.coeff(0, 0) == 1.0);
    REQUIRE(G.coeff(2, 1) == Catch::Approx(-0.9));
    REQUIRE(G.coeff(1, 2) == 0.0);
}

TEST_CASE("kernel_inverse_recovers_event_train") {
    ArKernel g{{1.5, -0.56}};
    const int T = 30;
    SparseMatrixd G = kernel::make_kernel_matrix(g, T);

    VectorXd s = VectorXd::Zero(T);
    s[2] = 1.0;
    s[17] = 0.5;
    VectorXd c = kernel::apply_kernel_inverse(G, s);

    REQUIRE((G * c - s).cwiseAbs().maxCoeff() < 1.0e-12);
    // AR recursion
    REQUIRE(c[4] == Catch::Approx(1.5 * c[3] - 0.56 * c[2]));

    VectorXd r = VectorXd::LinSpaced(T, -1.0, 1.0);
    VectorXd z = kernel::apply_kernel_inverse_transpose(G, r);
    REQUIRE((SparseMatrixd(G.transpose()) * z - r).cwiseAbs().maxCoeff() < 1.0e-12);
}

TEST_CASE("dominant_root_of_ar2_kernel") {
    ArKernel g{{1.5, -0.56}};  // roots 0.8 and 0.7
    auto roots = kernel::characteristic_roots(g);
    REQUIRE(roots.size() == 2);
    REQUIRE(kernel::dominant_root(g) == Catch::Approx(0.8).margin(1e-10));
    REQUIRE(kernel::is_stable(g));

    ArKernel back = kernel::kernel_from_roots({0.8, 0.7});
    REQUIRE(back.order() == 2);
    REQUIRE(back.coefficients[0] == Catch::Approx(1.5));
    REQUIRE(back.coefficients[1] == Catch::Approx(-0.56));
}

TEST_CASE("dominant_root_prefers_largest_value_over_magnitude") {
    // roots 0.9 and -0.95
    ArKernel g = kernel::kernel_from_roots({0.9, -0.95});
    REQUIRE(g.coefficients[0] == Catch::Approx(-0.05));
    REQUIRE(g.coefficients[1] == Catch::Approx(0.855));
    REQUIRE(kernel::dominant_root(g) == Catch::Approx(0.9).margin(1e-10));
    REQUIRE(kernel::is_stable(g));

    const VectorXd d = kernel::decay_vector(kernel::dominant_root(g), 10);
    REQUIRE(d.minCoeff() > 0.0);
}

TEST_CASE("unstable_and_empty_kernels") {
    REQUIRE_FALSE(kernel::is_stable(ArKernel{{1.05}}));
    REQUIRE_FALSE(kernel::is_stable(ArKernel{{-0.5}}));
    REQUIRE(kernel::dominant_root(ArKernel{}) == 0.0);
}

TEST_CASE("decay_vector_powers_of_root") {
    VectorXd d = kernel::decay_vector(0.5, 4);
    REQUIRE(d[0] == Catch::Approx(1.0));
    REQUIRE(d[3] == Catch::Approx(0.125));
}

TEST_CASE("kernel_spec_prefers_per_source_coefficients") {
    kernel::KernelSpec spec;
    spec.shared = ArKernel{{0.9}};
    spec.per_source[2] = ArKernel{{0.5}};

    REQUIRE(spec.kernel_for(0).coefficients[0] == 0.9);
    REQUIRE(spec.kernel_for(2).coefficients[0] == 0.5);

    kernel::KernelSpec only_per_source;
    only_per_source.per_source[1] = ArKernel{{0.7}};
    REQUIRE(only_per_source.has_kernel(1));
    REQUIRE_FALSE(only_per_source.has_kernel(0));
    REQUIRE_THROWS_AS(only_per_source.kernel_for(0), ConfigError);
}
