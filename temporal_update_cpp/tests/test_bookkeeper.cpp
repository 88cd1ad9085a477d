#include "temporal_update/core/errors.hpp"
#include "temporal_update/mixture/bookkeeper.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace temporal_update;

namespace {

struct SmallMixture {
    Matrix2Dd Y;
    Matrix2Dd A;  // augmented
    Matrix2Dd C;  // augmented
};

SmallMixture make_small_mixture() {
    SmallMixture m;
    m.A.resize(5, 3);
    m.A << 1.0, 0.0, 0.2,
           0.5, 0.1, 0.2,
           0.0, 1.0, 0.2,
           0.0, 0.7, 0.2,
           0.3, 0.3, 0.2;
    m.C.resize(3, 6);
    m.C << 1, 2, 3, 2, 1, 0,
           0, 1, 0, 1, 0, 1,
           5, 5, 5, 5, 5, 5;
    m.Y = m.A * m.C;
    m.Y(0, 0) += 0.25;
    m.Y(3, 4) -= 0.5;
    return m;
}

} // namespace

TEST_CASE("augmentation_appends_background") {
    Matrix2Dd A = Matrix2Dd::Ones(4, 2);
    VectorXd b = VectorXd::Constant(4, 3.0);
    Matrix2Dd Aa = mixture::augment_footprints(A, b);
    REQUIRE(Aa.cols() == 3);
    REQUIRE(Aa(2, 2) == 3.0);

    Matrix2Dd C = Matrix2Dd::Zero(2, 5);
    VectorXd f = VectorXd::Constant(5, 1.5);
    Matrix2Dd Ca = mixture::augment_traces(C, f);
    REQUIRE(Ca.rows() == 3);
    REQUIRE(Ca(2, 4) == 1.5);
}

TEST_CASE("correlation_bookkeeper_initial_state") {
    auto m = make_small_mixture();
    mixture::CorrelationBookkeeper book(m.Y, m.A, m.C);

    const Matrix2Dd expected = m.A.transpose() * m.Y - (m.A.transpose() * m.A) * m.C;
    REQUIRE((book.correlation() - expected).cwiseAbs().maxCoeff() < 1.0e-12);
    REQUIRE(book.components() == 3);
    REQUIRE(book.timesteps() == 6);
    REQUIRE(book.squared_norm(1) == Catch::Approx(0.01 + 1.0 + 0.49 + 0.09));
}

TEST_CASE("isolate_removes_only_other_components") {
    auto m = make_small_mixture();
    mixture::CorrelationBookkeeper book(m.Y, m.A, m.C);

    const int k = 1;
    const VectorXd isolated = book.isolate(k, m.C.row(k).transpose());

    Matrix2Dd others = m.Y;
    for (int j = 0; j < 3; ++j) {
        if (j == k) continue;
        others -= m.A.col(j) * m.C.row(j);
    }
    const VectorXd direct = others.transpose() * m.A.col(k) / m.A.col(k).squaredNorm();
    REQUIRE((isolated - direct).cwiseAbs().maxCoeff() < 1.0e-12);
}

TEST_CASE("reabsorb_restores_invariant_for_new_trace") {
    auto m = make_small_mixture();
    mixture::CorrelationBookkeeper book(m.Y, m.A, m.C);

    const int k = 0;
    book.isolate(k, m.C.row(k).transpose());
    VectorXd updated = VectorXd::LinSpaced(6, 0.0, 1.0);
    book.reabsorb(k, updated);

    Matrix2Dd C2 = m.C;
    C2.row(k) = updated.transpose();
    mixture::CorrelationBookkeeper fresh(m.Y, m.A, C2);
    REQUIRE((book.correlation() - fresh.correlation()).cwiseAbs().maxCoeff() < 1.0e-12);
}

TEST_CASE("successive_updates_keep_every_row_consistent") {
    auto m = make_small_mixture();
    mixture::CorrelationBookkeeper book(m.Y, m.A, m.C);
    Matrix2Dd C = m.C;

    const VectorXd first = VectorXd::LinSpaced(6, 2.0, -1.0);
    book.isolate(0, C.row(0).transpose());
    book.reabsorb(0, first);
    C.row(0) = first.transpose();

    // Component 1 must now see component 0's new trace
    const VectorXd isolated = book.isolate(1, C.row(1).transpose());
    const Matrix2Dd others = m.Y - m.A.col(0) * C.row(0) - m.A.col(2) * C.row(2);
    const VectorXd direct = others.transpose() * m.A.col(1) / m.A.col(1).squaredNorm();
    REQUIRE((isolated - direct).cwiseAbs().maxCoeff() < 1.0e-12);

    const VectorXd second = VectorXd::Constant(6, 0.75);
    book.reabsorb(1, second);
    C.row(1) = second.transpose();

    book.isolate(2, C.row(2).transpose());
    const VectorXd third = VectorXd::LinSpaced(6, 4.0, 6.0);
    book.reabsorb(2, third);
    C.row(2) = third.transpose();

    mixture::CorrelationBookkeeper fresh(m.Y, m.A, C);
    REQUIRE((book.correlation() - fresh.correlation()).cwiseAbs().maxCoeff() < 1.0e-12);
}

TEST_CASE("reabsorb_requires_matching_isolate") {
    auto m = make_small_mixture();
    mixture::CorrelationBookkeeper book(m.Y, m.A, m.C);
    REQUIRE_THROWS_AS(book.reabsorb(0, VectorXd::Zero(6)), ValidationError);

    book.isolate(1, m.C.row(1).transpose());
    REQUIRE_THROWS_AS(book.reabsorb(2, VectorXd::Zero(6)), ValidationError);
}

TEST_CASE("residual_bookkeeper_rank_one_updates") {
    auto m = make_small_mixture();
    mixture::ResidualBookkeeper book(m.Y, m.A, m.C);

    REQUIRE((book.residual() - (m.Y - m.A * m.C)).cwiseAbs().maxCoeff() < 1.0e-12);

    const int k = 2;
    book.add_back(k, m.C.row(k).transpose());
    const VectorXd projected = book.project(k);
    REQUIRE(projected[0] == Catch::Approx(5.0 + 0.25 * 0.2 / book.squared_norm(k)));

    VectorXd updated = VectorXd::Constant(6, 4.0);
    book.subtract_out(k, updated);
    Matrix2Dd C2 = m.C;
    C2.row(k) = updated.transpose();
    REQUIRE((book.residual() - (m.Y - m.A * C2)).cwiseAbs().maxCoeff() < 1.0e-12);

    Matrix2Dd rows = book.residual_rows({3, 0});
    REQUIRE(rows.rows() == 2);
    REQUIRE(rows(0, 4) == Catch::Approx(book.residual()(3, 4)));
}

TEST_CASE("bookkeepers_reject_inconsistent_shapes") {
    auto m = make_small_mixture();
    Matrix2Dd wrong = Matrix2Dd::Zero(2, 6);
    REQUIRE_THROWS_AS(mixture::CorrelationBookkeeper(m.Y, m.A, wrong), ValidationError);
    REQUIRE_THROWS_AS(mixture::ResidualBookkeeper(m.Y, m.A, wrong), ValidationError);
}
