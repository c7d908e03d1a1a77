#include <gtest/gtest.h>

#include <cmath>

#include "saxsred/Guinier.hpp"
#include "test_utils.hpp"

using namespace saxsred;
using namespace saxsred_test;

namespace {

// I(q) = 5000 exp(-q² 20²/3) on q = 0.010 … 0.100
Curve synthetic_guinier_curve() {
    const Vector q = linear_grid(0.01, 0.001, 91);
    return make_curve(q, guinier_model(q, 5000.0, 20.0), "synthetic");
}

}  // namespace

TEST(Guinier, recovers_known_parameters) {
    const Curve c = synthetic_guinier_curve();
    GuinierResult fit = guinier_fit(c, 0.01, 0.05);

    EXPECT_NEAR(fit.i0, 5000.0, 50.0);
    EXPECT_NEAR(fit.rg, 20.0, 0.2);
    EXPECT_GE(fit.n_points, 2);
}

TEST(Guinier, window_shrinks_to_inverse_rg) {
    const Curve c = synthetic_guinier_curve();
    GuinierResult fit = guinier_fit(c, 0.01, 0.1);

    EXPECT_NEAR(fit.rg, 20.0, 1e-6);
    EXPECT_NEAR(fit.qe, 1.0 / 20.0, 1e-6);
}

TEST(Guinier, fixed_end_is_kept) {
    const Curve c = synthetic_guinier_curve();
    GuinierResult fit = guinier_fit(c, 0.01, 0.08, 15.0, true);

    EXPECT_DOUBLE_EQ(fit.qe, 0.08);
    EXPECT_NEAR(fit.rg, 20.0, 1e-6);
    EXPECT_NEAR(fit.i0, 5000.0, 1e-6);
}

TEST(Guinier, start_is_clamped_to_first_positive_point) {
    Curve c = synthetic_guinier_curve();
    for (int i = 0; i < 5; ++i) c.intensity[i] = 0.0;

    GuinierResult fit = guinier_fit(c, 0.0, 0.05);

    EXPECT_DOUBLE_EQ(fit.qs, c.q[5]);
    EXPECT_NEAR(fit.rg, 20.0, 1e-6);
}

TEST(Guinier, rising_curve_gives_nan_rg) {
    const Vector q = linear_grid(0.01, 0.001, 50);
    Curve c = make_curve(q, (100.0 * (q.array().square() * 50.0).exp()).matrix(), "rising");

    GuinierResult fit = guinier_fit(c, 0.01, 0.05, 15.0, true);
    EXPECT_TRUE(std::isnan(fit.rg));
}

TEST(Guinier, degenerate_input_is_rejected) {
    const Vector q = linear_grid(0.01, 0.001, 20);
    Curve empty = make_curve(q, Vector::Zero(20), "empty");
    EXPECT_THROW(guinier_fit(empty, 0.01, 0.05), std::invalid_argument);

    Curve c = make_curve(q, guinier_model(q, 10.0, 20.0), "c");
    EXPECT_THROW(guinier_fit(c, 0.015, 0.0155, 15.0, true), std::invalid_argument);
}

TEST(Guinier, model_matches_formula) {
    Vector q(2);
    q << 0.0, 0.05;
    const Vector m = guinier_model(q, 100.0, 20.0);
    EXPECT_DOUBLE_EQ(m[0], 100.0);
    EXPECT_NEAR(m[1], 100.0 * std::exp(-1.0 / 3.0), 1e-12);
}
