#include <gtest/gtest.h>

#include "saxsred/QGrid.hpp"
#include "test_utils.hpp"

using namespace saxsred;

TEST(QGrid, uniform_grid_is_unchanged) {
    // dyadic step: every spacing is exactly equal
    const Vector q = uniform_qgrid(0.0, 0.25, 40);
    const Vector m = mod_qgrid(q);
    ASSERT_EQ(m.size(), q.size());
    EXPECT_TRUE((m.array() == q.array()).all());

    const Vector w = bin_widths(q);
    EXPECT_TRUE((w.array() == 0.25).all());
}

TEST(QGrid, transition_point_is_moved) {
    Vector q(7);
    q << 0.0, 1.0, 2.0, 3.0, 5.0, 7.0, 9.0;

    const Vector m = mod_qgrid(q);

    Vector expected(7);
    expected << 0.0, 1.0, 2.0, 3.25, 5.0, 7.0, 9.0;
    EXPECT_TRUE((m.array() == expected.array()).all());

    // each node is now the centre of its bin; widths change once, smoothly
    Vector widths(7);
    widths << 1.0, 1.0, 1.0, 1.5, 2.0, 2.0, 2.0;
    EXPECT_TRUE((bin_widths(m).array() == widths.array()).all());

    // the input is not modified
    EXPECT_DOUBLE_EQ(q[3], 3.0);
}

TEST(QGrid, short_grids_pass_through) {
    Vector q(2);
    q << 0.1, 0.3;
    EXPECT_TRUE((mod_qgrid(q).array() == q.array()).all());
    EXPECT_THROW(bin_widths(Vector::Constant(1, 0.1)), std::invalid_argument);
}

TEST(QGrid, uniform_grid_builder) {
    const Vector q = uniform_qgrid(0.005, 0.0025, 5);
    ASSERT_EQ(q.size(), 5);
    EXPECT_DOUBLE_EQ(q[0], 0.005);
    EXPECT_DOUBLE_EQ(q[4], 0.005 + 4 * 0.0025);
    EXPECT_THROW(uniform_qgrid(0.0, 0.0, 5), std::invalid_argument);
}
