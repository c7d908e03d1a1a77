#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "saxsred/Average.hpp"
#include "saxsred/Errors.hpp"
#include "test_utils.hpp"

using namespace saxsred;
using namespace saxsred_test;

namespace {

class MemberRecorder : public CurveObserver {
  public:
    void on_averaged(const Curve& averaged, const std::vector<Curve>& members) override {
        calls++;
        last_label = averaged.label;
        recorded = members;
    }
    int calls = 0;
    std::string last_label;
    std::vector<Curve> recorded;
};

}  // namespace

TEST(Average, single_curve_is_identity) {
    const Vector q = linear_grid(0.01, 0.01, 20);
    Curve a = make_curve(q, Vector::LinSpaced(20, 1.0, 20.0), "lyso_001");
    a.trans = 123.0;
    const Curve before = a;

    average(a, {}, quiet_config());

    EXPECT_DOUBLE_EQ(a.trans, 123.0);
    EXPECT_TRUE((a.intensity.array() == before.intensity.array()).all());
    EXPECT_TRUE((a.error.array() == before.error.array()).all());
    EXPECT_EQ(a.label, "lyso_001");
}

TEST(Average, sums_divided_by_n_and_errors_by_sqrt_n) {
    const Vector q = linear_grid(0.01, 0.01, 10);
    const Vector ones = Vector::Ones(10);

    Curve a = make_curve(q, Vector(1.0 * ones), ones, "buf_01");
    Curve b = make_curve(q, Vector(2.0 * ones), ones, "buf_02");
    Curve c = make_curve(q, Vector(3.0 * ones), ones, "buf_03");
    a.trans = 1.0;
    b.trans = 2.0;
    c.trans = 3.0;

    average(a, {b, c}, quiet_config());

    EXPECT_DOUBLE_EQ(a.trans, 2.0);
    for (int i = 0; i < 10; ++i) {
        EXPECT_DOUBLE_EQ(a.intensity[i], 2.0);
        EXPECT_NEAR(a.error[i], std::sqrt(3.0), 1e-12);
    }
    EXPECT_EQ(a.label, "buf_0");
    EXPECT_NE(a.comments.find("# averaged with \n## loaded from buf_02"), std::string::npos);
    EXPECT_NE(a.comments.find("## loaded from buf_03"), std::string::npos);
}

TEST(Average, observer_sees_members_before_averaging) {
    const Vector q = linear_grid(0.01, 0.01, 5);
    Curve a = make_curve(q, Vector::Constant(5, 2.0), "s_1");
    Curve b = make_curve(q, Vector::Constant(5, 4.0), "s_2");

    MemberRecorder rec;
    average(a, {b}, quiet_config(), &rec);

    EXPECT_EQ(rec.calls, 1);
    ASSERT_EQ(rec.recorded.size(), 2u);
    EXPECT_DOUBLE_EQ(rec.recorded[0].intensity[0], 2.0);
    EXPECT_DOUBLE_EQ(rec.recorded[1].intensity[0], 4.0);
    EXPECT_DOUBLE_EQ(a.intensity[0], 3.0);
    EXPECT_EQ(rec.last_label, a.label);
}

TEST(Average, grid_mismatch_is_fatal) {
    Curve a = make_curve(linear_grid(0.01, 0.01, 10), Vector::Ones(10), "a");
    Curve b = make_curve(linear_grid(0.01, 0.02, 10), Vector::Ones(10), "b");
    const Curve before = a;

    EXPECT_THROW(average(a, {b}, quiet_config()), GridMismatchError);
    // nothing was accumulated before the check failed
    EXPECT_TRUE((a.intensity.array() == before.intensity.array()).all());
}
