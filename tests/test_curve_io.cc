#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

#include "saxsred/CurveIO.hpp"
#include "test_utils.hpp"

using namespace saxsred;
using namespace saxsred_test;

namespace {

std::string read_all(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Curve small_curve() {
    Vector q(4), i0(4), err(4);
    q << 0.01, 0.02, 0.03, 0.04;
    i0 << 123.45, 0.0, 67.125, 8.5;
    err << 1.5, 0.25, 0.75, 0.5;
    Curve c = make_curve(q, i0, err, "lyso_001");
    c.comments = "# loaded from lyso_001_SAXS\n# merged with the following set\n"
                 "## loaded from lyso_001_WAXS\n";
    return c;
}

}  // namespace

TEST(CurveIO, writes_fixed_width_rows_and_provenance) {
    const auto dir = scratch_dir("curve_io_format");
    const auto path = (dir / "lyso.dat").string();

    save_curve(small_curve(), path);

    const std::string text = read_all(path);
    EXPECT_EQ(text,
              "     0.01000    123.45000      1.50000\n"
              "     0.03000     67.12500      0.75000\n"
              "     0.04000      8.50000      0.50000\n"
              "# loaded from lyso_001_SAXS\n# merged with the following set\n"
              "## loaded from lyso_001_WAXS\n");
}

TEST(CurveIO, zero_rows_kept_on_request) {
    const auto dir = scratch_dir("curve_io_zero");
    const auto path = (dir / "all.dat").string();

    save_curve(small_curve(), path, false);
    Curve back = load_curve(path);

    ASSERT_EQ(back.size(), 4);
    EXPECT_DOUBLE_EQ(back.intensity[1], 0.0);
    EXPECT_DOUBLE_EQ(back.error[1], 0.25);
}

TEST(CurveIO, load_reads_data_and_trailing_comment_block) {
    const auto dir = scratch_dir("curve_io_load");
    const auto path = (dir / "lyso.dat").string();
    const Curve c = small_curve();

    save_curve(c, path);
    Curve back = load_curve(path);

    ASSERT_EQ(back.size(), 3);
    EXPECT_DOUBLE_EQ(back.q[0], 0.01);
    EXPECT_DOUBLE_EQ(back.intensity[1], 67.125);
    EXPECT_DOUBLE_EQ(back.error[2], 0.5);
    EXPECT_EQ(back.comments, c.comments);
    EXPECT_EQ(back.label, "lyso.dat");
    EXPECT_DOUBLE_EQ(back.trans, -1.0);
}

TEST(CurveIO, load_skips_blank_and_indented_comment_lines) {
    const auto dir = scratch_dir("curve_io_blank");
    const auto path = dir / "hand.dat";
    {
        std::ofstream out(path);
        out << "# header\n\n  0.1 10.0 1.0\n   # indented\n0.2 5.0 0.5\n";
        for (int i = 0; i < 200; ++i) out << "## nested provenance line " << i << '\n';
    }

    Curve back = load_curve(path.string());
    ASSERT_EQ(back.size(), 2);
    EXPECT_DOUBLE_EQ(back.q[1], 0.2);
    EXPECT_NE(back.comments.find("## nested provenance line 199"), std::string::npos);
}

TEST(CurveIO, bad_input_is_reported) {
    const auto dir = scratch_dir("curve_io_bad");
    EXPECT_THROW(load_curve((dir / "missing.dat").string()), std::runtime_error);

    const auto malformed = dir / "malformed.dat";
    {
        std::ofstream out(malformed);
        out << "0.1 10.0\n";
    }
    EXPECT_THROW(load_curve(malformed.string()), std::runtime_error);

    // a row starting with a non-ASCII byte is neither blank nor a comment
    const auto utf8 = dir / "utf8.dat";
    {
        std::ofstream out(utf8);
        out << "0.1 10.0 1.0\n\xc2\xb5 beam\n";
    }
    EXPECT_THROW(load_curve(utf8.string()), std::runtime_error);

    const auto only_comments = dir / "comments.dat";
    {
        std::ofstream out(only_comments);
        out << "# nothing here\n";
    }
    EXPECT_THROW(load_curve(only_comments.string()), std::runtime_error);
}
