#include "field.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

namespace {

const PointCharge kPositive{{300.0, 300.0}, 1e-6};
const PointCharge kNegative{{700.0, 300.0}, -1e-6};

} // namespace

TEST(FieldTest, EmptyChargeSetHasNoField) {
    Vec2 e = EvaluateField({123.0, 456.0}, {});
    EXPECT_EQ(e.x, 0.0);
    EXPECT_EQ(e.y, 0.0);
}

TEST(FieldTest, CoulombMagnitudeAndDirection) {
    // k * q / r^2 = 8.988e9 * 1e-6 / 100^2
    Vec2 e = EvaluateField({400.0, 300.0}, {kPositive});
    EXPECT_NEAR(e.x, 0.8988, 1e-12);
    EXPECT_EQ(e.y, 0.0);

    // A negative charge pulls the field towards itself.
    Vec2 toward = EvaluateField({700.0, 400.0}, {kNegative});
    EXPECT_EQ(toward.x, 0.0);
    EXPECT_NEAR(toward.y, -0.8988, 1e-12);
}

TEST(FieldTest, SuperpositionOfTwoCharges) {
    const std::vector<Vec2> probes = {{500.0, 300.0}, {10.0, 20.0}, {650.0, 420.0},
                                      {300.0, 310.0}, {999.0, 599.0}};
    for (const auto& p : probes) {
        Vec2 both = EvaluateField(p, {kPositive, kNegative});
        Vec2 sum = EvaluateField(p, {kPositive}) + EvaluateField(p, {kNegative});
        EXPECT_NEAR(both.x, sum.x, 1e-12 * (1.0 + std::fabs(sum.x)));
        EXPECT_NEAR(both.y, sum.y, 1e-12 * (1.0 + std::fabs(sum.y)));
    }
}

TEST(FieldTest, NearFieldChargeIsExcludedEntirely) {
    // 3 units from the positive charge, well inside the 5-unit radius.
    Vec2 p{303.0, 300.0};
    Vec2 both = EvaluateField(p, {kPositive, kNegative});
    Vec2 others = EvaluateField(p, {kNegative});
    EXPECT_EQ(both.x, others.x);
    EXPECT_EQ(both.y, others.y);

    Vec2 alone = EvaluateField(p, {kPositive});
    EXPECT_EQ(alone.x, 0.0);
    EXPECT_EQ(alone.y, 0.0);
}

TEST(FieldTest, ExclusionRadiusIsConfigurable) {
    FieldParams params;
    params.singularity_radius = 50.0;
    Vec2 e = EvaluateField({340.0, 300.0}, {kPositive}, params);
    EXPECT_EQ(e.x, 0.0);

    params.singularity_radius = 5.0;
    e = EvaluateField({340.0, 300.0}, {kPositive}, params);
    EXPECT_GT(e.x, 0.0);
}

TEST(FieldTest, ZeroChargeContributesNothing) {
    PointCharge neutral{{500.0, 300.0}, 0.0};
    Vec2 e = EvaluateField({520.0, 300.0}, {neutral});
    EXPECT_EQ(e.x, 0.0);
    EXPECT_EQ(e.y, 0.0);
    EXPECT_TRUE(std::isfinite(Length(e)));
}

TEST(FieldTest, SymmetricChargesCancelAtMidpoint) {
    PointCharge left{{400.0, 300.0}, 1e-6};
    PointCharge right{{600.0, 300.0}, 1e-6};
    Vec2 e = EvaluateField({500.0, 300.0}, {left, right});
    EXPECT_EQ(e.x, 0.0);
    EXPECT_EQ(e.y, 0.0);
}

TEST(FieldTest, FieldAtMatchesEvaluateField) {
    Vec2 p{612.5, 87.25};
    Vec2 a = FieldAt(p, {kPositive, kNegative});
    Vec2 b = EvaluateField(p, {kPositive, kNegative});
    EXPECT_EQ(a, b);
}
