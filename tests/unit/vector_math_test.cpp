#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "liquid/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorAddition) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector result = v1 + v2;
    EXPECT_DOUBLE_EQ(result.x, 4.0);
    EXPECT_DOUBLE_EQ(result.y, 6.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);

    v1 -= v2;
    EXPECT_DOUBLE_EQ(v1.x, 1.0);
    EXPECT_DOUBLE_EQ(v1.y, 2.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);

    Vector mult_result = v * 2.0;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    Vector scalar_first = 2.0 * v;
    EXPECT_EQ(scalar_first, mult_result);

    Vector div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);

    Vector neg = -v;
    EXPECT_DOUBLE_EQ(neg.x, -2.0);
    EXPECT_DOUBLE_EQ(neg.y, -3.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 25.0);

    Vector unit = v.normalized();
    EXPECT_DOUBLE_EQ(unit.length(), 1.0);

    // Cross product
    Vector v5(1.0, 0.0);
    Vector v6(0.0, 1.0);
    EXPECT_DOUBLE_EQ(v5.cross(v6), 1.0);

    // Rotate by angle
    Vector rotated = v5.rotateByAngle(M_PI / 2);
    EXPECT_NEAR(rotated.x, 0.0, EPSILON);
    EXPECT_NEAR(rotated.y, 1.0, EPSILON);
}

TEST(VectorMathTest, NormalizedZeroVectorFallsBackToUnitX) {
    Vector zero;
    Vector n = zero.normalized();
    EXPECT_DOUBLE_EQ(n.x, 1.0);
    EXPECT_DOUBLE_EQ(n.y, 0.0);
}

TEST(VectorMathTest, IsFinite) {
    EXPECT_TRUE(Vector(1.0, -2.0).isFinite());
    EXPECT_FALSE(Vector(std::numeric_limits<double>::quiet_NaN(), 0.0).isFinite());
    EXPECT_FALSE(Vector(0.0, std::numeric_limits<double>::infinity()).isFinite());
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0);

    Position p3 = p1 + Vector(3.0, 4.0);
    EXPECT_DOUBLE_EQ(p3.x, 4.0);
    EXPECT_DOUBLE_EQ(p3.y, 6.0);

    Vector d = p2 - p1;
    EXPECT_DOUBLE_EQ(d.x, 2.0);
    EXPECT_DOUBLE_EQ(d.y, 2.0);

    EXPECT_DOUBLE_EQ(p1.dist(p2), 2.8284271247461903);  // sqrt(8)
    EXPECT_DOUBLE_EQ(p1.distSquared(p2), 8.0);
}

TEST(VectorMathTest, VectorPositionConversion) {
    Position p(1.0, 2.0);
    Vector v = p;
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);

    Vector v2(3.0, 4.0);
    Position p2(v2);
    EXPECT_DOUBLE_EQ(p2.x, 3.0);
    EXPECT_DOUBLE_EQ(p2.y, 4.0);
}

TEST(VectorMathTest, DotProduct) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v1.dotProduct(v2), 11.0);  // 1*3 + 2*4
}
