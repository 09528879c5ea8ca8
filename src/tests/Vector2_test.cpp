#include "core/Vector2.h"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <spdlog/spdlog.h>

using namespace BouncePit;

namespace {

bool almostEqual(double a, double b, double epsilon = 1e-9)
{
    return std::abs(a - b) < epsilon;
}

bool almostEqual(const Vector2d& a, const Vector2d& b, double epsilon = 1e-9)
{
    return almostEqual(a.x, b.x, epsilon) && almostEqual(a.y, b.y, epsilon);
}

} // namespace

TEST(Vector2Test, DefaultIsZero)
{
    spdlog::info("Starting Vector2Test::DefaultIsZero test");
    Vector2d v;
    EXPECT_EQ(v.x, 0.0);
    EXPECT_EQ(v.y, 0.0);

    Vector2d w{ 1.0, 2.0 };
    EXPECT_EQ(w.x, 1.0);
    EXPECT_EQ(w.y, 2.0);
}

TEST(Vector2Test, Operators)
{
    spdlog::info("Starting Vector2Test::Operators test");
    Vector2d v1{ 1.0, 2.0 };
    Vector2d v2{ 3.0, 4.0 };

    EXPECT_TRUE(almostEqual(v1 + v2, Vector2d{ 4.0, 6.0 }));
    EXPECT_TRUE(almostEqual(v2 - v1, Vector2d{ 2.0, 2.0 }));
    EXPECT_TRUE(almostEqual(v1 * 2.0, Vector2d{ 2.0, 4.0 }));
    EXPECT_TRUE(almostEqual(2.0 * v1, Vector2d{ 2.0, 4.0 }));
    EXPECT_TRUE(almostEqual(v2 / 2.0, Vector2d{ 1.5, 2.0 }));
    EXPECT_TRUE(almostEqual(-v1, Vector2d{ -1.0, -2.0 }));

    v1 += v2;
    EXPECT_TRUE(almostEqual(v1, Vector2d{ 4.0, 6.0 }));
    v1 -= v2;
    EXPECT_TRUE(almostEqual(v1, Vector2d{ 1.0, 2.0 }));
    v1 *= 2.0;
    EXPECT_TRUE(almostEqual(v1, Vector2d{ 2.0, 4.0 }));

    EXPECT_TRUE((Vector2d{ 2.0, 4.0 } == v1));
    EXPECT_TRUE(v1 != v2);
}

TEST(Vector2Test, MagnitudeDotAndNormalize)
{
    spdlog::info("Starting Vector2Test::MagnitudeDotAndNormalize test");
    Vector2d v{ 3.0, 4.0 };

    EXPECT_DOUBLE_EQ(v.mag(), 5.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.magnitudeSquared(), 25.0);
    EXPECT_DOUBLE_EQ(v.dot(Vector2d{ 1.0, 2.0 }), 11.0);
    EXPECT_TRUE(almostEqual(v.normalize(), Vector2d{ 0.6, 0.8 }));
}

TEST(Vector2Test, EdgeCases)
{
    spdlog::info("Starting Vector2Test::EdgeCases test");
    Vector2d v{ 1.0, 2.0 };

    EXPECT_THROW(v / 0.0, std::runtime_error);

    // A zero vector has no direction and is returned unchanged.
    Vector2d zero;
    EXPECT_TRUE(almostEqual(zero.normalize(), zero));

    EXPECT_TRUE(v.isFinite());
    EXPECT_FALSE((Vector2d{ std::numeric_limits<double>::quiet_NaN(), 0.0 }.isFinite()));
    EXPECT_FALSE((Vector2d{ 0.0, std::numeric_limits<double>::infinity() }.isFinite()));
}

TEST(Vector2Test, JsonRoundTrip)
{
    spdlog::info("Starting Vector2Test::JsonRoundTrip test");
    Vector2d v{ 1.5, -2.25 };
    nlohmann::json j = v;

    EXPECT_EQ(j["x"].get<double>(), 1.5);
    EXPECT_EQ(j["y"].get<double>(), -2.25);
    EXPECT_EQ(j.get<Vector2d>(), v);
}
