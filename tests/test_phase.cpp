/**
 * @file test_phase.cpp
 * @brief Unit tests for phase <-> unit vector conversion
 */

#include <gtest/gtest.h>
#include <cmath>
#include <complex>
#include <vector>
#include "raolib/phase.hpp"

using namespace raolib;

static const double PI = 3.14159265358979323846;

TEST(PhaseVectorTest, UnitMagnitude)
{
    std::vector<std::complex<double>> v = RAOLIB_to_phase_vector({0.0, 0.5, -2.0, 7.0, 100.0});
    ASSERT_EQ(v.size(), 5u);
    for (const std::complex<double> &z : v)
    {
        EXPECT_NEAR(std::abs(z), 1.0, 1e-14);
    }
}

TEST(PhaseVectorTest, RoundTripIsModuloTwoPi)
{
    std::vector<double> phase = {0.0, 1.0, -3.0, 3.0, 4.0, -7.5, 20.0};
    std::vector<double> back = RAOLIB_from_phase_vector(RAOLIB_to_phase_vector(phase));

    ASSERT_EQ(back.size(), phase.size());
    for (std::size_t i = 0; i < phase.size(); ++i)
    {
        EXPECT_GE(back[i], -PI);
        EXPECT_LE(back[i], PI);
        // same angle on the circle
        EXPECT_NEAR(std::cos(back[i]), std::cos(phase[i]), 1e-12);
        EXPECT_NEAR(std::sin(back[i]), std::sin(phase[i]), 1e-12);
    }
}

TEST(PhaseVectorTest, PrincipalValuesSurviveUnchanged)
{
    std::vector<double> phase = {0.0, 0.25, -1.0, 2.5};
    std::vector<double> back = RAOLIB_from_phase_vector(RAOLIB_to_phase_vector(phase));
    for (std::size_t i = 0; i < phase.size(); ++i)
    {
        EXPECT_NEAR(back[i], phase[i], 1e-14);
    }
}

TEST(PhaseVectorTest, WrapPhase)
{
    EXPECT_NEAR(RAOLIB_wrap_phase(2.0 * PI + 0.5), 0.5, 1e-12);
    EXPECT_NEAR(RAOLIB_wrap_phase(-2.0 * PI - 0.5), -0.5, 1e-12);
    EXPECT_NEAR(std::abs(RAOLIB_wrap_phase(PI + 1e-3)), PI - 1e-3, 1e-12);
}
