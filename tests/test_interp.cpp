/**
 * @file test_interp.cpp
 * @brief Unit tests for the interpolation kernel and axis expansion
 */

#include <gtest/gtest.h>
#include <cmath>
#include <complex>
#include <stdexcept>
#include "raolib/interp.hpp"

using namespace raolib;

class InterpTest : public ::testing::Test
{
protected:
    static constexpr double EPSILON = 1e-12;
};

TEST_F(InterpTest, TwoPointInterpolation)
{
    double result = 0.0;
    EXPECT_EQ(RAOLIB_interpolate2pt(1.5, 1.0, 10.0, 2.0, 20.0, result), RAOLIB_InterpStatus::SUCCESS);
    EXPECT_NEAR(result, 15.0, EPSILON);

    EXPECT_EQ(RAOLIB_interpolate2pt(1.0, 1.0, 10.0, 1.0, 20.0, result), RAOLIB_InterpStatus::ZERODIVISION);
}

TEST_F(InterpTest, LerpReturnsNodeExactlyAtZeroWeight)
{
    const double a = 0.1 + 0.2;
    EXPECT_EQ(RAOLIB_lerp(a, 1e300, 0.0), a);

    const std::complex<double> z(0.3, -0.7);
    EXPECT_EQ(RAOLIB_lerp(z, std::complex<double>(5.0, 5.0), 0.0), z);
}

TEST_F(InterpTest, LerpOfComplexValues)
{
    std::complex<double> r = RAOLIB_lerp(std::complex<double>(1.0, 0.0), std::complex<double>(0.0, 1.0), 0.5);
    EXPECT_NEAR(r.real(), 0.5, EPSILON);
    EXPECT_NEAR(r.imag(), 0.5, EPSILON);
}

TEST_F(InterpTest, WeightsInsideAndOnNodes)
{
    RAOLIB_Axis axis = {0.0, 1.0, 3.0};
    std::vector<RAOLIB_AxisWeight> w = RAOLIB_linear_weights(axis, {0.5, 1.0, 2.0, 3.0, 0.0});

    ASSERT_EQ(w.size(), 5u);

    EXPECT_EQ(w[0].lower, 0u);
    EXPECT_EQ(w[0].upper, 1u);
    EXPECT_NEAR(w[0].t, 0.5, EPSILON);

    EXPECT_EQ(w[1].lower, 1u);
    EXPECT_EQ(w[1].upper, 1u);
    EXPECT_EQ(w[1].t, 0.0);

    EXPECT_EQ(w[2].lower, 1u);
    EXPECT_EQ(w[2].upper, 2u);
    EXPECT_NEAR(w[2].t, 0.5, EPSILON);

    EXPECT_EQ(w[3].lower, 2u);
    EXPECT_EQ(w[3].upper, 2u);
    EXPECT_EQ(w[3].t, 0.0);

    EXPECT_EQ(w[4].lower, 0u);
    EXPECT_EQ(w[4].t, 0.0);
}

TEST_F(InterpTest, WeightsRejectBadInput)
{
    EXPECT_THROW(RAOLIB_linear_weights({}, {1.0}), std::domain_error);
    EXPECT_THROW(RAOLIB_linear_weights({0.0, 2.0, 1.0}, {1.0}), std::domain_error);
    EXPECT_THROW(RAOLIB_linear_weights({0.0, 1.0, 1.0}, {0.5}), std::domain_error);
    EXPECT_THROW(RAOLIB_linear_weights({0.0, 1.0}, {std::nan("")}), std::invalid_argument);
    EXPECT_THROW(RAOLIB_linear_weights({0.0, 1.0}, {1.5}), std::out_of_range);
    EXPECT_THROW(RAOLIB_linear_weights({0.0, 1.0}, {-0.5}), std::out_of_range);
}

TEST_F(InterpTest, ExpandConstAddsBoundaryCopies)
{
    // unsorted source axis
    RAOLIB_Axis axis = {2.0, 1.0, 3.0};
    RAOLIB_ExpandedAxis e = RAOLIB_expand_axis_const(axis, 0.5, 4.0);

    ASSERT_EQ(e.axis.size(), 5u);
    EXPECT_EQ(e.axis, (RAOLIB_Axis{0.5, 1.0, 2.0, 3.0, 4.0}));
    EXPECT_EQ(e.source_index, (std::vector<std::size_t>{1, 1, 0, 2, 2}));
}

TEST_F(InterpTest, ExpandConstWithinRangeAddsNothing)
{
    RAOLIB_ExpandedAxis e = RAOLIB_expand_axis_const({1.0, 3.0}, 1.0, 2.0);
    EXPECT_EQ(e.axis, (RAOLIB_Axis{1.0, 3.0}));
    EXPECT_EQ(e.source_index, (std::vector<std::size_t>{0, 1}));
}

TEST_F(InterpTest, ExpandConstRejectsDuplicatesAndEmpty)
{
    EXPECT_THROW(RAOLIB_expand_axis_const({}, 0.0, 1.0), std::invalid_argument);
    EXPECT_THROW(RAOLIB_expand_axis_const({1.0, 2.0, 1.0}, 0.0, 3.0), std::invalid_argument);
}

TEST_F(InterpTest, ExpandPeriodicBracketsFullCircle)
{
    RAOLIB_Axis axis = {90.0, 0.0, 350.0};
    RAOLIB_ExpandedAxis e = RAOLIB_expand_axis_periodic(axis, 360.0);

    EXPECT_EQ(e.axis, (RAOLIB_Axis{-10.0, 0.0, 90.0, 350.0, 360.0}));
    EXPECT_EQ(e.source_index, (std::vector<std::size_t>{2, 1, 0, 2, 1}));
}

TEST_F(InterpTest, ExpandPeriodicWrapsNegativeHeadings)
{
    RAOLIB_ExpandedAxis e = RAOLIB_expand_axis_periodic({-30.0, 30.0}, 360.0);
    EXPECT_EQ(e.axis, (RAOLIB_Axis{-30.0, 30.0, 330.0, 390.0}));
    EXPECT_EQ(e.source_index, (std::vector<std::size_t>{0, 1, 0, 1}));
}

TEST_F(InterpTest, ExpandPeriodicDropsCoincidentHeadings)
{
    // 0 and 360 are the same heading; the first one wins
    RAOLIB_ExpandedAxis e = RAOLIB_expand_axis_periodic({0.0, 180.0, 360.0}, 360.0);
    EXPECT_EQ(e.axis, (RAOLIB_Axis{-180.0, 0.0, 180.0, 360.0}));
    EXPECT_EQ(e.source_index, (std::vector<std::size_t>{1, 0, 1, 0}));
}

TEST_F(InterpTest, ExpandPeriodicSingleHeading)
{
    RAOLIB_ExpandedAxis e = RAOLIB_expand_axis_periodic({45.0}, 360.0);
    EXPECT_EQ(e.axis, (RAOLIB_Axis{-315.0, 45.0, 405.0}));
    EXPECT_EQ(e.source_index, (std::vector<std::size_t>{0, 0, 0}));
}

TEST_F(InterpTest, ExpandPeriodicRejectsBadInput)
{
    EXPECT_THROW(RAOLIB_expand_axis_periodic({}, 360.0), std::invalid_argument);
    EXPECT_THROW(RAOLIB_expand_axis_periodic({0.0}, 0.0), std::invalid_argument);
}

TEST_F(InterpTest, WrapPeriodic)
{
    EXPECT_EQ(RAOLIB_wrap_periodic(0.0, 360.0), 0.0);
    EXPECT_EQ(RAOLIB_wrap_periodic(360.0, 360.0), 0.0);
    EXPECT_EQ(RAOLIB_wrap_periodic(-30.0, 360.0), 330.0);
    EXPECT_EQ(RAOLIB_wrap_periodic(725.0, 360.0), 5.0);
    EXPECT_FALSE(std::signbit(RAOLIB_wrap_periodic(-0.0, 360.0)));

    // tiny negative value must not round up to the period itself
    double r = RAOLIB_wrap_periodic(-1e-20, 360.0);
    EXPECT_GE(r, 0.0);
    EXPECT_LT(r, 360.0);
}

TEST_F(InterpTest, SortedUnique)
{
    EXPECT_EQ(RAOLIB_sorted_unique({3.0, 1.0, 3.0, 2.0, 1.0}), (RAOLIB_Axis{1.0, 2.0, 3.0}));
}
