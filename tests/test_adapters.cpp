/**
 * @file test_adapters.cpp
 * @brief Unit tests for solver force fields and the real/imaginary representation
 */

#include <gtest/gtest.h>
#include <cmath>
#include <complex>
#include "raolib/adapters.hpp"
#include "raolib/exceptions.hpp"

using namespace raolib;

class AdaptersTest : public ::testing::Test
{
protected:
    static constexpr double EPSILON = 1e-12;
    typedef std::complex<double> cplx;
};

// ============================================================================
// Force fields
// ============================================================================

TEST_F(AdaptersTest, ExcitationFieldIsUsedWhenPresent)
{
    RAOLIB_ForceFields fields;
    fields.excitation = {{cplx(1.0, 2.0)}};
    fields.froude_krylov = {{cplx(10.0, 0.0)}};
    fields.diffraction = {{cplx(0.0, 10.0)}};

    RAOLIB_ComplexTable e = RAOLIB_excitation_from_fields(fields);
    EXPECT_EQ(e, (RAOLIB_ComplexTable{{cplx(1.0, 2.0)}}));
}

TEST_F(AdaptersTest, ExcitationIsSumOfSubFields)
{
    RAOLIB_ForceFields fields;
    fields.froude_krylov = {{cplx(1.0, 1.0), cplx(2.0, 0.0)}};
    fields.diffraction = {{cplx(0.5, -1.0), cplx(0.0, 3.0)}};

    RAOLIB_ComplexTable e = RAOLIB_excitation_from_fields(fields);
    EXPECT_EQ(e, (RAOLIB_ComplexTable{{cplx(1.5, 0.0), cplx(2.0, 3.0)}}));
}

TEST_F(AdaptersTest, ExcitationSubFieldShapeMismatch)
{
    RAOLIB_ForceFields fields;
    fields.froude_krylov = {{cplx(1.0, 1.0), cplx(2.0, 0.0)}};
    fields.diffraction = {{cplx(0.5, -1.0)}};
    EXPECT_THROW(RAOLIB_excitation_from_fields(fields), RAOLIB_ShapeMismatchError);

    fields.diffraction = {{cplx(0.5, -1.0), cplx(0.0, 0.0)}, {cplx(0.0, 0.0), cplx(0.0, 0.0)}};
    EXPECT_THROW(RAOLIB_excitation_from_fields(fields), RAOLIB_ShapeMismatchError);
}

TEST_F(AdaptersTest, FromComplexGivesMagnitudeAndAngle)
{
    RAOLIB_Rao rao = RAOLIB_from_complex({0.0, 90.0}, {1.0}, {{cplx(0.0, 2.0)}, {cplx(-3.0, 0.0)}}, RAOLIB_MotionMode::SURGE);

    EXPECT_NEAR(rao.amplitude_at(0, 0), 2.0, EPSILON);
    EXPECT_NEAR(rao.phase_at(0, 0), 3.14159265358979323846 / 2.0, EPSILON);
    EXPECT_NEAR(rao.amplitude_at(1, 0), 3.0, EPSILON);
    EXPECT_NEAR(std::abs(rao.phase_at(1, 0)), 3.14159265358979323846, EPSILON);
    EXPECT_EQ(rao.mode(), RAOLIB_MotionMode::SURGE);

    EXPECT_THROW(RAOLIB_from_complex({0.0, 90.0}, {1.0}, {{cplx(1.0, 0.0)}}, RAOLIB_MotionMode::SURGE),
                 RAOLIB_ShapeMismatchError);
}

TEST_F(AdaptersTest, WaveForceFromFields)
{
    RAOLIB_ForceFields fields;
    fields.froude_krylov = {{cplx(3.0, 0.0)}, {cplx(0.0, 1.0)}};
    fields.diffraction = {{cplx(0.0, 4.0)}, {cplx(0.0, 1.0)}};

    RAOLIB_Rao rao = RAOLIB_wave_force_from_fields({0.0, 180.0}, {0.8}, fields, RAOLIB_MotionMode::HEAVE);
    EXPECT_NEAR(rao.amplitude_at(0, 0), 5.0, EPSILON);
    EXPECT_NEAR(rao.amplitude_at(1, 0), 2.0, EPSILON);
    EXPECT_EQ(rao.mode(), RAOLIB_MotionMode::HEAVE);

    EXPECT_THROW(RAOLIB_wave_force_from_fields({0.0, 180.0}, {0.8}, fields, RAOLIB_MotionMode::NONE),
                 RAOLIB_InvalidConfigurationError);
}

// ============================================================================
// Real / imaginary representation
// ============================================================================

TEST_F(AdaptersTest, ToRealImag)
{
    RAOLIB_Rao rao({0.0}, {1.0, 2.0}, {{2.0, 1.0}}, {{0.0, 3.14159265358979323846 / 2.0}}, RAOLIB_MotionMode::PITCH);
    RAOLIB_RealImag data = RAOLIB_to_real_imag(rao);

    EXPECT_EQ(data.wave_directions, (RAOLIB_Axis{0.0}));
    EXPECT_EQ(data.omegas, (RAOLIB_Axis{1.0, 2.0}));
    EXPECT_EQ(data.mode, RAOLIB_MotionMode::PITCH);
    EXPECT_NEAR(data.real[0][0], 2.0, EPSILON);
    EXPECT_NEAR(data.imag[0][0], 0.0, EPSILON);
    EXPECT_NEAR(data.real[0][1], 0.0, EPSILON);
    EXPECT_NEAR(data.imag[0][1], 1.0, EPSILON);
}

TEST_F(AdaptersTest, RealImagRoundTrip)
{
    RAOLIB_Rao rao({0.0, 45.0, 90.0}, {0.5, 1.0},
                   {{1.0, 2.0}, {0.5, 0.25}, {3.0, 0.0}},
                   {{0.1, -2.0}, {3.0, 1.0}, {-0.5, 0.0}},
                   RAOLIB_MotionMode::ROLL);

    RAOLIB_Rao back = RAOLIB_from_real_imag(RAOLIB_to_real_imag(rao));

    EXPECT_EQ(back.wave_directions(), rao.wave_directions());
    EXPECT_EQ(back.omegas(), rao.omegas());
    EXPECT_EQ(back.mode(), RAOLIB_MotionMode::ROLL);
    for (std::size_t i = 0; i < 3; ++i)
    {
        for (std::size_t j = 0; j < 2; ++j)
        {
            EXPECT_NEAR(back.amplitude_at(i, j), rao.amplitude_at(i, j), EPSILON);
            if (rao.amplitude_at(i, j) > 0.0)
            {
                EXPECT_NEAR(back.phase_at(i, j), rao.phase_at(i, j), 1e-12);
            }
        }
    }
}

TEST_F(AdaptersTest, FromRealImagRequiresMode)
{
    RAOLIB_RealImag data;
    data.wave_directions = {0.0};
    data.omegas = {1.0};
    data.real = {{1.0}};
    data.imag = {{0.0}};

    try
    {
        RAOLIB_from_real_imag(data);
        FAIL() << "Expected RAOLIB_InvalidConfigurationError";
    }
    catch (const RAOLIB_InvalidConfigurationError &e)
    {
        EXPECT_EQ(e.mode_value, 0);
    }

    data.mode = RAOLIB_MotionMode::HEAVE;
    EXPECT_NO_THROW(RAOLIB_from_real_imag(data));
}

TEST_F(AdaptersTest, FromRealImagShapeMismatch)
{
    RAOLIB_RealImag data;
    data.wave_directions = {0.0};
    data.omegas = {1.0, 2.0};
    data.real = {{1.0, 2.0}};
    data.imag = {{0.0}};
    data.mode = RAOLIB_MotionMode::SWAY;
    EXPECT_THROW(RAOLIB_from_real_imag(data), RAOLIB_ShapeMismatchError);

    data.imag = {{0.0, 0.0}, {0.0, 0.0}};
    EXPECT_THROW(RAOLIB_from_real_imag(data), RAOLIB_ShapeMismatchError);
}
