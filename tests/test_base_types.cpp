/**
 * @file test_base_types.cpp
 * @brief Unit tests for motion modes, symmetry classes and the configuration struct
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "raolib/base_types.hpp"
#include "raolib/exceptions.hpp"
#include "raolib/log.hpp"

using namespace raolib;

// ============================================================================
// Motion mode tests
// ============================================================================

TEST(MotionModeTest, SixModesAreValid)
{
    EXPECT_TRUE(RAOLIB_MotionMode_isValid(RAOLIB_MotionMode::SURGE));
    EXPECT_TRUE(RAOLIB_MotionMode_isValid(RAOLIB_MotionMode::SWAY));
    EXPECT_TRUE(RAOLIB_MotionMode_isValid(RAOLIB_MotionMode::HEAVE));
    EXPECT_TRUE(RAOLIB_MotionMode_isValid(RAOLIB_MotionMode::ROLL));
    EXPECT_TRUE(RAOLIB_MotionMode_isValid(RAOLIB_MotionMode::PITCH));
    EXPECT_TRUE(RAOLIB_MotionMode_isValid(RAOLIB_MotionMode::YAW));

    EXPECT_FALSE(RAOLIB_MotionMode_isValid(RAOLIB_MotionMode::NONE));
    EXPECT_FALSE(RAOLIB_MotionMode_isValid(static_cast<RAOLIB_MotionMode>(7)));
    EXPECT_FALSE(RAOLIB_MotionMode_isValid(static_cast<RAOLIB_MotionMode>(-1)));
}

TEST(MotionModeTest, SymmetryClassification)
{
    EXPECT_EQ(RAOLIB_MotionMode_symmetry(RAOLIB_MotionMode::SURGE), RAOLIB_Symmetry::SYMMETRIC);
    EXPECT_EQ(RAOLIB_MotionMode_symmetry(RAOLIB_MotionMode::HEAVE), RAOLIB_Symmetry::SYMMETRIC);
    EXPECT_EQ(RAOLIB_MotionMode_symmetry(RAOLIB_MotionMode::PITCH), RAOLIB_Symmetry::SYMMETRIC);

    EXPECT_EQ(RAOLIB_MotionMode_symmetry(RAOLIB_MotionMode::SWAY), RAOLIB_Symmetry::ANTISYMMETRIC);
    EXPECT_EQ(RAOLIB_MotionMode_symmetry(RAOLIB_MotionMode::ROLL), RAOLIB_Symmetry::ANTISYMMETRIC);
    EXPECT_EQ(RAOLIB_MotionMode_symmetry(RAOLIB_MotionMode::YAW), RAOLIB_Symmetry::ANTISYMMETRIC);
}

TEST(MotionModeTest, SymmetryRejectsUnsetMode)
{
    EXPECT_THROW(RAOLIB_MotionMode_symmetry(RAOLIB_MotionMode::NONE), RAOLIB_InvalidConfigurationError);
}

TEST(MotionModeTest, SymmetryRejectsUnknownModeAndKeepsValue)
{
    try
    {
        RAOLIB_MotionMode_symmetry(static_cast<RAOLIB_MotionMode>(42));
        FAIL() << "Expected RAOLIB_InvalidConfigurationError";
    }
    catch (const RAOLIB_InvalidConfigurationError &e)
    {
        EXPECT_EQ(e.mode_value, 42);
        EXPECT_NE(std::string(e.what()).find("UNKNOWN(42)"), std::string::npos);
    }
}

TEST(MotionModeTest, DofNames)
{
    EXPECT_EQ(RAOLIB_MotionMode_toDofName(RAOLIB_MotionMode::SURGE), "Surge");
    EXPECT_EQ(RAOLIB_MotionMode_toDofName(RAOLIB_MotionMode::SWAY), "Sway");
    EXPECT_EQ(RAOLIB_MotionMode_toDofName(RAOLIB_MotionMode::HEAVE), "Heave");
    EXPECT_EQ(RAOLIB_MotionMode_toDofName(RAOLIB_MotionMode::ROLL), "Roll");
    EXPECT_EQ(RAOLIB_MotionMode_toDofName(RAOLIB_MotionMode::PITCH), "Pitch");
    EXPECT_EQ(RAOLIB_MotionMode_toDofName(RAOLIB_MotionMode::YAW), "Yaw");
    EXPECT_THROW(RAOLIB_MotionMode_toDofName(RAOLIB_MotionMode::NONE), RAOLIB_InvalidConfigurationError);
}

TEST(MotionModeTest, ParseIsCaseInsensitive)
{
    EXPECT_EQ(RAOLIB_MotionMode_fromString("Heave"), RAOLIB_MotionMode::HEAVE);
    EXPECT_EQ(RAOLIB_MotionMode_fromString("ROLL"), RAOLIB_MotionMode::ROLL);
    EXPECT_EQ(RAOLIB_MotionMode_fromString("yaw"), RAOLIB_MotionMode::YAW);
    EXPECT_EQ(RAOLIB_MotionMode_fromString("none"), RAOLIB_MotionMode::NONE);
    EXPECT_EQ(RAOLIB_MotionMode_fromString(""), RAOLIB_MotionMode::NONE);
    EXPECT_THROW(RAOLIB_MotionMode_fromString("wobble"), std::invalid_argument);
}

TEST(MotionModeTest, ToStringOfUnknownMode)
{
    EXPECT_EQ(RAOLIB_MotionMode_toString(RAOLIB_MotionMode::PITCH), "PITCH");
    EXPECT_EQ(RAOLIB_MotionMode_toString(RAOLIB_MotionMode::NONE), "NONE");
    EXPECT_EQ(RAOLIB_MotionMode_toString(static_cast<RAOLIB_MotionMode>(9)), "UNKNOWN(9)");
}

// ============================================================================
// Config tests
// ============================================================================

TEST(ConfigTest, Defaults)
{
    RAOLIB_Config config;
    EXPECT_DOUBLE_EQ(config.cHeadingPeriodDeg, 360.0);
    EXPECT_FALSE(config.cWrapPhase);
}

TEST(ConfigTest, RejectsInvalidPeriod)
{
    EXPECT_THROW(RAOLIB_Config(0.0, false), std::invalid_argument);
    EXPECT_THROW(RAOLIB_Config(-360.0, false), std::invalid_argument);
    EXPECT_THROW(RAOLIB_Config(std::numeric_limits<double>::infinity(), false), std::invalid_argument);
    EXPECT_THROW(RAOLIB_Config(std::nan(""), false), std::invalid_argument);
    EXPECT_NO_THROW(RAOLIB_Config(6.283185307179586, true));
}

// ============================================================================
// Logging
// ============================================================================

TEST(LogTest, MinLevelCanBeOverridden)
{
    RAOLIB_LogLevel saved = get_min_level();

    set_min_level(RAOLIB_LogLevel::WARNING);
    EXPECT_EQ(get_min_level(), RAOLIB_LogLevel::WARNING);
    EXPECT_STREQ(level_to_string(RAOLIB_LogLevel::WARNING), "WARNING");
    RAOLIB_WARN("warning from test %d", 1);

    set_min_level(saved);
}

TEST(LogTest, ParseLevelByNameOrNumber)
{
    RAOLIB_LogLevel level = RAOLIB_LogLevel::CRITICAL;
    EXPECT_TRUE(parse_level("debug", level));
    EXPECT_EQ(level, RAOLIB_LogLevel::DEBUG);
    EXPECT_TRUE(parse_level("Warn", level));
    EXPECT_EQ(level, RAOLIB_LogLevel::WARNING);
    EXPECT_TRUE(parse_level("40", level));
    EXPECT_EQ(level, RAOLIB_LogLevel::ERROR);

    EXPECT_FALSE(parse_level("verbose", level));
    EXPECT_FALSE(parse_level("-5", level));
    EXPECT_FALSE(parse_level("", level));
    EXPECT_EQ(level, RAOLIB_LogLevel::ERROR);
}
