#include <cctype>
#include <cmath>
#include <stdexcept>
#include "raolib/base_types.hpp"
#include "raolib/exceptions.hpp"

namespace raolib
{
    /**
     * @brief Period of the wave heading axis in degrees.
     */
    const double RAOLIB_cHeadingPeriodDeg = 360.0;
    /**
     * @brief Phase shift in radians applied to the mirrored column of an antisymmetric mode.
     */
    const double RAOLIB_cAntisymmetricPhaseShift = 3.14159265358979323846;

    RAOLIB_Config::RAOLIB_Config()
        : cHeadingPeriodDeg(RAOLIB_cHeadingPeriodDeg),
          cWrapPhase(false) {};

    RAOLIB_Config::RAOLIB_Config(double cHeadingPeriodDeg, bool cWrapPhase)
        : cHeadingPeriodDeg(cHeadingPeriodDeg),
          cWrapPhase(cWrapPhase)
    {
        if (!(cHeadingPeriodDeg > 0.0) || !std::isfinite(cHeadingPeriodDeg))
        {
            throw std::invalid_argument("Heading period must be a positive finite number of degrees");
        }
    };

    bool RAOLIB_MotionMode_isValid(RAOLIB_MotionMode mode)
    {
        switch (mode)
        {
        case RAOLIB_MotionMode::SURGE:
        case RAOLIB_MotionMode::SWAY:
        case RAOLIB_MotionMode::HEAVE:
        case RAOLIB_MotionMode::ROLL:
        case RAOLIB_MotionMode::PITCH:
        case RAOLIB_MotionMode::YAW:
            return true;
        default:
            return false;
        }
    }

    RAOLIB_Symmetry RAOLIB_MotionMode_symmetry(RAOLIB_MotionMode mode)
    {
        switch (mode)
        {
        case RAOLIB_MotionMode::SWAY:
        case RAOLIB_MotionMode::ROLL:
        case RAOLIB_MotionMode::YAW:
            return RAOLIB_Symmetry::ANTISYMMETRIC;
        case RAOLIB_MotionMode::SURGE:
        case RAOLIB_MotionMode::HEAVE:
        case RAOLIB_MotionMode::PITCH:
            return RAOLIB_Symmetry::SYMMETRIC;
        case RAOLIB_MotionMode::NONE:
            throw RAOLIB_InvalidConfigurationError(
                "Mode is not set; the mode is needed to determine how to apply symmetry",
                static_cast<int>(mode));
        default:
            throw RAOLIB_InvalidConfigurationError(
                "Unknown setting for mode; the mode is needed to determine how to apply symmetry. Mode setting = " +
                    RAOLIB_MotionMode_toString(mode),
                static_cast<int>(mode));
        }
    }

    std::string RAOLIB_MotionMode_toDofName(RAOLIB_MotionMode mode)
    {
        switch (mode)
        {
        case RAOLIB_MotionMode::SURGE:
            return "Surge";
        case RAOLIB_MotionMode::SWAY:
            return "Sway";
        case RAOLIB_MotionMode::HEAVE:
            return "Heave";
        case RAOLIB_MotionMode::ROLL:
            return "Roll";
        case RAOLIB_MotionMode::PITCH:
            return "Pitch";
        case RAOLIB_MotionMode::YAW:
            return "Yaw";
        default:
            throw RAOLIB_InvalidConfigurationError(
                "No degree of freedom for mode " + RAOLIB_MotionMode_toString(mode),
                static_cast<int>(mode));
        }
    }

    RAOLIB_MotionMode RAOLIB_MotionMode_fromString(const std::string &name)
    {
        std::string key;
        key.reserve(name.size());
        for (char c : name)
        {
            key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }

        if (key.empty() || key == "none")
            return RAOLIB_MotionMode::NONE;
        if (key == "surge")
            return RAOLIB_MotionMode::SURGE;
        if (key == "sway")
            return RAOLIB_MotionMode::SWAY;
        if (key == "heave")
            return RAOLIB_MotionMode::HEAVE;
        if (key == "roll")
            return RAOLIB_MotionMode::ROLL;
        if (key == "pitch")
            return RAOLIB_MotionMode::PITCH;
        if (key == "yaw")
            return RAOLIB_MotionMode::YAW;

        throw std::invalid_argument("Unknown motion mode: '" + name + "'");
    }

    std::string RAOLIB_MotionMode_toString(RAOLIB_MotionMode mode)
    {
        switch (mode)
        {
        case RAOLIB_MotionMode::NONE:
            return "NONE";
        case RAOLIB_MotionMode::SURGE:
            return "SURGE";
        case RAOLIB_MotionMode::SWAY:
            return "SWAY";
        case RAOLIB_MotionMode::HEAVE:
            return "HEAVE";
        case RAOLIB_MotionMode::ROLL:
            return "ROLL";
        case RAOLIB_MotionMode::PITCH:
            return "PITCH";
        case RAOLIB_MotionMode::YAW:
            return "YAW";
        default:
            return "UNKNOWN(" + std::to_string(static_cast<int>(mode)) + ")";
        }
    }
}; // namespace raolib
