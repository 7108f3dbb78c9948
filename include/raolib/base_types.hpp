#ifndef RAOLIB_BASE_TYPES_HPP
#define RAOLIB_BASE_TYPES_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <complex>

namespace raolib
{
    /**
     * @brief Period of the wave heading axis in degrees.
     */
    extern const double RAOLIB_cHeadingPeriodDeg;
    /**
     * @brief Phase shift in radians applied to the mirrored column of an antisymmetric mode.
     */
    extern const double RAOLIB_cAntisymmetricPhaseShift;

    using RAOLIB_Axis = std::vector<double>;
    using RAOLIB_Table = std::vector<std::vector<double>>;              // [iDirection][iOmega]
    using RAOLIB_ComplexTable = std::vector<std::vector<std::complex<double>>>; // [iDirection][iOmega]

    /**
     * @brief Rigid body motion mode represented by an RAO.
     *
     * NONE means "not set". Integer values outside the declared range can
     * reach the library through the Python binding; they are rejected wherever
     * the mode matters.
     */
    enum class RAOLIB_MotionMode : int
    {
        NONE = 0,
        SURGE = 1,
        SWAY = 2,
        HEAVE = 3,
        ROLL = 4,
        PITCH = 5,
        YAW = 6,
    };

    /**
     * @brief Behaviour of a mode when the wave heading is mirrored about the xz-plane.
     */
    enum class RAOLIB_Symmetry
    {
        SYMMETRIC,     ///< Sign preserved (surge, heave, pitch)
        ANTISYMMETRIC, ///< Sign reversed, applied as a phase shift of pi (sway, roll, yaw)
    };

    /**
     * @brief True for the six recognized motion modes, false for NONE and out-of-range values.
     */
    bool RAOLIB_MotionMode_isValid(RAOLIB_MotionMode mode);

    /**
     * @brief Returns the symmetry class of a mode.
     *
     * @throws RAOLIB_InvalidConfigurationError if the mode is NONE or not one of the six modes.
     */
    RAOLIB_Symmetry RAOLIB_MotionMode_symmetry(RAOLIB_MotionMode mode);

    /**
     * @brief Degree-of-freedom label used by diffraction solvers ("Surge", ..., "Yaw").
     *
     * @throws RAOLIB_InvalidConfigurationError for NONE or unknown values.
     */
    std::string RAOLIB_MotionMode_toDofName(RAOLIB_MotionMode mode);

    /**
     * @brief Parses a mode name, case-insensitive. "none" and "" give NONE.
     *
     * @throws std::invalid_argument for any other unknown name.
     */
    RAOLIB_MotionMode RAOLIB_MotionMode_fromString(const std::string &name);

    /**
     * @brief Short name for printing; "NONE" or "UNKNOWN(<n>)" outside the six modes.
     */
    std::string RAOLIB_MotionMode_toString(RAOLIB_MotionMode mode);

    struct RAOLIB_Config
    {
    public:
        double cHeadingPeriodDeg;
        bool cWrapPhase; // wrap stored phases into (-pi, pi] after every mutation

        RAOLIB_Config();
        RAOLIB_Config(double cHeadingPeriodDeg, bool cWrapPhase);
    };

}; // namespace raolib

#endif // RAOLIB_BASE_TYPES_HPP
