#ifndef RAOLIB_RAO_HPP
#define RAOLIB_RAO_HPP

#include <complex>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>
#include "raolib/base_types.hpp"

namespace raolib
{
    /**
     * @brief Named data channels of an RAO.
     */
    enum class RAOLIB_RaoChannel
    {
        AMPLITUDE,    ///< Amplitude [any unit], never negative
        PHASE,        ///< Phase [rad]
        PHASE_VECTOR, ///< exp(i * phase), derived on request
    };

    /**
     * @brief Parses "amplitude", "phase", "phase_vector" or its alias "complex_unit".
     *
     * @throws std::invalid_argument for any other name.
     */
    RAOLIB_RaoChannel RAOLIB_RaoChannel_fromString(const std::string &name);

    /**
     * @brief Response Amplitude Operator: amplitude and phase on a wave heading x omega grid.
     *
     * - wave directions in degrees, circular with period RAOLIB_Config::cHeadingPeriodDeg
     * - omega in rad/s
     * - amplitude >= 0, phase in radians
     *
     * Amplitude and phase are interpolated as separate channels. The phase is
     * interpolated through its unit vector exp(i * phase) and converted back
     * with atan2, so an interpolated complex value never loses amplitude.
     *
     * Every mutating method builds a complete new grid before replacing the
     * current one; when it throws, the grid is unchanged.
     *
     * The mode determines how symmetry is applied. For heave it does not
     * matter whether a wave comes from starboard or port, for roll it does.
     */
    class RAOLIB_Rao
    {
    public:
        /**
         * @brief Placeholder grid: directions {0, 180}, omegas {0, 4}, zero data, no mode.
         */
        RAOLIB_Rao();
        explicit RAOLIB_Rao(const RAOLIB_Config &config);

        /**
         * @brief Builds a grid from raw arrays; see set_data().
         */
        RAOLIB_Rao(
            const RAOLIB_Axis &wave_directions,
            const RAOLIB_Axis &omegas,
            const RAOLIB_Table &amplitude,
            const RAOLIB_Table &phase,
            RAOLIB_MotionMode mode = RAOLIB_MotionMode::NONE,
            const RAOLIB_Config &config = RAOLIB_Config());

        /**
         * @brief Sets the data to the provided values.
         *
         * @param wave_directions Wave directions [deg], distinct, any order.
         * @param omegas Wave frequencies [rad/s], distinct, any order.
         * @param amplitude Amplitudes [iDirection][iOmega], >= 0.
         * @param phase Phases [iDirection][iOmega] in radians.
         * @param mode Optional, only mandatory when applying symmetry.
         *
         * @throws RAOLIB_ShapeMismatchError if a table does not match the axes.
         * @throws std::invalid_argument for empty axes, duplicate or non-finite
         *         coordinates, negative or non-finite amplitudes, non-finite phases.
         */
        void set_data(
            const RAOLIB_Axis &wave_directions,
            const RAOLIB_Axis &omegas,
            const RAOLIB_Table &amplitude,
            const RAOLIB_Table &phase,
            RAOLIB_MotionMode mode = RAOLIB_MotionMode::NONE);

        std::size_t n_frequencies() const;
        std::size_t n_wave_directions() const;
        const RAOLIB_Axis &wave_directions() const;
        const RAOLIB_Axis &omegas() const;

        RAOLIB_MotionMode mode() const;
        void set_mode(RAOLIB_MotionMode mode);
        const RAOLIB_Config &config() const;

        /**
         * @throws std::out_of_range for indices outside the grid.
         */
        double amplitude_at(std::size_t i_direction, std::size_t i_omega) const;
        double phase_at(std::size_t i_direction, std::size_t i_omega) const;

        /**
         * @brief Copy of the AMPLITUDE or PHASE channel, [iDirection][iOmega].
         *
         * @throws std::invalid_argument for PHASE_VECTOR; use phase_vector().
         */
        RAOLIB_Table values(RAOLIB_RaoChannel channel) const;

        /**
         * @brief exp(i * phase) for the whole grid, computed on every call.
         */
        RAOLIB_ComplexTable phase_vector() const;

        /**
         * @brief Regrids the omega axis to new_omegas [rad/s].
         *
         * Omegas outside the current range take the value of the nearest
         * boundary column (constant extrapolation).
         *
         * @throws std::invalid_argument if new_omegas is empty or holds NaN/inf.
         */
        void regrid_omega(const RAOLIB_Axis &new_omegas);

        /**
         * @brief Regrids the wave direction axis to new_headings [deg].
         *
         * The heading axis is periodic: interpolation between the largest and
         * the smallest heading runs across the wrap point.
         *
         * @throws std::invalid_argument if new_headings is empty or holds NaN/inf.
         */
        void regrid_direction(const RAOLIB_Axis &new_headings);

        /**
         * @brief Adds the given direction [deg] by interpolation, unless exactly present.
         */
        void add_direction(double wave_direction);

        /**
         * @brief Adds the given frequency [rad/s] by interpolation, unless exactly present.
         *
         * @note Presence is tested with exact floating point equality, so a
         *       value that differs from a grid omega by rounding is added as a
         *       new, nearly coincident column.
         */
        void add_frequency(double omega);

        /**
         * @brief Makes (wave_direction, omega) a grid node.
         *
         * For linear interpolation the order of the two insertions does not matter.
         */
        void ensure_point(double wave_direction, double omega);

        /**
         * @brief Returns amplitude * exp(i * phase) at the requested position.
         *
         * If the data point is not yet available, the direction and frequency
         * are added to the grid by linear interpolation first.
         */
        std::complex<double> get_value(double wave_direction, double omega);

        /**
         * @brief Scales the amplitude.
         *
         * @throws std::domain_error if factor < 0 or not finite. An opposite
         *         response is a phase change of pi, not a negative amplitude.
         */
        void scale(double factor);

        /**
         * @brief Appends the headings equivalent under xz-plane symmetry.
         *
         * The RAO for heading a equals the RAO for heading -a, except that
         * sway, roll and yaw change sign (phase shift of pi). Mirrors already
         * present (compared modulo the heading period) are skipped, so applying
         * it twice is the same as once.
         *
         * @throws RAOLIB_InvalidConfigurationError if the mode is unset or unknown.
         */
        void add_symmetry_xz();

        std::string to_string() const;

    private:
        RAOLIB_Config settings;
        RAOLIB_MotionMode motion_mode;
        RAOLIB_Axis direction_axis;
        RAOLIB_Axis omega_axis;
        std::vector<double> amplitude_data; // row-major [iDirection * n_omega + iOmega]
        std::vector<double> phase_data;

        std::size_t flat_index(std::size_t i_direction, std::size_t i_omega) const;

        void commit(
            RAOLIB_Axis &&wave_directions,
            RAOLIB_Axis &&omegas,
            std::vector<double> &&amplitude,
            std::vector<double> &&phase);
    };

    std::ostream &operator<<(std::ostream &os, const RAOLIB_Rao &rao);

}; // namespace raolib

#endif // RAOLIB_RAO_HPP
