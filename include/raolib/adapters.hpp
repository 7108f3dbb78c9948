#ifndef RAOLIB_ADAPTERS_HPP
#define RAOLIB_ADAPTERS_HPP

#include "raolib/base_types.hpp"
#include "raolib/rao.hpp"

namespace raolib
{
    /**
     * @brief Complex wave force fields of one degree of freedom, as a diffraction solver reports them.
     *
     * All tables are [iDirection][iOmega]. An empty `excitation` table means
     * the solver did not write the combined field.
     */
    struct RAOLIB_ForceFields
    {
    public:
        RAOLIB_ComplexTable excitation;
        RAOLIB_ComplexTable froude_krylov;
        RAOLIB_ComplexTable diffraction;
    };

    /**
     * @brief RAO with the complex values split in real and imaginary parts.
     *
     * For storage formats without complex numbers:
     * real = amplitude * cos(phase), imag = amplitude * sin(phase).
     */
    struct RAOLIB_RealImag
    {
    public:
        RAOLIB_Axis wave_directions;
        RAOLIB_Axis omegas;
        RAOLIB_Table real;
        RAOLIB_Table imag;
        RAOLIB_MotionMode mode;

        RAOLIB_RealImag() : mode(RAOLIB_MotionMode::NONE) {}
    };

    /**
     * @brief The excitation force: the stored field if present, otherwise Froude-Krylov + diffraction.
     *
     * @throws RAOLIB_ShapeMismatchError if the two sub-fields differ in shape.
     */
    RAOLIB_ComplexTable RAOLIB_excitation_from_fields(const RAOLIB_ForceFields &fields);

    /**
     * @brief Builds an RAO with amplitude = |z| and phase = arg(z).
     *
     * @throws RAOLIB_ShapeMismatchError if `values` does not match the axes.
     */
    RAOLIB_Rao RAOLIB_from_complex(
        const RAOLIB_Axis &wave_directions,
        const RAOLIB_Axis &omegas,
        const RAOLIB_ComplexTable &values,
        RAOLIB_MotionMode mode,
        const RAOLIB_Config &config = RAOLIB_Config());

    /**
     * @brief Wave force RAO of one mode from solver force fields.
     */
    RAOLIB_Rao RAOLIB_wave_force_from_fields(
        const RAOLIB_Axis &wave_directions,
        const RAOLIB_Axis &omegas,
        const RAOLIB_ForceFields &fields,
        RAOLIB_MotionMode mode,
        const RAOLIB_Config &config = RAOLIB_Config());

    RAOLIB_RealImag RAOLIB_to_real_imag(const RAOLIB_Rao &rao);

    /**
     * @brief Inverse of RAOLIB_to_real_imag.
     *
     * @throws RAOLIB_InvalidConfigurationError if data.mode is not one of the six modes.
     * @throws RAOLIB_ShapeMismatchError if real and imag do not match the axes.
     */
    RAOLIB_Rao RAOLIB_from_real_imag(const RAOLIB_RealImag &data, const RAOLIB_Config &config = RAOLIB_Config());

}; // namespace raolib

#endif // RAOLIB_ADAPTERS_HPP
