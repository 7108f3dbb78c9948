#include <cmath>
#include <complex>
#include <string>
#include "raolib/adapters.hpp"
#include "raolib/exceptions.hpp"
#include "raolib/log.hpp"

namespace raolib
{
    static void RAOLIB_check_same_shape(const RAOLIB_ComplexTable &a, const RAOLIB_ComplexTable &b, const char *what)
    {
        const std::size_t cols = a.empty() ? 0 : a.front().size();
        if (a.size() != b.size())
        {
            throw RAOLIB_ShapeMismatchError(std::string(what) + ": row count differs",
                                            a.size(), cols, b.size(), b.empty() ? 0 : b.front().size());
        }
        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (a[i].size() != b[i].size())
            {
                throw RAOLIB_ShapeMismatchError(std::string(what) + ": row length differs",
                                                a.size(), a[i].size(), b.size(), b[i].size());
            }
        }
    }

    RAOLIB_ComplexTable RAOLIB_excitation_from_fields(const RAOLIB_ForceFields &fields)
    {
        if (!fields.excitation.empty())
        {
            return fields.excitation;
        }

        RAOLIB_DEBUG("No excitation field, summing Froude-Krylov and diffraction");
        RAOLIB_check_same_shape(fields.froude_krylov, fields.diffraction, "Froude-Krylov vs diffraction force");

        RAOLIB_ComplexTable out(fields.froude_krylov);
        for (std::size_t i = 0; i < out.size(); ++i)
        {
            for (std::size_t j = 0; j < out[i].size(); ++j)
            {
                out[i][j] += fields.diffraction[i][j];
            }
        }
        return out;
    }

    RAOLIB_Rao RAOLIB_from_complex(
        const RAOLIB_Axis &wave_directions,
        const RAOLIB_Axis &omegas,
        const RAOLIB_ComplexTable &values,
        RAOLIB_MotionMode mode,
        const RAOLIB_Config &config)
    {
        RAOLIB_Table amplitude(values.size());
        RAOLIB_Table phase(values.size());
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            amplitude[i].reserve(values[i].size());
            phase[i].reserve(values[i].size());
            for (const std::complex<double> &z : values[i])
            {
                amplitude[i].push_back(std::abs(z));
                phase[i].push_back(std::arg(z));
            }
        }
        // set_data checks the shape against the axes
        return RAOLIB_Rao(wave_directions, omegas, amplitude, phase, mode, config);
    }

    RAOLIB_Rao RAOLIB_wave_force_from_fields(
        const RAOLIB_Axis &wave_directions,
        const RAOLIB_Axis &omegas,
        const RAOLIB_ForceFields &fields,
        RAOLIB_MotionMode mode,
        const RAOLIB_Config &config)
    {
        if (!RAOLIB_MotionMode_isValid(mode))
        {
            throw RAOLIB_InvalidConfigurationError(
                "A wave force needs one of the six motion modes, got " + RAOLIB_MotionMode_toString(mode),
                static_cast<int>(mode));
        }
        RAOLIB_DEBUG("Wave force for dof %s", RAOLIB_MotionMode_toDofName(mode).c_str());
        return RAOLIB_from_complex(wave_directions, omegas, RAOLIB_excitation_from_fields(fields), mode, config);
    }

    RAOLIB_RealImag RAOLIB_to_real_imag(const RAOLIB_Rao &rao)
    {
        RAOLIB_RealImag out;
        out.wave_directions = rao.wave_directions();
        out.omegas = rao.omegas();
        out.mode = rao.mode();

        const std::size_t n_dir = rao.n_wave_directions();
        const std::size_t n_omega = rao.n_frequencies();
        out.real.assign(n_dir, std::vector<double>(n_omega));
        out.imag.assign(n_dir, std::vector<double>(n_omega));

        for (std::size_t i = 0; i < n_dir; ++i)
        {
            for (std::size_t j = 0; j < n_omega; ++j)
            {
                const std::complex<double> z = rao.amplitude_at(i, j) * std::polar(1.0, rao.phase_at(i, j));
                out.real[i][j] = z.real();
                out.imag[i][j] = z.imag();
            }
        }
        return out;
    }

    RAOLIB_Rao RAOLIB_from_real_imag(const RAOLIB_RealImag &data, const RAOLIB_Config &config)
    {
        if (!RAOLIB_MotionMode_isValid(data.mode))
        {
            throw RAOLIB_InvalidConfigurationError(
                "Mode shall be one of the six motion modes, got " + RAOLIB_MotionMode_toString(data.mode),
                static_cast<int>(data.mode));
        }

        if (data.real.size() != data.imag.size())
        {
            throw RAOLIB_ShapeMismatchError("Real and imaginary parts differ in row count",
                                            data.wave_directions.size(), data.omegas.size(),
                                            data.imag.size(), data.imag.empty() ? 0 : data.imag.front().size());
        }

        RAOLIB_ComplexTable values(data.real.size());
        for (std::size_t i = 0; i < data.real.size(); ++i)
        {
            if (data.real[i].size() != data.imag[i].size())
            {
                throw RAOLIB_ShapeMismatchError("Real and imaginary parts differ in row length",
                                                data.wave_directions.size(), data.omegas.size(),
                                                data.imag.size(), data.imag[i].size());
            }
            values[i].reserve(data.real[i].size());
            for (std::size_t j = 0; j < data.real[i].size(); ++j)
            {
                values[i].push_back(std::complex<double>(data.real[i][j], data.imag[i][j]));
            }
        }

        return RAOLIB_from_complex(data.wave_directions, data.omegas, values, data.mode, config);
    }
}; // namespace raolib
