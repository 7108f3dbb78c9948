#include <algorithm>
#include <cmath>
#include <numeric>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "raolib/rao.hpp"
#include "raolib/exceptions.hpp"
#include "raolib/interp.hpp"
#include "raolib/phase.hpp"
#include "raolib/log.hpp"

namespace raolib
{
    RAOLIB_RaoChannel RAOLIB_RaoChannel_fromString(const std::string &name)
    {
        if (name == "amplitude")
            return RAOLIB_RaoChannel::AMPLITUDE;
        if (name == "phase")
            return RAOLIB_RaoChannel::PHASE;
        if (name == "phase_vector" || name == "complex_unit")
            return RAOLIB_RaoChannel::PHASE_VECTOR;
        throw std::invalid_argument("Unknown RAO channel: '" + name + "'");
    }

    /**
     * @brief Rejects empty axes, non-finite values and exact duplicates.
     */
    static void RAOLIB_check_axis(const RAOLIB_Axis &axis, const char *name)
    {
        if (axis.empty())
        {
            throw std::invalid_argument(std::string(name) + " axis is empty");
        }
        for (double v : axis)
        {
            if (!std::isfinite(v))
            {
                throw std::invalid_argument(std::string(name) + " axis holds a non-finite value");
            }
        }
        RAOLIB_Axis sorted(axis);
        std::sort(sorted.begin(), sorted.end());
        if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
        {
            throw std::invalid_argument(std::string(name) + " axis holds duplicate values");
        }
    }

    /**
     * @brief Validated, sorted and de-duplicated regrid targets.
     */
    static RAOLIB_Axis RAOLIB_regrid_targets(const RAOLIB_Axis &targets, const char *name)
    {
        if (targets.empty())
        {
            throw std::invalid_argument(std::string("No ") + name + " values requested");
        }
        for (double v : targets)
        {
            if (std::isnan(v))
            {
                throw std::invalid_argument(std::string("Requested ") + name + " is NaN");
            }
            if (std::isinf(v))
            {
                throw std::invalid_argument(std::string("Requested ") + name + " is infinite");
            }
        }
        return RAOLIB_sorted_unique(targets);
    }

    /**
     * @brief Copies a [rows][cols] table into a row-major buffer.
     *
     * @throws RAOLIB_ShapeMismatchError if the table is not rows x cols.
     */
    static std::vector<double> RAOLIB_flatten(const RAOLIB_Table &table, std::size_t rows, std::size_t cols, const char *name)
    {
        if (table.size() != rows)
        {
            throw RAOLIB_ShapeMismatchError(
                std::string(name) + " has " + std::to_string(table.size()) +
                    " rows, expected one per wave direction (" + std::to_string(rows) + ")",
                rows, cols, table.size(), table.empty() ? 0 : table.front().size());
        }

        std::vector<double> flat;
        flat.reserve(rows * cols);
        for (const std::vector<double> &row : table)
        {
            if (row.size() != cols)
            {
                throw RAOLIB_ShapeMismatchError(
                    std::string(name) + " row has " + std::to_string(row.size()) +
                        " values, expected one per omega (" + std::to_string(cols) + ")",
                    rows, cols, table.size(), row.size());
            }
            flat.insert(flat.end(), row.begin(), row.end());
        }
        return flat;
    }

    RAOLIB_Rao::RAOLIB_Rao()
        : RAOLIB_Rao(RAOLIB_Config()) {}

    RAOLIB_Rao::RAOLIB_Rao(const RAOLIB_Config &config)
        : settings(config),
          motion_mode(RAOLIB_MotionMode::NONE),
          direction_axis{0.0, 180.0},
          omega_axis{0.0, 4.0},
          amplitude_data(4, 0.0),
          phase_data(4, 0.0) {}

    RAOLIB_Rao::RAOLIB_Rao(
        const RAOLIB_Axis &wave_directions,
        const RAOLIB_Axis &omegas,
        const RAOLIB_Table &amplitude,
        const RAOLIB_Table &phase,
        RAOLIB_MotionMode mode,
        const RAOLIB_Config &config)
        : RAOLIB_Rao(config)
    {
        this->set_data(wave_directions, omegas, amplitude, phase, mode);
    }

    void RAOLIB_Rao::set_data(
        const RAOLIB_Axis &wave_directions,
        const RAOLIB_Axis &omegas,
        const RAOLIB_Table &amplitude,
        const RAOLIB_Table &phase,
        RAOLIB_MotionMode mode)
    {
        RAOLIB_check_axis(wave_directions, "Wave direction");
        RAOLIB_check_axis(omegas, "Omega");

        std::vector<double> amp = RAOLIB_flatten(amplitude, wave_directions.size(), omegas.size(), "Amplitude");
        std::vector<double> pha = RAOLIB_flatten(phase, wave_directions.size(), omegas.size(), "Phase");

        for (double a : amp)
        {
            if (!(a >= 0.0) || std::isinf(a))
            {
                throw std::invalid_argument("Amplitude must be finite and non-negative");
            }
        }
        for (double p : pha)
        {
            if (!std::isfinite(p))
            {
                throw std::invalid_argument("Phase must be finite");
            }
        }

        this->commit(RAOLIB_Axis(wave_directions), RAOLIB_Axis(omegas), std::move(amp), std::move(pha));
        this->motion_mode = mode;

        RAOLIB_DEBUG("RAO data set: %zu wave directions x %zu omegas, mode %s",
                     this->n_wave_directions(), this->n_frequencies(),
                     RAOLIB_MotionMode_toString(mode).c_str());
    }

    std::size_t RAOLIB_Rao::n_frequencies() const
    {
        return this->omega_axis.size();
    }

    std::size_t RAOLIB_Rao::n_wave_directions() const
    {
        return this->direction_axis.size();
    }

    const RAOLIB_Axis &RAOLIB_Rao::wave_directions() const
    {
        return this->direction_axis;
    }

    const RAOLIB_Axis &RAOLIB_Rao::omegas() const
    {
        return this->omega_axis;
    }

    RAOLIB_MotionMode RAOLIB_Rao::mode() const
    {
        return this->motion_mode;
    }

    void RAOLIB_Rao::set_mode(RAOLIB_MotionMode mode)
    {
        this->motion_mode = mode;
    }

    const RAOLIB_Config &RAOLIB_Rao::config() const
    {
        return this->settings;
    }

    std::size_t RAOLIB_Rao::flat_index(std::size_t i_direction, std::size_t i_omega) const
    {
        if (i_direction >= this->direction_axis.size() || i_omega >= this->omega_axis.size())
        {
            throw std::out_of_range("RAO index out of bounds");
        }
        return i_direction * this->omega_axis.size() + i_omega;
    }

    double RAOLIB_Rao::amplitude_at(std::size_t i_direction, std::size_t i_omega) const
    {
        return this->amplitude_data[this->flat_index(i_direction, i_omega)];
    }

    double RAOLIB_Rao::phase_at(std::size_t i_direction, std::size_t i_omega) const
    {
        return this->phase_data[this->flat_index(i_direction, i_omega)];
    }

    RAOLIB_Table RAOLIB_Rao::values(RAOLIB_RaoChannel channel) const
    {
        const std::vector<double> *source;
        switch (channel)
        {
        case RAOLIB_RaoChannel::AMPLITUDE:
            source = &this->amplitude_data;
            break;
        case RAOLIB_RaoChannel::PHASE:
            source = &this->phase_data;
            break;
        default:
            throw std::invalid_argument("The phase vector channel is complex; use phase_vector()");
        }

        const std::size_t n_omega = this->n_frequencies();
        RAOLIB_Table out;
        out.reserve(this->n_wave_directions());
        for (std::size_t i = 0; i < this->n_wave_directions(); ++i)
        {
            out.emplace_back(source->begin() + i * n_omega, source->begin() + (i + 1) * n_omega);
        }
        return out;
    }

    RAOLIB_ComplexTable RAOLIB_Rao::phase_vector() const
    {
        std::vector<std::complex<double>> unit = RAOLIB_to_phase_vector(this->phase_data);

        const std::size_t n_omega = this->n_frequencies();
        RAOLIB_ComplexTable out;
        out.reserve(this->n_wave_directions());
        for (std::size_t i = 0; i < this->n_wave_directions(); ++i)
        {
            out.emplace_back(unit.begin() + i * n_omega, unit.begin() + (i + 1) * n_omega);
        }
        return out;
    }

    void RAOLIB_Rao::regrid_omega(const RAOLIB_Axis &new_omegas)
    {
        RAOLIB_Axis targets = RAOLIB_regrid_targets(new_omegas, "omega");

        // Duplicate the lowest / highest column out to the requested range
        RAOLIB_ExpandedAxis expanded = RAOLIB_expand_axis_const(this->omega_axis, targets.front(), targets.back());
        std::vector<RAOLIB_AxisWeight> weights = RAOLIB_linear_weights(expanded.axis, targets);

        std::vector<std::complex<double>> unit = RAOLIB_to_phase_vector(this->phase_data);

        const std::size_t n_dir = this->n_wave_directions();
        const std::size_t n_src = this->n_frequencies();
        const std::size_t n_new = targets.size();

        std::vector<double> amplitude(n_dir * n_new);
        std::vector<std::complex<double>> new_unit(n_dir * n_new);

        for (std::size_t i = 0; i < n_dir; ++i)
        {
            const std::size_t row = i * n_src;
            for (std::size_t k = 0; k < n_new; ++k)
            {
                const RAOLIB_AxisWeight &w = weights[k];
                const std::size_t lo = row + expanded.source_index[w.lower];
                const std::size_t hi = row + expanded.source_index[w.upper];

                amplitude[i * n_new + k] = RAOLIB_lerp(this->amplitude_data[lo], this->amplitude_data[hi], w.t);
                new_unit[i * n_new + k] = RAOLIB_lerp(unit[lo], unit[hi], w.t);
            }
        }

        RAOLIB_DEBUG("Regridded omega: %zu -> %zu values", n_src, n_new);

        this->commit(RAOLIB_Axis(this->direction_axis), std::move(targets),
                     std::move(amplitude), RAOLIB_from_phase_vector(new_unit));
    }

    void RAOLIB_Rao::regrid_direction(const RAOLIB_Axis &new_headings)
    {
        RAOLIB_Axis targets = RAOLIB_regrid_targets(new_headings, "wave direction");
        const double period = this->settings.cHeadingPeriodDeg;

        // Repeat the boundary headings at -period / +period so that nothing is extrapolated
        RAOLIB_ExpandedAxis expanded = RAOLIB_expand_axis_periodic(this->direction_axis, period);

        RAOLIB_Axis wrapped_targets(targets.size());
        for (std::size_t k = 0; k < targets.size(); ++k)
        {
            wrapped_targets[k] = RAOLIB_wrap_periodic(targets[k], period);
        }
        std::vector<RAOLIB_AxisWeight> weights = RAOLIB_linear_weights(expanded.axis, wrapped_targets);

        std::vector<std::complex<double>> unit = RAOLIB_to_phase_vector(this->phase_data);

        const std::size_t n_omega = this->n_frequencies();
        const std::size_t n_new = targets.size();

        std::vector<double> amplitude(n_new * n_omega);
        std::vector<std::complex<double>> new_unit(n_new * n_omega);

        for (std::size_t k = 0; k < n_new; ++k)
        {
            const RAOLIB_AxisWeight &w = weights[k];
            const std::size_t lo_row = expanded.source_index[w.lower] * n_omega;
            const std::size_t hi_row = expanded.source_index[w.upper] * n_omega;

            for (std::size_t j = 0; j < n_omega; ++j)
            {
                amplitude[k * n_omega + j] = RAOLIB_lerp(this->amplitude_data[lo_row + j], this->amplitude_data[hi_row + j], w.t);
                new_unit[k * n_omega + j] = RAOLIB_lerp(unit[lo_row + j], unit[hi_row + j], w.t);
            }
        }

        RAOLIB_DEBUG("Regridded wave direction: %zu -> %zu values", this->n_wave_directions(), n_new);

        this->commit(std::move(targets), RAOLIB_Axis(this->omega_axis),
                     std::move(amplitude), RAOLIB_from_phase_vector(new_unit));
    }

    void RAOLIB_Rao::add_direction(double wave_direction)
    {
        if (std::find(this->direction_axis.begin(), this->direction_axis.end(), wave_direction) != this->direction_axis.end())
        {
            return;
        }
        RAOLIB_Axis new_headings(this->direction_axis);
        new_headings.push_back(wave_direction);
        this->regrid_direction(new_headings);
    }

    void RAOLIB_Rao::add_frequency(double omega)
    {
        if (std::find(this->omega_axis.begin(), this->omega_axis.end(), omega) != this->omega_axis.end())
        {
            return;
        }
        RAOLIB_Axis new_omegas(this->omega_axis);
        new_omegas.push_back(omega);
        this->regrid_omega(new_omegas);
    }

    void RAOLIB_Rao::ensure_point(double wave_direction, double omega)
    {
        // Validate both before touching either axis
        if (!std::isfinite(wave_direction) || !std::isfinite(omega))
        {
            throw std::invalid_argument("Requested point must have a finite wave direction and omega");
        }
        this->add_direction(wave_direction);
        this->add_frequency(omega);
    }

    std::complex<double> RAOLIB_Rao::get_value(double wave_direction, double omega)
    {
        this->ensure_point(wave_direction, omega);

        std::size_t i = static_cast<std::size_t>(
            std::find(this->direction_axis.begin(), this->direction_axis.end(), wave_direction) - this->direction_axis.begin());
        std::size_t j = static_cast<std::size_t>(
            std::find(this->omega_axis.begin(), this->omega_axis.end(), omega) - this->omega_axis.begin());

        const std::size_t idx = this->flat_index(i, j);
        return this->amplitude_data[idx] * std::polar(1.0, this->phase_data[idx]);
    }

    void RAOLIB_Rao::scale(double factor)
    {
        if (!(factor >= 0.0) || std::isinf(factor))
        {
            throw std::domain_error(
                "Amplitude can not be negative. If you need an opposite response then apply a phase change of pi");
        }
        for (double &a : this->amplitude_data)
        {
            a *= factor;
        }
    }

    void RAOLIB_Rao::add_symmetry_xz()
    {
        const RAOLIB_Symmetry symmetry = RAOLIB_MotionMode_symmetry(this->motion_mode);
        const bool opposite = (symmetry == RAOLIB_Symmetry::ANTISYMMETRIC);
        const double period = this->settings.cHeadingPeriodDeg;

        const std::size_t n_omega = this->n_frequencies();
        const std::size_t n_orig = this->n_wave_directions();

        RAOLIB_Axis directions(this->direction_axis);
        std::vector<double> amplitude(this->amplitude_data);
        std::vector<double> phase(this->phase_data);

        // headings as points on the circle, so -30 and 330 are the same direction
        RAOLIB_Axis wrapped(n_orig);
        for (std::size_t i = 0; i < n_orig; ++i)
        {
            wrapped[i] = RAOLIB_wrap_periodic(this->direction_axis[i], period);
        }

        for (std::size_t i = 0; i < n_orig; ++i)
        {
            const double mirrored = RAOLIB_wrap_periodic(-this->direction_axis[i], period);
            if (std::find(wrapped.begin(), wrapped.end(), mirrored) != wrapped.end())
            {
                continue;
            }

            directions.push_back(mirrored);
            wrapped.push_back(mirrored);
            for (std::size_t j = 0; j < n_omega; ++j)
            {
                const double p = this->phase_data[i * n_omega + j];
                amplitude.push_back(this->amplitude_data[i * n_omega + j]);
                phase.push_back(opposite ? -p + RAOLIB_cAntisymmetricPhaseShift : p);
            }
        }

        if (directions.size() == n_orig)
        {
            return;
        }

        // sort by wave direction
        std::vector<std::size_t> order(directions.size());
        std::iota(order.begin(), order.end(), static_cast<std::size_t>(0));
        std::sort(order.begin(), order.end(),
                  [&directions](std::size_t a, std::size_t b)
                  { return directions[a] < directions[b]; });

        RAOLIB_Axis sorted_directions;
        std::vector<double> sorted_amplitude;
        std::vector<double> sorted_phase;
        sorted_directions.reserve(directions.size());
        sorted_amplitude.reserve(amplitude.size());
        sorted_phase.reserve(phase.size());

        for (std::size_t idx : order)
        {
            sorted_directions.push_back(directions[idx]);
            sorted_amplitude.insert(sorted_amplitude.end(),
                                    amplitude.begin() + idx * n_omega, amplitude.begin() + (idx + 1) * n_omega);
            sorted_phase.insert(sorted_phase.end(),
                                phase.begin() + idx * n_omega, phase.begin() + (idx + 1) * n_omega);
        }

        RAOLIB_DEBUG("Symmetry xz (%s): %zu -> %zu wave directions",
                     opposite ? "antisymmetric" : "symmetric", n_orig, sorted_directions.size());

        this->commit(std::move(sorted_directions), RAOLIB_Axis(this->omega_axis),
                     std::move(sorted_amplitude), std::move(sorted_phase));
    }

    void RAOLIB_Rao::commit(
        RAOLIB_Axis &&wave_directions,
        RAOLIB_Axis &&omegas,
        std::vector<double> &&amplitude,
        std::vector<double> &&phase)
    {
        if (this->settings.cWrapPhase)
        {
            for (double &p : phase)
            {
                p = RAOLIB_wrap_phase(p);
            }
        }
        this->direction_axis = std::move(wave_directions);
        this->omega_axis = std::move(omegas);
        this->amplitude_data = std::move(amplitude);
        this->phase_data = std::move(phase);
    }

    std::string RAOLIB_Rao::to_string() const
    {
        std::ostringstream os;
        os << "<raolib.Rao>\n"
           << "Dimensions:  (wave_direction: " << this->n_wave_directions()
           << ", omega: " << this->n_frequencies() << ")\n"
           << "Coordinates:\n"
           << "  * wave_direction  (wave_direction) float64";
        for (double d : this->direction_axis)
        {
            os << ' ' << d;
        }
        os << "\n  * omega           (omega) float64";
        for (double w : this->omega_axis)
        {
            os << ' ' << w;
        }
        os << "\nData variables:\n"
           << "    amplitude       (wave_direction, omega) float64\n"
           << "    phase           (wave_direction, omega) float64\n"
           << "Mode: " << RAOLIB_MotionMode_toString(this->motion_mode);
        return os.str();
    }

    std::ostream &operator<<(std::ostream &os, const RAOLIB_Rao &rao)
    {
        return os << rao.to_string();
    }
}; // namespace raolib
