#include <cmath>
#include "raolib/phase.hpp"

namespace raolib
{
    std::vector<std::complex<double>> RAOLIB_to_phase_vector(const std::vector<double> &phase)
    {
        std::vector<std::complex<double>> out;
        out.reserve(phase.size());
        for (double p : phase)
        {
            out.push_back(std::polar(1.0, p));
        }
        return out;
    }

    std::vector<double> RAOLIB_from_phase_vector(const std::vector<std::complex<double>> &phase_vector)
    {
        std::vector<double> out;
        out.reserve(phase_vector.size());
        for (const std::complex<double> &c : phase_vector)
        {
            out.push_back(std::arg(c));
        }
        return out;
    }

    double RAOLIB_wrap_phase(double phase)
    {
        return std::arg(std::polar(1.0, phase));
    }
}; // namespace raolib
