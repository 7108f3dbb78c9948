#ifndef RAOLIB_PHASE_HPP
#define RAOLIB_PHASE_HPP

#include <complex>
#include <vector>

namespace raolib
{
    /**
     * @brief Unit complex numbers exp(i * phase), elementwise.
     *
     * The phase vector is the interpolation-safe stand-in for a circular
     * phase angle. Its magnitude carries no information and is never folded
     * back into the amplitude.
     */
    std::vector<std::complex<double>> RAOLIB_to_phase_vector(const std::vector<double> &phase);

    /**
     * @brief Angles of complex numbers (atan2), elementwise, in [-pi, pi].
     */
    std::vector<double> RAOLIB_from_phase_vector(const std::vector<std::complex<double>> &phase_vector);

    /**
     * @brief Wraps an angle in radians into [-pi, pi].
     */
    double RAOLIB_wrap_phase(double phase);

}; // namespace raolib

#endif // RAOLIB_PHASE_HPP
