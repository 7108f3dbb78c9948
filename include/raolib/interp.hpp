#ifndef RAOLIB_INTERP_HPP
#define RAOLIB_INTERP_HPP

#include <cstddef>
#include <vector>
#include "raolib/base_types.hpp"

namespace raolib
{
    enum class RAOLIB_InterpStatus
    {
        SUCCESS,
        ZERODIVISION,
    };

    /**
     * @brief Bracketing support of one target on a sorted axis.
     *
     * The interpolated value is y[lower] + t * (y[upper] - y[lower]).
     * A target that coincides with a node has lower == upper and t == 0,
     * so node values are reproduced bit for bit.
     */
    struct RAOLIB_AxisWeight
    {
        std::size_t lower;
        std::size_t upper;
        double t;
    };

    /**
     * @brief An axis extended with virtual nodes, each pointing back to a source column.
     *
     * `axis` is strictly increasing. `source_index[k]` is the index, in the
     * unsorted source axis, of the column whose data lives at `axis[k]`.
     */
    struct RAOLIB_ExpandedAxis
    {
        RAOLIB_Axis axis;
        std::vector<std::size_t> source_index;
    };

    /**
     * @brief Performs linear interpolation between two points.
     *
     * Calculates y = y0 + (y1 - y0) * (x - x0) / (x1 - x0)
     *
     * @param x The x-coordinate at which to interpolate.
     * @param x0 First point x-coordinate.
     * @param y0 First point y-coordinate.
     * @param x1 Second point x-coordinate.
     * @param y1 Second point y-coordinate.
     * @param result Output parameter to store interpolated value.
     * @return RAOLIB_InterpStatus::SUCCESS on success,
     *         RAOLIB_InterpStatus::ZERODIVISION if x0 == x1.
     */
    RAOLIB_InterpStatus RAOLIB_interpolate2pt(double x, double x0, double y0, double x1, double y1, double &result);

    /**
     * @brief Linear blend of two node values; returns `a` unchanged when t == 0.
     *
     * Works for double and std::complex<double>.
     */
    template <typename T>
    inline T RAOLIB_lerp(const T &a, const T &b, double t)
    {
        if (t == 0.0)
        {
            return a;
        }
        return a + (b - a) * t;
    }

    /**
     * @brief Computes linear interpolation weights of `targets` on `axis`.
     *
     * No extrapolation is done here: expand the axis first
     * (RAOLIB_expand_axis_const / RAOLIB_expand_axis_periodic).
     *
     * @param axis Strictly increasing node coordinates.
     * @param targets Query coordinates, any order.
     * @return One weight per target, in the order of `targets`.
     *
     * @throws std::domain_error if the axis is empty or not strictly increasing.
     * @throws std::invalid_argument if a target is NaN.
     * @throws std::out_of_range if a target lies outside [axis.front(), axis.back()].
     */
    std::vector<RAOLIB_AxisWeight> RAOLIB_linear_weights(const RAOLIB_Axis &axis, const RAOLIB_Axis &targets);

    /**
     * @brief Boundary duplication for constant extrapolation.
     *
     * Sorts the axis and, when `lower` is below its minimum, adds a node at
     * `lower` carrying the minimum's column; likewise a node at `upper`
     * carrying the maximum's column when `upper` is above the maximum.
     *
     * @throws std::invalid_argument if the axis is empty or holds duplicates.
     */
    RAOLIB_ExpandedAxis RAOLIB_expand_axis_const(const RAOLIB_Axis &axis, double lower, double upper);

    /**
     * @brief Expands a circular axis so that [0, period) is fully bracketed.
     *
     * Nodes are wrapped into [0, period) and sorted. The last node is repeated
     * at `last - period` and the first at `first + period`. Nodes that coincide
     * after wrapping (e.g. 0 and 360) keep the first occurrence; the others are
     * dropped with a warning.
     *
     * @throws std::invalid_argument if the axis is empty or the period is not positive.
     */
    RAOLIB_ExpandedAxis RAOLIB_expand_axis_periodic(const RAOLIB_Axis &axis, double period);

    /**
     * @brief Wraps x into [0, period).
     */
    double RAOLIB_wrap_periodic(double x, double period);

    /**
     * @brief Sorted copy with exact duplicates removed.
     */
    RAOLIB_Axis RAOLIB_sorted_unique(const RAOLIB_Axis &values);

}; // namespace raolib

#endif // RAOLIB_INTERP_HPP
