#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include "raolib/interp.hpp"
#include "raolib/log.hpp"

namespace raolib
{

    /**
     * @brief Returns the indices that sort `axis` ascending; equal values keep their order.
     */
    static std::vector<std::size_t> RAOLIB_argsort(const RAOLIB_Axis &axis)
    {
        std::vector<std::size_t> order(axis.size());
        std::iota(order.begin(), order.end(), static_cast<std::size_t>(0));
        std::stable_sort(order.begin(), order.end(),
                         [&axis](std::size_t a, std::size_t b)
                         { return axis[a] < axis[b]; });
        return order;
    }

    /**
     * @brief Performs linear interpolation between two points.
     *
     * Calculates y = y0 + (y1 - y0) * (x - x0) / (x1 - x0)
     *
     * @return RAOLIB_InterpStatus::SUCCESS on success,
     *         RAOLIB_InterpStatus::ZERODIVISION if x0 == x1.
     */
    RAOLIB_InterpStatus RAOLIB_interpolate2pt(double x, double x0, double y0, double x1, double y1, double &result)
    {
        if (x1 == x0)
        {
            return RAOLIB_InterpStatus::ZERODIVISION;
        }
        result = y0 + (y1 - y0) * (x - x0) / (x1 - x0);
        return RAOLIB_InterpStatus::SUCCESS;
    }

    std::vector<RAOLIB_AxisWeight> RAOLIB_linear_weights(const RAOLIB_Axis &axis, const RAOLIB_Axis &targets)
    {
        if (axis.empty())
        {
            throw std::domain_error("Cannot interpolate on an empty axis");
        }
        for (std::size_t i = 1; i < axis.size(); ++i)
        {
            if (!(axis[i - 1] < axis[i]))
            {
                throw std::domain_error("Interpolation axis must be strictly increasing");
            }
        }

        std::vector<RAOLIB_AxisWeight> weights;
        weights.reserve(targets.size());

        for (double x : targets)
        {
            if (std::isnan(x))
            {
                throw std::invalid_argument("Interpolation target is NaN");
            }
            if (x < axis.front() || x > axis.back())
            {
                throw std::out_of_range("Interpolation target outside of the axis range");
            }

            // last node <= x
            std::size_t i = static_cast<std::size_t>(
                std::upper_bound(axis.begin(), axis.end(), x) - axis.begin() - 1);

            if (axis[i] == x)
            {
                weights.push_back(RAOLIB_AxisWeight{i, i, 0.0});
                continue;
            }

            double t;
            if (RAOLIB_interpolate2pt(x, axis[i], 0.0, axis[i + 1], 1.0, t) != RAOLIB_InterpStatus::SUCCESS)
            {
                throw std::domain_error("Degenerate interpolation segment: duplicate axis values");
            }
            weights.push_back(RAOLIB_AxisWeight{i, i + 1, t});
        }
        return weights;
    }

    RAOLIB_ExpandedAxis RAOLIB_expand_axis_const(const RAOLIB_Axis &axis, double lower, double upper)
    {
        if (axis.empty())
        {
            throw std::invalid_argument("Cannot expand an empty axis");
        }

        std::vector<std::size_t> order = RAOLIB_argsort(axis);

        RAOLIB_ExpandedAxis out;
        out.axis.reserve(axis.size() + 2);
        out.source_index.reserve(axis.size() + 2);

        std::size_t first = order.front();
        std::size_t last = order.back();

        if (lower < axis[first])
        {
            RAOLIB_DEBUG("Constant extrapolation below %g down to %g", axis[first], lower);
            out.axis.push_back(lower);
            out.source_index.push_back(first);
        }

        for (std::size_t k = 0; k < order.size(); ++k)
        {
            if (k > 0 && axis[order[k]] == axis[order[k - 1]])
            {
                throw std::invalid_argument("Axis contains duplicate values");
            }
            out.axis.push_back(axis[order[k]]);
            out.source_index.push_back(order[k]);
        }

        if (upper > axis[last])
        {
            RAOLIB_DEBUG("Constant extrapolation above %g up to %g", axis[last], upper);
            out.axis.push_back(upper);
            out.source_index.push_back(last);
        }

        return out;
    }

    RAOLIB_ExpandedAxis RAOLIB_expand_axis_periodic(const RAOLIB_Axis &axis, double period)
    {
        if (axis.empty())
        {
            throw std::invalid_argument("Cannot expand an empty axis");
        }
        if (!(period > 0.0))
        {
            throw std::invalid_argument("Period must be positive");
        }

        RAOLIB_Axis wrapped(axis.size());
        for (std::size_t i = 0; i < axis.size(); ++i)
        {
            wrapped[i] = RAOLIB_wrap_periodic(axis[i], period);
        }
        std::vector<std::size_t> order = RAOLIB_argsort(wrapped);

        RAOLIB_ExpandedAxis core;
        core.axis.reserve(axis.size());
        core.source_index.reserve(axis.size());
        for (std::size_t idx : order)
        {
            if (!core.axis.empty() && core.axis.back() == wrapped[idx])
            {
                RAOLIB_WARN("Heading %g coincides with heading %g modulo %g; using the first one",
                            axis[idx], axis[core.source_index.back()], period);
                continue;
            }
            core.axis.push_back(wrapped[idx]);
            core.source_index.push_back(idx);
        }

        RAOLIB_ExpandedAxis out;
        out.axis.reserve(core.axis.size() + 2);
        out.source_index.reserve(core.axis.size() + 2);

        out.axis.push_back(core.axis.back() - period);
        out.source_index.push_back(core.source_index.back());

        out.axis.insert(out.axis.end(), core.axis.begin(), core.axis.end());
        out.source_index.insert(out.source_index.end(), core.source_index.begin(), core.source_index.end());

        out.axis.push_back(core.axis.front() + period);
        out.source_index.push_back(core.source_index.front());

        return out;
    }

    double RAOLIB_wrap_periodic(double x, double period)
    {
        double r = std::fmod(x, period);
        if (r < 0.0)
        {
            r += period;
        }
        // r + period can round up to period itself; also turns -0.0 into 0.0
        if (r >= period || r == 0.0)
        {
            r = 0.0;
        }
        return r;
    }

    RAOLIB_Axis RAOLIB_sorted_unique(const RAOLIB_Axis &values)
    {
        RAOLIB_Axis out(values);
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        return out;
    }
}; // namespace raolib
