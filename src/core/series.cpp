#include <algorithm>
#include <cfloat>
#include <cmath>
#include <lumaplot/series.hpp>
#include <utility>

namespace lumaplot
{

PlotSeries PlotSeries::from_function(std::string                          label,
                                     Color                                color,
                                     const std::function<double(double)>& fn,
                                     double                               x_min,
                                     double                               x_max,
                                     size_t                               count)
{
    PlotSeries s;
    s.label = std::move(label);
    s.color = color;
    s.points.reserve(count);

    const double span  = x_max - x_min;
    const double steps = static_cast<double>(std::max<size_t>(count, 2) - 1);
    for (size_t i = 0; i < count; ++i)
    {
        double t = static_cast<double>(i) / steps;
        double x = x_min + t * span;
        s.points.push_back({x, fn(x)});
    }
    return s;
}

DataRange compute_data_range(std::span<const PlotSeries> series)
{
    double x_min = INFINITY;
    double x_max = -INFINITY;
    double y_min = INFINITY;
    double y_max = -INFINITY;
    bool   any   = false;

    for (const auto& s : series)
    {
        for (const auto& p : s.points)
        {
            if (!std::isfinite(p.x) || !std::isfinite(p.y))
                continue;
            x_min = std::min(x_min, p.x);
            x_max = std::max(x_max, p.x);
            y_min = std::min(y_min, p.y);
            y_max = std::max(y_max, p.y);
            any   = true;
        }
    }

    if (!any)
        return {};

    // A single value on an axis has no extent; give it a unit window
    if (std::abs(x_max - x_min) < DBL_EPSILON)
    {
        x_min -= 0.5;
        x_max += 0.5;
    }
    if (std::abs(y_max - y_min) < DBL_EPSILON)
    {
        y_min -= 0.5;
        y_max += 0.5;
    }

    return {x_min, x_max, y_min, y_max};
}

}   // namespace lumaplot
