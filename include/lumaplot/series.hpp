#pragma once

#include <cstddef>
#include <functional>
#include <lumaplot/color.hpp>
#include <lumaplot/plot_style.hpp>
#include <span>
#include <string>
#include <vector>

namespace lumaplot
{

struct PlotPoint
{
    double x = 0.0;
    double y = 0.0;
};

// One named data set. Points are drawn as markers of `marker` shape and
// joined in order by a line of `line` pattern; either may be None.
struct PlotSeries
{
    std::string            label;
    Color                  color = colors::blue;
    std::vector<PlotPoint> points;
    MarkerShape            marker = MarkerShape::Circle;
    LinePattern            line   = LinePattern::Solid;

    // Samples `fn` at `count` evenly spaced x values covering [x_min, x_max].
    static PlotSeries from_function(std::string                          label,
                                    Color                                color,
                                    const std::function<double(double)>& fn,
                                    double                               x_min,
                                    double                               x_max,
                                    size_t                               count);
};

// Axis limits of a set of series, in data space.
struct DataRange
{
    double x_min = 0.0;
    double x_max = 1.0;
    double y_min = 0.0;
    double y_max = 1.0;
};

// Bounding box of every finite point. An empty input yields [0,1] on both
// axes; a flat axis is widened by 0.5 on each side.
DataRange compute_data_range(std::span<const PlotSeries> series);

}   // namespace lumaplot
