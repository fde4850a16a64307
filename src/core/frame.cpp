#include <cmath>
#include <limits>
#include <lumaplot/frame.hpp>
#include <lumaplot/logger.hpp>

#include "line_tessellator.hpp"
#include "transform.hpp"

namespace lumaplot
{

namespace
{

bool is_finite(const PlotPoint& p)
{
    return std::isfinite(p.x) && std::isfinite(p.y);
}

// A range that is valid in double can collapse to a single float value
// (large offsets, or a flat axis widened by less than one float ulp). Step
// each end outward to the neighbouring float so the block stays valid.
Range narrow_range(double lo, double hi)
{
    Range r{static_cast<float>(lo), static_cast<float>(hi)};
    if (!(r.max > r.min) && std::isfinite(r.min) && std::isfinite(r.max))
    {
        r.min = std::nextafter(r.min, -std::numeric_limits<float>::infinity());
        r.max = std::nextafter(r.max, std::numeric_limits<float>::infinity());
    }
    return r;
}

UniformBlock make_uniforms(std::span<const PlotSeries> series,
                           float                       viewport_width,
                           float                       viewport_height,
                           const PlotOptions&          options)
{
    UniformBlock u;
    u.viewport_size = {viewport_width, viewport_height};
    u.padding       = options.padding;
    u.marker_radius = options.marker_radius;
    u.line_width    = options.line_width;

    if (!options.x_range || !options.y_range)
    {
        DataRange r = compute_data_range(series);
        u.x_range   = narrow_range(r.x_min, r.x_max);
        u.y_range   = narrow_range(r.y_min, r.y_max);
    }
    if (options.x_range)
        u.x_range = *options.x_range;
    if (options.y_range)
        u.y_range = *options.y_range;

    return u;
}

// Non-finite points break the polyline; each finite run is tessellated on
// its own, with arc length restarting at zero.
void append_series_lines(const PlotSeries&        s,
                         const UniformBlock&      u,
                         float                    aa_fringe_px,
                         std::vector<Vec2>&       run,
                         std::vector<LineVertex>& out)
{
    auto flush = [&]()
    {
        tessellate_polyline(run, s.color, s.line, u.line_width, aa_fringe_px, out);
        run.clear();
    };

    run.clear();
    for (const auto& p : s.points)
    {
        if (!is_finite(p))
        {
            flush();
            continue;
        }
        Vec2 data{static_cast<float>(p.x), static_cast<float>(p.y)};
        run.push_back(data_to_screen(data, u));
    }
    flush();
}

}   // anonymous namespace

PlotFrame build_frame(std::span<const PlotSeries> series,
                      float                       viewport_width,
                      float                       viewport_height,
                      const PlotOptions&          options)
{
    PlotFrame frame;
    frame.uniforms = make_uniforms(series, viewport_width, viewport_height, options);

    std::vector<Vec2> run;
    for (const auto& s : series)
    {
        if (options.show_markers && s.marker != MarkerShape::None)
        {
            for (const auto& p : s.points)
            {
                if (!is_finite(p))
                    continue;
                PointInstance inst;
                inst.position = {static_cast<float>(p.x), static_cast<float>(p.y)};
                inst.color    = s.color;
                inst.shape    = to_tag(s.marker);
                frame.points.push_back(inst);
            }
        }

        if (options.show_lines && s.line != LinePattern::None)
            append_series_lines(s, frame.uniforms, options.aa_fringe_px, run, frame.line_vertices);
    }

    LUMAPLOT_LOG_DEBUG("layout",
                       "Built frame: {} series, {} markers, {} line vertices, x=[{}, {}] y=[{}, {}]",
                       series.size(),
                       frame.points.size(),
                       frame.line_vertices.size(),
                       frame.uniforms.x_range.min,
                       frame.uniforms.x_range.max,
                       frame.uniforms.y_range.min,
                       frame.uniforms.y_range.max);
    return frame;
}

}   // namespace lumaplot
