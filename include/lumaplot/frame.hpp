#pragma once

#include <cstdint>
#include <lumaplot/color.hpp>
#include <lumaplot/gpu_types.hpp>
#include <lumaplot/series.hpp>
#include <optional>
#include <span>
#include <vector>

namespace lumaplot
{

// Layout options for build_frame().
struct PlotOptions
{
    Vec2                 padding       = {50.0f, 50.0f};  // pixels on each side
    float                marker_radius = 4.0f;            // pixels
    float                line_width    = 2.0f;            // pixels
    float                aa_fringe_px  = 1.0f;            // extra strip width for line AA
    bool                 show_markers  = true;
    bool                 show_lines    = true;
    std::optional<Range> x_range;                         // overrides the data range
    std::optional<Range> y_range;
};

// Per-submission switches for Renderer::render().
struct RenderConfig
{
    Color clear_color  = colors::white;
    bool  show_markers = true;
    bool  show_lines   = true;
};

// Everything one draw needs: the uniform block plus the marker instance
// and line vertex arrays, in series order.
struct PlotFrame
{
    UniformBlock               uniforms;
    std::vector<PointInstance> points;
    std::vector<LineVertex>    line_vertices;

    uint32_t point_count() const { return static_cast<uint32_t>(points.size()); }
    uint32_t line_vertex_count() const { return static_cast<uint32_t>(line_vertices.size()); }
};

PlotFrame build_frame(std::span<const PlotSeries> series,
                      float                       viewport_width,
                      float                       viewport_height,
                      const PlotOptions&          options = {});

}   // namespace lumaplot
