#pragma once

#include <cstddef>
#include <lumaplot/color.hpp>
#include <lumaplot/gpu_types.hpp>
#include <lumaplot/plot_style.hpp>
#include <span>
#include <vector>

namespace lumaplot
{

// Expands a screen-space polyline into a triangle list, one quad (6
// vertices) per segment. Quads are `line_width + 2*aa_fringe_px` wide and
// carry edge_distance = ±extent/half at their long edges, so |d| == 1 falls
// on the nominal line edge and the fringe beyond it fades out in the line
// stage. arc_length runs continuously from 0 at the first point; segments
// shorter than 0.001 px are skipped.
//
// Appends to `out` and returns the number of vertices appended.
size_t tessellate_polyline(std::span<const Vec2> screen_points,
                           const Color&          color,
                           LinePattern           pattern,
                           float                 line_width,
                           float                 aa_fringe_px,
                           std::vector<LineVertex>& out);

std::vector<LineVertex> tessellate_polyline(std::span<const Vec2> screen_points,
                                            const Color&          color,
                                            LinePattern           pattern,
                                            float                 line_width,
                                            float                 aa_fringe_px = 1.0f);

}   // namespace lumaplot
