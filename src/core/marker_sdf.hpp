#pragma once

#include <cstdint>
#include <lumaplot/gpu_types.hpp>

namespace lumaplot
{

// Signed distance from a point in marker-local space ([-1,1]², Y down) to
// the outline of a marker shape. Negative inside, positive outside.
//
// Only the circle is a true Euclidean distance. The other shapes use cheap
// Chebyshev/Manhattan/half-plane approximations; the marker stage's ±0.1
// anti-aliasing band is calibrated to exactly these values, so they must
// match src/shaders/marker.frag term for term.

float sdf_circle(Vec2 p);
float sdf_square(Vec2 p);
float sdf_diamond(Vec2 p);
float sdf_triangle_up(Vec2 p);
float sdf_triangle_down(Vec2 p);
float sdf_cross(Vec2 p);
float sdf_plus(Vec2 p);

// Dispatch on a raw shape tag. Tags outside Circle..Plus (including None)
// evaluate as Circle; the marker stage discards None before calling this.
float marker_sdf(Vec2 p, uint32_t shape_tag);

}   // namespace lumaplot
