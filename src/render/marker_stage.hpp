#pragma once

#include <cstdint>
#include <lumaplot/gpu_types.hpp>
#include <optional>

namespace lumaplot
{

// CPU reference of src/shaders/marker.vert and marker.frag. The software
// backend runs these per vertex and per sample; the unit tests pin the
// numbers the GLSL must reproduce.

struct MarkerVaryings
{
    Vec2     clip_position;  // NDC, Y up
    Color    color;
    Vec2     local_pos;      // shape space, Y down
    uint32_t shape = 0;      // flat
};

// `vertex_index` selects the MARKER_QUAD corner (0..5).
MarkerVaryings marker_vertex(uint32_t vertex_index, const PointInstance& instance,
                             const UniformBlock& u);

// AA coverage for a signed distance inside the ±0.1 band.
float marker_coverage(float sdf);

// Returns the unblended output color, or nullopt when the fragment is
// discarded (shape None, or outside the AA band).
std::optional<Color> marker_fragment(const Color& color, Vec2 local_pos, uint32_t shape);

}   // namespace lumaplot
