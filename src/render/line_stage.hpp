#pragma once

#include <cstdint>
#include <lumaplot/gpu_types.hpp>
#include <optional>

namespace lumaplot
{

// CPU reference of src/shaders/line.vert and line.frag.

struct LineVaryings
{
    Vec2     clip_position;  // NDC, Y up
    Color    color;
    float    edge_distance = 0.0f;
    float    arc_length    = 0.0f;
    uint32_t pattern       = 0;  // flat
};

LineVaryings line_vertex(const LineVertex& v, const UniformBlock& u);

// Alpha for |edge_distance|: 1 on the centerline, fading to 0 between
// 0.8 and 1.0.
float line_coverage(float edge_distance);

// Returns the unblended output color, or nullopt when the fragment is
// discarded (negligible coverage, or masked out by the line pattern).
std::optional<Color> line_fragment(const Color& color, float edge_distance, float arc_length,
                                   uint32_t pattern, const UniformBlock& u);

}   // namespace lumaplot
