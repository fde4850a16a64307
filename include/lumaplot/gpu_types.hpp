#pragma once

#include <cstddef>
#include <cstdint>
#include <lumaplot/color.hpp>
#include <lumaplot/plot_style.hpp>

namespace lumaplot
{

// GPU-visible types. Field order and offsets are the shader interface
// (src/shaders/) and must not change independently of it.

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;
};

struct Range
{
    float min = 0.0f;
    float max = 1.0f;

    constexpr float span() const { return max - min; }
};

// Per-draw configuration, bound once at set 0 / binding 0.
// std140-compatible: vec2 members sit on 8-byte offsets, scalars trail.
struct UniformBlock
{
    Vec2  viewport_size;            // pixels
    Range x_range;                  // data space
    Range y_range;                  // data space
    Vec2  padding;                  // pixels reserved on each side
    float marker_radius = 4.0f;     // pixels
    float line_width    = 2.0f;     // pixels
};

// One marker. Draw with 6 vertices per instance.
struct PointInstance
{
    Vec2     position;              // data space
    Color    color;
    uint32_t shape = to_tag(MarkerShape::Circle);
    uint32_t _pad  = 0;
};

// One pre-tessellated line vertex in screen pixels.
struct LineVertex
{
    Vec2     position;              // screen pixels, origin top-left
    Color    color;
    float    edge_distance = 0.0f;  // ±1 at the nominal line edge
    float    arc_length    = 0.0f;  // pixels from the start of the polyline
    uint32_t pattern       = to_tag(LinePattern::Solid);
    uint32_t _pad          = 0;
};

static_assert(sizeof(Vec2) == 8);
static_assert(sizeof(Range) == 8);
static_assert(sizeof(Color) == 16);

static_assert(sizeof(UniformBlock) == 40);
static_assert(offsetof(UniformBlock, x_range) == 8);
static_assert(offsetof(UniformBlock, y_range) == 16);
static_assert(offsetof(UniformBlock, padding) == 24);
static_assert(offsetof(UniformBlock, marker_radius) == 32);
static_assert(offsetof(UniformBlock, line_width) == 36);

static_assert(sizeof(PointInstance) == 32);
static_assert(offsetof(PointInstance, color) == 8);
static_assert(offsetof(PointInstance, shape) == 24);

static_assert(sizeof(LineVertex) == 40);
static_assert(offsetof(LineVertex, color) == 8);
static_assert(offsetof(LineVertex, edge_distance) == 24);
static_assert(offsetof(LineVertex, arc_length) == 28);
static_assert(offsetof(LineVertex, pattern) == 32);

// Fixed marker quad: two triangles over [-1,1]², indexed by vertex 0..5.
inline constexpr Vec2 MARKER_QUAD[6] = {
    {-1.0f, -1.0f},
    {1.0f, -1.0f},
    {1.0f, 1.0f},
    {-1.0f, -1.0f},
    {1.0f, 1.0f},
    {-1.0f, 1.0f},
};

inline constexpr uint32_t MARKER_QUAD_VERTEX_COUNT = 6;

}   // namespace lumaplot
