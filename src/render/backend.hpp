#pragma once

#include <cstdint>
#include <lumaplot/color.hpp>
#include <lumaplot/gpu_types.hpp>
#include <span>

namespace lumaplot
{

// A target the Renderer can record one plot draw into. Implementations own
// their pipelines and buffers; the Renderer only sequences calls.
//
// Per frame: begin_frame → update → draw_lines / draw_markers → end_frame.
// draw_* read the data from the most recent update().
class Backend
{
   public:
    virtual ~Backend() = default;

    virtual void begin_frame(const Color& clear_color = colors::white) = 0;

    // Upload the uniform block and both geometry arrays. Returns false
    // (and draws nothing this frame) if the data cannot be staged.
    virtual bool update(const UniformBlock&            uniforms,
                        std::span<const PointInstance> points,
                        std::span<const LineVertex>    line_vertices) = 0;

    // Triangle list over the uploaded line vertices.
    virtual void draw_lines(uint32_t vertex_count) = 0;

    // MARKER_QUAD_VERTEX_COUNT vertices × `instance_count` instances.
    virtual void draw_markers(uint32_t instance_count) = 0;

    virtual void end_frame() = 0;
};

}   // namespace lumaplot
