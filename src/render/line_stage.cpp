#include "line_stage.hpp"

#include <cmath>

#include "core/line_pattern.hpp"
#include "core/shader_math.hpp"
#include "core/transform.hpp"

namespace lumaplot
{

static constexpr float LINE_ALPHA_CUTOFF = 0.001f;

LineVaryings line_vertex(const LineVertex& v, const UniformBlock& u)
{
    LineVaryings out;
    out.clip_position = screen_to_ndc(v.position, u.viewport_size);
    out.color         = v.color;
    out.edge_distance = v.edge_distance;
    out.arc_length    = v.arc_length;
    out.pattern       = v.pattern;
    return out;
}

float line_coverage(float edge_distance)
{
    return 1.0f - smoothstep(0.8f, 1.0f, std::abs(edge_distance));
}

std::optional<Color> line_fragment(const Color& color, float edge_distance, float arc_length,
                                   uint32_t pattern, const UniformBlock& u)
{
    float alpha = line_coverage(edge_distance);
    if (alpha < LINE_ALPHA_CUTOFF)
        return std::nullopt;

    if (!pattern_visible(arc_length, pattern, u.line_width))
        return std::nullopt;

    return Color{color.r, color.g, color.b, color.a * alpha};
}

}   // namespace lumaplot
