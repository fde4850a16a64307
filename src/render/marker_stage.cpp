#include "marker_stage.hpp"

#include "core/marker_sdf.hpp"
#include "core/shader_math.hpp"
#include "core/transform.hpp"

namespace lumaplot
{

static constexpr float MARKER_AA_BAND = 0.1f;

MarkerVaryings marker_vertex(uint32_t vertex_index, const PointInstance& instance,
                             const UniformBlock& u)
{
    Vec2 local  = MARKER_QUAD[vertex_index % MARKER_QUAD_VERTEX_COUNT];
    Vec2 center = data_to_ndc(instance.position, u);
    Vec2 size   = marker_size_ndc(u);

    MarkerVaryings out;
    out.clip_position = {center.x + local.x * size.x, center.y + local.y * size.y};
    out.color         = instance.color;
    // Quad corners are Y up like NDC; shapes are authored Y down
    out.local_pos     = {local.x, -local.y};
    out.shape         = instance.shape;
    return out;
}

float marker_coverage(float sdf)
{
    return 1.0f - smoothstep(-MARKER_AA_BAND, MARKER_AA_BAND, sdf);
}

std::optional<Color> marker_fragment(const Color& color, Vec2 local_pos, uint32_t shape)
{
    if (shape == to_tag(MarkerShape::None))
        return std::nullopt;

    float d = marker_sdf(local_pos, shape);
    if (d > MARKER_AA_BAND)
        return std::nullopt;

    return Color{color.r, color.g, color.b, color.a * marker_coverage(d)};
}

}   // namespace lumaplot
