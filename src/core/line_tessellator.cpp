#include "line_tessellator.hpp"

#include <algorithm>
#include <cmath>

namespace lumaplot
{

static constexpr float MIN_SEGMENT_LENGTH = 0.001f;

size_t tessellate_polyline(std::span<const Vec2> screen_points,
                           const Color&          color,
                           LinePattern           pattern,
                           float                 line_width,
                           float                 aa_fringe_px,
                           std::vector<LineVertex>& out)
{
    if (screen_points.size() < 2 || !(line_width > 0.0f))
        return 0;

    const size_t   first  = out.size();
    const float    half   = line_width * 0.5f;
    const float    extent = half + std::max(aa_fringe_px, 0.0f);
    const float    edge   = extent / half;
    const uint32_t tag    = to_tag(pattern);

    out.reserve(first + (screen_points.size() - 1) * 6);

    auto make_vertex = [&](float x, float y, float edge_distance, float arc_length)
    {
        LineVertex v;
        v.position      = {x, y};
        v.color         = color;
        v.edge_distance = edge_distance;
        v.arc_length    = arc_length;
        v.pattern       = tag;
        return v;
    };

    float arc = 0.0f;
    for (size_t i = 0; i + 1 < screen_points.size(); ++i)
    {
        Vec2  p0  = screen_points[i];
        Vec2  p1  = screen_points[i + 1];
        float dx  = p1.x - p0.x;
        float dy  = p1.y - p0.y;
        float len = std::sqrt(dx * dx + dy * dy);

        if (!(len >= MIN_SEGMENT_LENGTH))
            continue;

        float nx = -dy / len * extent;
        float ny = dx / len * extent;

        LineVertex v0 = make_vertex(p0.x + nx, p0.y + ny, edge, arc);
        LineVertex v1 = make_vertex(p0.x - nx, p0.y - ny, -edge, arc);
        LineVertex v2 = make_vertex(p1.x + nx, p1.y + ny, edge, arc + len);
        LineVertex v3 = make_vertex(p1.x - nx, p1.y - ny, -edge, arc + len);

        out.push_back(v0);
        out.push_back(v1);
        out.push_back(v2);

        out.push_back(v1);
        out.push_back(v3);
        out.push_back(v2);

        arc += len;
    }

    return out.size() - first;
}

std::vector<LineVertex> tessellate_polyline(std::span<const Vec2> screen_points,
                                            const Color&          color,
                                            LinePattern           pattern,
                                            float                 line_width,
                                            float                 aa_fringe_px)
{
    std::vector<LineVertex> out;
    tessellate_polyline(screen_points, color, pattern, line_width, aa_fringe_px, out);
    return out;
}

}   // namespace lumaplot
