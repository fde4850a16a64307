#include "marker_sdf.hpp"

#include <algorithm>
#include <cmath>

#include "shader_math.hpp"

namespace lumaplot
{

float sdf_circle(Vec2 p)
{
    return length(p.x, p.y) - 1.0f;
}

float sdf_square(Vec2 p)
{
    // Inscribed at 0.7 so the square reads the same visual weight as the circle
    return std::max(std::abs(p.x), std::abs(p.y)) - 0.7f;
}

float sdf_diamond(Vec2 p)
{
    return std::abs(p.x) + std::abs(p.y) - 1.0f;
}

// Intersection of three half-planes: sides, base and the two slanted edges.
float sdf_triangle_up(Vec2 p)
{
    float ax = std::abs(p.x);
    return std::max({ax - 0.7f, p.y - 0.5f, (ax * 0.866f - p.y) * 0.5f - 0.5f});
}

float sdf_triangle_down(Vec2 p)
{
    float ax = std::abs(p.x);
    return std::max({ax - 0.7f, -p.y - 0.5f, (ax * 0.866f + p.y) * 0.5f - 0.5f});
}

// Both diagonals as one band of half-thickness 0.2, clipped to the quad.
float sdf_cross(Vec2 p)
{
    float ax = std::abs(p.x);
    float ay = std::abs(p.y);
    float d1 = std::abs(ax - ay) - 0.2f;
    float d2 = std::max(ax, ay) - 1.0f;
    return std::max(d1, d2);
}

// Union of a horizontal and a vertical bar of half-thickness 0.2.
float sdf_plus(Vec2 p)
{
    float ax = std::abs(p.x);
    float ay = std::abs(p.y);
    float d1 = std::max(ax, ay) - 0.2f;
    float d2 = std::min(ax, ay) - 0.2f;
    float d3 = std::max(ax, ay) - 1.0f;
    return std::max(std::min(d1, d2), d3);
}

float marker_sdf(Vec2 p, uint32_t shape_tag)
{
    if (shape_tag > to_tag(MarkerShape::Plus))
        return sdf_circle(p);

    switch (static_cast<MarkerShape>(shape_tag))
    {
        case MarkerShape::Circle:
            return sdf_circle(p);
        case MarkerShape::Square:
            return sdf_square(p);
        case MarkerShape::Diamond:
            return sdf_diamond(p);
        case MarkerShape::TriangleUp:
            return sdf_triangle_up(p);
        case MarkerShape::TriangleDown:
            return sdf_triangle_down(p);
        case MarkerShape::Cross:
            return sdf_cross(p);
        case MarkerShape::Plus:
            return sdf_plus(p);
        case MarkerShape::None:
            break;
    }
    return sdf_circle(p);
}

}   // namespace lumaplot
