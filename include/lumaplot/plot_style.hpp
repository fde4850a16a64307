#pragma once

#include <cstdint>

namespace lumaplot
{

// ─── Marker Shapes ───────────────────────────────────────────────────────────
// Values are the raw tags stored in PointInstance::shape and read by the
// marker shaders. Any tag outside this set is drawn as a Circle.

enum class MarkerShape : uint32_t
{
    Circle       = 0,  // ○
    Square       = 1,  // □  inscribed, 0.7 of the quad
    Diamond      = 2,  // ◇
    TriangleUp   = 3,  // △
    TriangleDown = 4,  // ▽
    Cross        = 5,  // ×
    Plus         = 6,  // +
    None         = 7,  // not drawn
};

// ─── Line Patterns ───────────────────────────────────────────────────────────
// Raw tags stored in LineVertex::pattern. Unknown tags are drawn Solid.

enum class LinePattern : uint32_t
{
    Solid   = 0,  // ────────────
    Dashed  = 1,  // ── ── ── ──
    Dotted  = 2,  // ··············
    DashDot = 3,  // ──·──·──·──
    None    = 4,  // not drawn
};

constexpr uint32_t to_tag(MarkerShape s)
{
    return static_cast<uint32_t>(s);
}

constexpr uint32_t to_tag(LinePattern p)
{
    return static_cast<uint32_t>(p);
}

// ─── String Conversions ──────────────────────────────────────────────────────

constexpr const char* marker_shape_name(MarkerShape s)
{
    switch (s)
    {
        case MarkerShape::Circle:
            return "Circle";
        case MarkerShape::Square:
            return "Square";
        case MarkerShape::Diamond:
            return "Diamond";
        case MarkerShape::TriangleUp:
            return "Triangle Up";
        case MarkerShape::TriangleDown:
            return "Triangle Down";
        case MarkerShape::Cross:
            return "Cross";
        case MarkerShape::Plus:
            return "Plus";
        case MarkerShape::None:
            return "None";
    }
    return "Unknown";
}

constexpr const char* line_pattern_name(LinePattern p)
{
    switch (p)
    {
        case LinePattern::Solid:
            return "Solid";
        case LinePattern::Dashed:
            return "Dashed";
        case LinePattern::Dotted:
            return "Dotted";
        case LinePattern::DashDot:
            return "Dash-Dot";
        case LinePattern::None:
            return "None";
    }
    return "Unknown";
}

constexpr int MARKER_SHAPE_COUNT = 8;
constexpr int LINE_PATTERN_COUNT = 5;

constexpr MarkerShape ALL_MARKER_SHAPES[] = {
    MarkerShape::Circle,
    MarkerShape::Square,
    MarkerShape::Diamond,
    MarkerShape::TriangleUp,
    MarkerShape::TriangleDown,
    MarkerShape::Cross,
    MarkerShape::Plus,
    MarkerShape::None,
};

constexpr LinePattern ALL_LINE_PATTERNS[] = {
    LinePattern::Solid,
    LinePattern::Dashed,
    LinePattern::Dotted,
    LinePattern::DashDot,
    LinePattern::None,
};

// ─── Dash Pattern ────────────────────────────────────────────────────────────
// Alternating on/off lengths in pixels, starting with "on". Lengths scale
// with the line width so patterns keep their proportions on thick lines.

struct DashPattern
{
    float segments[4]{};  // on, off, on, off
    int count   = 0;      // number of segments in use (even)
    float total = 0.0f;   // pattern repeat length
};

constexpr DashPattern get_dash_pattern(LinePattern pattern, float line_width)
{
    DashPattern p;
    const float w = line_width;
    switch (pattern)
    {
        case LinePattern::Solid:
        case LinePattern::None:
            break;
        case LinePattern::Dashed:
            p.segments[0] = 8.0f * w;
            p.segments[1] = 4.0f * w;
            p.count       = 2;
            p.total       = 12.0f * w;
            break;
        case LinePattern::Dotted:
            p.segments[0] = 2.0f * w;
            p.segments[1] = 4.0f * w;
            p.count       = 2;
            p.total       = 6.0f * w;
            break;
        case LinePattern::DashDot:
            p.segments[0] = 8.0f * w;
            p.segments[1] = 3.5f * w;
            p.segments[2] = 2.0f * w;
            p.segments[3] = 3.5f * w;
            p.count       = 4;
            p.total       = 17.0f * w;
            break;
    }
    return p;
}

}   // namespace lumaplot
