#include "line_pattern.hpp"

#include <lumaplot/plot_style.hpp>

#include "shader_math.hpp"

namespace lumaplot
{

bool pattern_visible(float arc_length, uint32_t pattern_tag, float line_width)
{
    if (pattern_tag > to_tag(LinePattern::None))
        return true;

    auto pattern = static_cast<LinePattern>(pattern_tag);
    switch (pattern)
    {
        case LinePattern::Solid:
            return true;
        case LinePattern::None:
            return false;
        case LinePattern::Dashed:
        case LinePattern::Dotted:
        case LinePattern::DashDot:
            break;
    }

    DashPattern dash = get_dash_pattern(pattern, line_width);
    if (!(dash.total > 0.0f))
        return true;

    float t     = glsl_mod(arc_length, dash.total);
    float start = 0.0f;
    for (int i = 0; i < dash.count; ++i)
    {
        float end = start + dash.segments[i];
        if (t < end)
            return (i % 2) == 0;
        start = end;
    }
    // Rounding can leave t a hair past the last boundary; that is the
    // start of the next period, which is "on"
    return true;
}

}   // namespace lumaplot
