#pragma once

#include <cstdint>

namespace lumaplot
{

// Whether the fragment at `arc_length` pixels along a line is inside an "on"
// segment of the pattern. Patterns repeat with the period given by
// get_dash_pattern(); a position exactly on a segment boundary belongs to
// the segment that starts there. Unknown tags and non-positive line widths
// behave as Solid; LinePattern::None is never visible.
bool pattern_visible(float arc_length, uint32_t pattern_tag, float line_width);

}   // namespace lumaplot
