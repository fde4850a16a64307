#pragma once

#include <cstdint>
#include <lumaplot/frame.hpp>
#include <vector>

namespace lumaplot
{

// 8-bit RGBA pixels, row 0 at the top, tightly packed.
struct Image
{
    uint32_t             width  = 0;
    uint32_t             height = 0;
    std::vector<uint8_t> rgba;

    bool empty() const { return rgba.empty(); }
};

// Draws `frame` headless on the CPU, at the frame's viewport size.
// Returns an empty Image if the frame is rejected (see validate_uniforms).
Image render_offscreen(const PlotFrame& frame, const RenderConfig& config = {});

}   // namespace lumaplot
