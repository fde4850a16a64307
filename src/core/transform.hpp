#pragma once

#include <lumaplot/gpu_types.hpp>

namespace lumaplot
{

// Coordinate transform utilities shared by the marker and line stages.
// The pipeline is: data → screen pixels (top-left origin) → NDC (Y up).
// None of these functions guard against degenerate ranges; validate the
// UniformBlock first (see validate_uniforms).

// Data space → screen pixels, honoring padding and the Y flip.
Vec2 data_to_screen(Vec2 data_pos, const UniformBlock& u);

// Screen pixels → NDC. Used alone by the line stage.
Vec2 screen_to_ndc(Vec2 screen_pos, Vec2 viewport_size);

// Data space → NDC in one step (the marker stage's center mapping).
Vec2 data_to_ndc(Vec2 data_pos, const UniformBlock& u);

// NDC → screen pixels, the inverse of screen_to_ndc.
Vec2 ndc_to_screen(Vec2 ndc, Vec2 viewport_size);

// Marker quad half-extent in NDC for the block's marker radius.
Vec2 marker_size_ndc(const UniformBlock& u);

}   // namespace lumaplot
