#pragma once

#include <cstdint>
#include <lumaplot/gpu_types.hpp>

namespace lumaplot
{

// Reasons a UniformBlock cannot be submitted. Checks run in declaration
// order and the first failure wins.
enum class UniformError : uint8_t
{
    None = 0,
    NonPositiveViewport,      // viewport_size.x or .y <= 0
    DegenerateXRange,         // x_range.max <= x_range.min
    DegenerateYRange,         // y_range.max <= y_range.min
    PaddingTooLarge,          // negative, or leaves no plot area
    NonPositiveMarkerRadius,
    NonPositiveLineWidth,
    NonFiniteValue,           // any NaN or infinity
};

UniformError validate_uniforms(const UniformBlock& u);

const char* uniform_error_name(UniformError e);

}   // namespace lumaplot
