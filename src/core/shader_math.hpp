#pragma once

#include <algorithm>
#include <cmath>

namespace lumaplot
{

// GLSL built-ins used by the stage reference functions, with GLSL semantics.

inline float clampf(float x, float lo, float hi)
{
    return std::min(std::max(x, lo), hi);
}

inline float smoothstep(float edge0, float edge1, float x)
{
    float t = clampf((x - edge0) / (edge1 - edge0), 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

inline float length(float x, float y)
{
    return std::sqrt(x * x + y * y);
}

// GLSL mod(): x - y * floor(x / y), result has the sign of y.
inline float glsl_mod(float x, float y)
{
    return x - y * std::floor(x / y);
}

}   // namespace lumaplot
