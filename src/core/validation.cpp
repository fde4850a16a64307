#include <cmath>
#include <lumaplot/validation.hpp>

namespace lumaplot
{

namespace
{

// Comparisons are written as !(a > b) so that NaN fails them; a NaN that
// survives to the last check is reported as NonFiniteValue.
bool all_finite(const UniformBlock& u)
{
    const float values[] = {
        u.viewport_size.x,
        u.viewport_size.y,
        u.x_range.min,
        u.x_range.max,
        u.y_range.min,
        u.y_range.max,
        u.padding.x,
        u.padding.y,
        u.marker_radius,
        u.line_width,
    };
    for (float v : values)
    {
        if (!std::isfinite(v))
            return false;
    }
    return true;
}

}   // anonymous namespace

UniformError validate_uniforms(const UniformBlock& u)
{
    if (!(u.viewport_size.x > 0.0f) || !(u.viewport_size.y > 0.0f))
        return UniformError::NonPositiveViewport;

    if (!(u.x_range.max > u.x_range.min))
        return UniformError::DegenerateXRange;
    if (!(u.y_range.max > u.y_range.min))
        return UniformError::DegenerateYRange;

    if (u.padding.x < 0.0f || u.padding.y < 0.0f
        || 2.0f * u.padding.x >= u.viewport_size.x || 2.0f * u.padding.y >= u.viewport_size.y)
        return UniformError::PaddingTooLarge;

    if (!(u.marker_radius > 0.0f))
        return UniformError::NonPositiveMarkerRadius;
    if (!(u.line_width > 0.0f))
        return UniformError::NonPositiveLineWidth;

    if (!all_finite(u))
        return UniformError::NonFiniteValue;

    return UniformError::None;
}

const char* uniform_error_name(UniformError e)
{
    switch (e)
    {
        case UniformError::None:
            return "None";
        case UniformError::NonPositiveViewport:
            return "NonPositiveViewport";
        case UniformError::DegenerateXRange:
            return "DegenerateXRange";
        case UniformError::DegenerateYRange:
            return "DegenerateYRange";
        case UniformError::PaddingTooLarge:
            return "PaddingTooLarge";
        case UniformError::NonPositiveMarkerRadius:
            return "NonPositiveMarkerRadius";
        case UniformError::NonPositiveLineWidth:
            return "NonPositiveLineWidth";
        case UniformError::NonFiniteValue:
            return "NonFiniteValue";
    }
    return "Unknown";
}

}   // namespace lumaplot
