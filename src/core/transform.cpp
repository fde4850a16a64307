#include "transform.hpp"

namespace lumaplot
{

Vec2 data_to_screen(Vec2 data_pos, const UniformBlock& u)
{
    float plot_width  = u.viewport_size.x - 2.0f * u.padding.x;
    float plot_height = u.viewport_size.y - 2.0f * u.padding.y;

    // No clamping: points outside the range land outside the plot area
    float x_norm = (data_pos.x - u.x_range.min) / (u.x_range.max - u.x_range.min);
    float y_norm = (data_pos.y - u.y_range.min) / (u.y_range.max - u.y_range.min);

    // Data Y grows upward, screen Y grows downward
    return {u.padding.x + x_norm * plot_width, u.padding.y + (1.0f - y_norm) * plot_height};
}

Vec2 screen_to_ndc(Vec2 screen_pos, Vec2 viewport_size)
{
    return {screen_pos.x / viewport_size.x * 2.0f - 1.0f,
            1.0f - screen_pos.y / viewport_size.y * 2.0f};
}

Vec2 data_to_ndc(Vec2 data_pos, const UniformBlock& u)
{
    return screen_to_ndc(data_to_screen(data_pos, u), u.viewport_size);
}

Vec2 ndc_to_screen(Vec2 ndc, Vec2 viewport_size)
{
    return {(ndc.x + 1.0f) * 0.5f * viewport_size.x, (1.0f - ndc.y) * 0.5f * viewport_size.y};
}

Vec2 marker_size_ndc(const UniformBlock& u)
{
    return {2.0f * u.marker_radius / u.viewport_size.x, 2.0f * u.marker_radius / u.viewport_size.y};
}

}   // namespace lumaplot
