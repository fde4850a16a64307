#include "sw_backend.hpp"

#include <cmath>
#include <lumaplot/logger.hpp>

#include "../line_stage.hpp"
#include "../marker_stage.hpp"

namespace lumaplot
{

namespace
{

float interp(float a, float b, float c, float w0, float w1, float w2)
{
    return a * w0 + b * w1 + c * w2;
}

Vec2 interp(const Vec2& a, const Vec2& b, const Vec2& c, float w0, float w1, float w2)
{
    return {interp(a.x, b.x, c.x, w0, w1, w2), interp(a.y, b.y, c.y, w0, w1, w2)};
}

Color interp(const Color& a, const Color& b, const Color& c, float w0, float w1, float w2)
{
    return {interp(a.r, b.r, c.r, w0, w1, w2),
            interp(a.g, b.g, c.g, w0, w1, w2),
            interp(a.b, b.b, c.b, w0, w1, w2),
            interp(a.a, b.a, c.a, w0, w1, w2)};
}

}   // anonymous namespace

void SoftwareBackend::begin_frame(const Color& clear_color)
{
    clear_color_ = clear_color;
    has_data_    = false;
    target_.clear(clear_color_);
}

bool SoftwareBackend::update(const UniformBlock&            uniforms,
                             std::span<const PointInstance> points,
                             std::span<const LineVertex>    line_vertices)
{
    const float w = std::round(uniforms.viewport_size.x);
    const float h = std::round(uniforms.viewport_size.y);
    if (!(w >= 1.0f) || !(h >= 1.0f) || w > MAX_TARGET_DIM || h > MAX_TARGET_DIM)
    {
        LUMAPLOT_LOG_ERROR("render",
                           "Software target size {}x{} out of range (1..{})",
                           uniforms.viewport_size.x,
                           uniforms.viewport_size.y,
                           MAX_TARGET_DIM);
        has_data_ = false;
        return false;
    }

    const auto width  = static_cast<uint32_t>(w);
    const auto height = static_cast<uint32_t>(h);
    if (target_.width() != width || target_.height() != height)
        target_.resize(width, height);
    target_.clear(clear_color_);

    uniforms_ = uniforms;
    points_.assign(points.begin(), points.end());
    line_vertices_.assign(line_vertices.begin(), line_vertices.end());
    has_data_ = true;
    return true;
}

void SoftwareBackend::draw_lines(uint32_t vertex_count)
{
    if (!has_data_)
    {
        LUMAPLOT_LOG_WARN("render", "draw_lines() without a successful update()");
        return;
    }
    if (vertex_count > line_vertices_.size())
    {
        LUMAPLOT_LOG_WARN("render",
                          "draw_lines({}) exceeds {} uploaded vertices; clamping",
                          vertex_count,
                          line_vertices_.size());
        vertex_count = static_cast<uint32_t>(line_vertices_.size());
    }

    const uint32_t width  = target_.width();
    const uint32_t height = target_.height();

    for (uint32_t first = 0; first + 3 <= vertex_count; first += 3)
    {
        LineVaryings v[3];
        Vec2         p[3];
        for (int i = 0; i < 3; ++i)
        {
            v[i] = line_vertex(line_vertices_[first + i], uniforms_);
            p[i] = sw::ndc_to_pixel(v[i].clip_position, width, height);
        }
        const uint32_t pattern = v[0].pattern;

        sw::rasterize_triangle(
            p[0],
            p[1],
            p[2],
            width,
            height,
            [&](uint32_t x, uint32_t y, float w0, float w1, float w2)
            {
                Color color = interp(v[0].color, v[1].color, v[2].color, w0, w1, w2);
                float edge  = interp(
                    v[0].edge_distance, v[1].edge_distance, v[2].edge_distance, w0, w1, w2);
                float arc =
                    interp(v[0].arc_length, v[1].arc_length, v[2].arc_length, w0, w1, w2);

                if (auto out = line_fragment(color, edge, arc, pattern, uniforms_))
                    target_.blend(x, y, *out);
            });
    }
}

void SoftwareBackend::draw_markers(uint32_t instance_count)
{
    if (!has_data_)
    {
        LUMAPLOT_LOG_WARN("render", "draw_markers() without a successful update()");
        return;
    }
    if (instance_count > points_.size())
    {
        LUMAPLOT_LOG_WARN("render",
                          "draw_markers({}) exceeds {} uploaded instances; clamping",
                          instance_count,
                          points_.size());
        instance_count = static_cast<uint32_t>(points_.size());
    }

    const uint32_t width  = target_.width();
    const uint32_t height = target_.height();

    for (uint32_t inst = 0; inst < instance_count; ++inst)
    {
        const PointInstance& point = points_[inst];

        for (uint32_t first = 0; first < MARKER_QUAD_VERTEX_COUNT; first += 3)
        {
            MarkerVaryings v[3];
            Vec2           p[3];
            for (uint32_t i = 0; i < 3; ++i)
            {
                v[i] = marker_vertex(first + i, point, uniforms_);
                p[i] = sw::ndc_to_pixel(v[i].clip_position, width, height);
            }
            const uint32_t shape = v[0].shape;

            sw::rasterize_triangle(
                p[0],
                p[1],
                p[2],
                width,
                height,
                [&](uint32_t x, uint32_t y, float w0, float w1, float w2)
                {
                    Color color = interp(v[0].color, v[1].color, v[2].color, w0, w1, w2);
                    Vec2  local =
                        interp(v[0].local_pos, v[1].local_pos, v[2].local_pos, w0, w1, w2);

                    if (auto out = marker_fragment(color, local, shape))
                        target_.blend(x, y, *out);
                });
        }
    }
}

void SoftwareBackend::end_frame()
{
    has_data_ = false;
}

}   // namespace lumaplot
