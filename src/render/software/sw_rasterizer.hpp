#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <lumaplot/color.hpp>
#include <lumaplot/gpu_types.hpp>
#include <utility>
#include <vector>

namespace lumaplot::sw
{

// Float RGBA color target, row 0 at the top.
class RenderTarget
{
   public:
    RenderTarget() = default;
    RenderTarget(uint32_t width, uint32_t height);

    void resize(uint32_t width, uint32_t height);
    void clear(const Color& color);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    bool     empty() const { return pixels_.empty(); }

    const Color& pixel(uint32_t x, uint32_t y) const { return pixels_[y * width_ + x]; }

    // Alpha-over: rgb = src.rgb*src.a + dst.rgb*(1-src.a),
    //             a   = src.a + dst.a*(1-src.a)
    void blend(uint32_t x, uint32_t y, const Color& src);

    // 8-bit RGBA, tightly packed, round(clamp(v, 0, 1) * 255) per channel.
    std::vector<uint8_t> readback_rgba8() const;

   private:
    uint32_t           width_  = 0;
    uint32_t           height_ = 0;
    std::vector<Color> pixels_;
};

// NDC (Y up) → pixel coordinates of a `width`×`height` target (Y down).
inline Vec2 ndc_to_pixel(Vec2 ndc, uint32_t width, uint32_t height)
{
    return {(ndc.x + 1.0f) * 0.5f * static_cast<float>(width),
            (1.0f - ndc.y) * 0.5f * static_cast<float>(height)};
}

namespace detail
{

inline double edge_function(const Vec2& a, const Vec2& b, double px, double py)
{
    return (static_cast<double>(b.x) - a.x) * (py - a.y)
           - (static_cast<double>(b.y) - a.y) * (px - a.x);
}

// With positive orientation (edge_function(a, b, c) > 0) a sample exactly on
// an edge belongs to the triangle only for top edges (horizontal, interior
// below) and left edges (interior to the right).
inline bool is_top_left(const Vec2& from, const Vec2& to)
{
    float dx = to.x - from.x;
    float dy = to.y - from.y;
    return dy < 0.0f || (dy == 0.0f && dx > 0.0f);
}

}   // namespace detail

// Calls `shade(x, y, w0, w1, w2)` for every pixel whose center (x+0.5,
// y+0.5) is covered by the triangle `p0 p1 p2` (pixel coordinates). The
// weights are barycentric and belong to p0, p1, p2 in the order given, for
// either winding. Zero-area and non-finite triangles are dropped.
inline void rasterize_triangle(Vec2 p0, Vec2 p1, Vec2 p2, uint32_t width, uint32_t height,
                               auto&& shade)
{
    if (width == 0 || height == 0)
        return;
    for (const Vec2& p : {p0, p1, p2})
    {
        if (!std::isfinite(p.x) || !std::isfinite(p.y))
            return;
    }

    Vec2 v[3]     = {p0, p1, p2};
    int  order[3] = {0, 1, 2};

    double area = detail::edge_function(v[0], v[1], v[2].x, v[2].y);
    if (area == 0.0)
        return;
    if (area < 0.0)
    {
        std::swap(v[1], v[2]);
        std::swap(order[1], order[2]);
        area = -area;
    }

    const bool tl0 = detail::is_top_left(v[1], v[2]);
    const bool tl1 = detail::is_top_left(v[2], v[0]);
    const bool tl2 = detail::is_top_left(v[0], v[1]);

    double min_x = std::min({v[0].x, v[1].x, v[2].x});
    double max_x = std::max({v[0].x, v[1].x, v[2].x});
    double min_y = std::min({v[0].y, v[1].y, v[2].y});
    double max_y = std::max({v[0].y, v[1].y, v[2].y});

    if (max_x < 0.0 || max_y < 0.0 || min_x > width || min_y > height)
        return;

    const double last_x = static_cast<double>(width) - 1.0;
    const double last_y = static_cast<double>(height) - 1.0;
    int x0 = static_cast<int>(std::clamp(std::floor(min_x - 0.5), 0.0, last_x));
    int x1 = static_cast<int>(std::clamp(std::ceil(max_x - 0.5), 0.0, last_x));
    int y0 = static_cast<int>(std::clamp(std::floor(min_y - 0.5), 0.0, last_y));
    int y1 = static_cast<int>(std::clamp(std::ceil(max_y - 0.5), 0.0, last_y));

    auto covers = [](double w, bool top_left) { return w > 0.0 || (w == 0.0 && top_left); };

    for (int y = y0; y <= y1; ++y)
    {
        double py = y + 0.5;
        for (int x = x0; x <= x1; ++x)
        {
            double px = x + 0.5;
            double w0 = detail::edge_function(v[1], v[2], px, py);
            double w1 = detail::edge_function(v[2], v[0], px, py);
            double w2 = detail::edge_function(v[0], v[1], px, py);
            if (!covers(w0, tl0) || !covers(w1, tl1) || !covers(w2, tl2))
                continue;

            float weight[3];
            weight[order[0]] = static_cast<float>(w0 / area);
            weight[order[1]] = static_cast<float>(w1 / area);
            weight[order[2]] = static_cast<float>(w2 / area);
            shade(static_cast<uint32_t>(x),
                  static_cast<uint32_t>(y),
                  weight[0],
                  weight[1],
                  weight[2]);
        }
    }
}

}   // namespace lumaplot::sw
