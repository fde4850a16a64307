#include "sw_rasterizer.hpp"

namespace lumaplot::sw
{

RenderTarget::RenderTarget(uint32_t width, uint32_t height)
{
    resize(width, height);
}

void RenderTarget::resize(uint32_t width, uint32_t height)
{
    width_  = width;
    height_ = height;
    pixels_.assign(static_cast<size_t>(width) * height, Color{});
}

void RenderTarget::clear(const Color& color)
{
    std::fill(pixels_.begin(), pixels_.end(), color);
}

void RenderTarget::blend(uint32_t x, uint32_t y, const Color& src)
{
    if (x >= width_ || y >= height_)
        return;

    Color&      dst = pixels_[static_cast<size_t>(y) * width_ + x];
    const float a   = src.a;
    const float inv = 1.0f - a;
    dst.r           = src.r * a + dst.r * inv;
    dst.g           = src.g * a + dst.g * inv;
    dst.b           = src.b * a + dst.b * inv;
    dst.a           = a + dst.a * inv;
}

std::vector<uint8_t> RenderTarget::readback_rgba8() const
{
    auto to_u8 = [](float v)
    { return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f)); };

    std::vector<uint8_t> out;
    out.reserve(pixels_.size() * 4);
    for (const Color& c : pixels_)
    {
        out.push_back(to_u8(c.r));
        out.push_back(to_u8(c.g));
        out.push_back(to_u8(c.b));
        out.push_back(to_u8(c.a));
    }
    return out;
}

}   // namespace lumaplot::sw
