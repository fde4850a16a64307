#pragma once

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

namespace lumaplot::test
{

struct DiffResult
{
    double mean_absolute_error = 0.0;   // per channel, 0..255
    double max_absolute_error  = 0.0;
    size_t differing_pixels    = 0;     // any channel above threshold
    size_t total_pixels        = 0;
    double percent_different   = 0.0;

    bool passed(double tolerance_percent = 1.0, double max_mae = 2.0) const
    {
        return percent_different <= tolerance_percent && mean_absolute_error <= max_mae;
    }
};

inline bool pixel_differs(const uint8_t* a, const uint8_t* b, uint8_t threshold)
{
    for (int c = 0; c < 4; ++c)
    {
        if (std::abs(static_cast<int>(a[c]) - static_cast<int>(b[c])) > threshold)
            return true;
    }
    return false;
}

// Both buffers are tightly packed RGBA8 of the same size.
inline DiffResult compare_images(const uint8_t* actual,
                                 const uint8_t* expected,
                                 uint32_t       width,
                                 uint32_t       height,
                                 uint8_t        threshold = 2)
{
    DiffResult result;
    result.total_pixels = static_cast<size_t>(width) * height;
    if (result.total_pixels == 0)
        return result;

    double sum = 0.0;
    for (size_t i = 0; i < result.total_pixels * 4; ++i)
    {
        double d = std::abs(static_cast<double>(actual[i]) - static_cast<double>(expected[i]));
        sum += d;
        if (d > result.max_absolute_error)
            result.max_absolute_error = d;
    }
    for (size_t i = 0; i < result.total_pixels; ++i)
    {
        if (pixel_differs(actual + i * 4, expected + i * 4, threshold))
            ++result.differing_pixels;
    }

    result.mean_absolute_error = sum / (static_cast<double>(result.total_pixels) * 4.0);
    result.percent_different   = 100.0 * static_cast<double>(result.differing_pixels)
                               / static_cast<double>(result.total_pixels);
    return result;
}

// Differing pixels in red over a dimmed copy of `actual`.
inline std::vector<uint8_t> generate_diff_image(const uint8_t* actual,
                                                const uint8_t* expected,
                                                uint32_t       width,
                                                uint32_t       height,
                                                uint8_t        threshold = 2)
{
    const size_t         total = static_cast<size_t>(width) * height;
    std::vector<uint8_t> out(total * 4);

    for (size_t i = 0; i < total; ++i)
    {
        uint8_t*       dst = &out[i * 4];
        const uint8_t* src = actual + i * 4;
        if (pixel_differs(src, expected + i * 4, threshold))
        {
            dst[0] = 255;
            dst[1] = 0;
            dst[2] = 0;
        }
        else
        {
            dst[0] = src[0] / 3;
            dst[1] = src[1] / 3;
            dst[2] = src[2] / 3;
        }
        dst[3] = 255;
    }
    return out;
}

// Raw baseline format: uint32 width, uint32 height, then RGBA8 rows.
inline bool load_raw_rgba(const std::string&    path,
                          std::vector<uint8_t>& pixels,
                          uint32_t&             width,
                          uint32_t&             height)
{
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        return false;

    f.read(reinterpret_cast<char*>(&width), sizeof(uint32_t));
    f.read(reinterpret_cast<char*>(&height), sizeof(uint32_t));
    if (!f || width == 0 || height == 0 || width > 16384 || height > 16384)
        return false;

    pixels.resize(static_cast<size_t>(width) * height * 4);
    f.read(reinterpret_cast<char*>(pixels.data()), static_cast<std::streamsize>(pixels.size()));
    return f.good();
}

inline bool save_raw_rgba(const std::string& path,
                          const uint8_t*     pixels,
                          uint32_t           width,
                          uint32_t           height)
{
    std::ofstream f(path, std::ios::binary);
    if (!f.is_open())
        return false;

    f.write(reinterpret_cast<const char*>(&width), sizeof(uint32_t));
    f.write(reinterpret_cast<const char*>(&height), sizeof(uint32_t));
    f.write(reinterpret_cast<const char*>(pixels),
            static_cast<std::streamsize>(static_cast<size_t>(width) * height * 4));
    return f.good();
}

}   // namespace lumaplot::test
