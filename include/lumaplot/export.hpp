#pragma once

#include <cstdint>
#include <lumaplot/offscreen.hpp>
#include <string>

namespace lumaplot
{

#ifdef LUMAPLOT_USE_STB
class ImageExporter
{
   public:
    // RGBA8, row 0 at the top. Returns false for null data, a zero
    // dimension, or a failed write.
    static bool write_png(const std::string& path,
                          const uint8_t*     rgba_data,
                          uint32_t           width,
                          uint32_t           height);

    static bool write_png(const std::string& path, const Image& image);
};
#endif   // LUMAPLOT_USE_STB

}   // namespace lumaplot
