#include <lumaplot/export.hpp>
#include <lumaplot/logger.hpp>

// Suppress warnings in third-party STB headers
#if defined(__clang__)
    #pragma clang diagnostic push
    #pragma clang diagnostic ignored "-Wmissing-field-initializers"
    #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wmissing-field-initializers"
    #pragma GCC diagnostic ignored "-Wunused-function"
#endif

// Implementation lives in src/io/stb_impl.cpp
#include "stb_image_write.h"

#if defined(__clang__)
    #pragma clang diagnostic pop
#elif defined(__GNUC__)
    #pragma GCC diagnostic pop
#endif

namespace lumaplot
{

bool ImageExporter::write_png(const std::string& path,
                              const uint8_t*     rgba_data,
                              uint32_t           width,
                              uint32_t           height)
{
    if (!rgba_data || width == 0 || height == 0)
    {
        LUMAPLOT_LOG_ERROR("export", "PNG export of '{}' skipped: empty image", path);
        return false;
    }

    int result = stbi_write_png(path.c_str(),
                                static_cast<int>(width),
                                static_cast<int>(height),
                                4,
                                rgba_data,
                                static_cast<int>(width * 4));
    if (result == 0)
    {
        LUMAPLOT_LOG_ERROR("export", "Failed to write PNG '{}'", path);
        return false;
    }

    LUMAPLOT_LOG_INFO("export", "Wrote {}x{} PNG to '{}'", width, height, path);
    return true;
}

bool ImageExporter::write_png(const std::string& path, const Image& image)
{
    if (image.rgba.size() < static_cast<size_t>(image.width) * image.height * 4)
    {
        LUMAPLOT_LOG_ERROR("export",
                           "PNG export of '{}' skipped: {} bytes for {}x{}",
                           path,
                           image.rgba.size(),
                           image.width,
                           image.height);
        return false;
    }
    return write_png(path, image.rgba.data(), image.width, image.height);
}

}   // namespace lumaplot
