#include <lumaplot/offscreen.hpp>

#include "../renderer.hpp"
#include "sw_backend.hpp"

namespace lumaplot
{

Image render_offscreen(const PlotFrame& frame, const RenderConfig& config)
{
    SoftwareBackend backend;
    Renderer        renderer(backend);

    Image image;
    if (!renderer.render(frame, config))
        return image;

    image.width  = backend.target().width();
    image.height = backend.target().height();
    image.rgba   = backend.readback_rgba8();
    return image;
}

}   // namespace lumaplot
