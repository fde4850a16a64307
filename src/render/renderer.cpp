#include "renderer.hpp"

#include <lumaplot/logger.hpp>
#include <lumaplot/validation.hpp>

namespace lumaplot
{

Renderer::Renderer(Backend& backend) : backend_(backend) {}

bool Renderer::render(const PlotFrame& frame, const RenderConfig& config)
{
    UniformError err = validate_uniforms(frame.uniforms);
    if (err != UniformError::None)
    {
        LUMAPLOT_LOG_ERROR("render",
                           "Refusing to draw frame: invalid uniforms ({})",
                           uniform_error_name(err));
        ++frames_rejected_;
        return false;
    }

    backend_.begin_frame(config.clear_color);

    if (!backend_.update(frame.uniforms, frame.points, frame.line_vertices))
    {
        LUMAPLOT_LOG_ERROR("render", "Backend rejected frame upload");
        backend_.end_frame();
        ++frames_rejected_;
        return false;
    }

    // Lines under markers
    const uint32_t line_vertices = frame.line_vertex_count();
    if (config.show_lines && line_vertices > 0)
        backend_.draw_lines(line_vertices);

    const uint32_t markers = frame.point_count();
    if (config.show_markers && markers > 0)
        backend_.draw_markers(markers);

    backend_.end_frame();
    ++frames_rendered_;

    LUMAPLOT_LOG_TRACE("render",
                       "Frame {}: {} line vertices, {} markers",
                       frames_rendered_,
                       config.show_lines ? line_vertices : 0u,
                       config.show_markers ? markers : 0u);
    return true;
}

}   // namespace lumaplot
