#pragma once

#include <cstdint>
#include <lumaplot/frame.hpp>

#include "backend.hpp"

namespace lumaplot
{

class Renderer
{
   public:
    explicit Renderer(Backend& backend);
    ~Renderer() = default;

    Renderer(const Renderer&)            = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Validate, upload and draw one frame: lines first, markers on top.
    // Returns false without drawing if the uniforms are invalid or the
    // backend rejects the upload; the reason is logged.
    bool render(const PlotFrame& frame, const RenderConfig& config = {});

    Backend& backend() { return backend_; }

    uint32_t frames_rendered() const { return frames_rendered_; }
    uint32_t frames_rejected() const { return frames_rejected_; }

   private:
    Backend& backend_;
    uint32_t frames_rendered_ = 0;
    uint32_t frames_rejected_ = 0;
};

}   // namespace lumaplot
