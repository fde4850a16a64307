#pragma once

#include <cstdint>
#include <vector>

#include "../backend.hpp"
#include "sw_rasterizer.hpp"

namespace lumaplot
{

// Runs the marker and line stage reference functions on the CPU, one
// invocation at a time in buffer order. The target is sized to the
// viewport of the most recent update().
class SoftwareBackend : public Backend
{
   public:
    // Viewports larger than this on either axis are refused by update().
    static constexpr uint32_t MAX_TARGET_DIM = 16384;

    SoftwareBackend() = default;

    void begin_frame(const Color& clear_color = colors::white) override;
    bool update(const UniformBlock&            uniforms,
                std::span<const PointInstance> points,
                std::span<const LineVertex>    line_vertices) override;
    void draw_lines(uint32_t vertex_count) override;
    void draw_markers(uint32_t instance_count) override;
    void end_frame() override;

    const sw::RenderTarget& target() const { return target_; }
    std::vector<uint8_t>    readback_rgba8() const { return target_.readback_rgba8(); }

   private:
    sw::RenderTarget           target_;
    Color                      clear_color_ = colors::white;
    bool                       has_data_    = false;
    UniformBlock               uniforms_;
    std::vector<PointInstance> points_;
    std::vector<LineVertex>    line_vertices_;
};

}   // namespace lumaplot
