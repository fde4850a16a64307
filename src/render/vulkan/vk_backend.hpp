#pragma once

#include <vulkan/vulkan.h>

#include "../backend.hpp"
#include "vk_buffer.hpp"
#include "vk_pipeline.hpp"

namespace lumaplot::vk
{

// Handles owned by the caller. The backend builds its pipelines against
// `render_pass` (subpass 0) and never creates devices, queues or swapchains.
struct DeviceContext
{
    VkDevice         device          = VK_NULL_HANDLE;
    VkPhysicalDevice physical_device = VK_NULL_HANDLE;
    VkRenderPass     render_pass     = VK_NULL_HANDLE;
};

// Records plot draws into a caller-owned command buffer.
//
// Usage per frame:
//   vkCmdBeginRenderPass(cmd, ...);
//   backend.set_command_buffer(cmd);
//   renderer.render(frame);
//   vkCmdEndRenderPass(cmd);
//
// update() writes host-coherent buffers directly; do not call it while a
// command buffer recorded against the previous data is still executing.
class VulkanBackend : public Backend
{
   public:
    // Throws std::runtime_error if any Vulkan object cannot be created.
    explicit VulkanBackend(const DeviceContext& ctx);
    ~VulkanBackend() override;

    VulkanBackend(const VulkanBackend&)            = delete;
    VulkanBackend& operator=(const VulkanBackend&) = delete;

    void set_command_buffer(VkCommandBuffer cmd) { cmd_ = cmd; }

    void begin_frame(const Color& clear_color = colors::white) override;
    bool update(const UniformBlock&            uniforms,
                std::span<const PointInstance> points,
                std::span<const LineVertex>    line_vertices) override;
    void draw_lines(uint32_t vertex_count) override;
    void draw_markers(uint32_t instance_count) override;
    void end_frame() override;

    VkPipeline       marker_pipeline() const { return marker_pipeline_; }
    VkPipeline       line_pipeline() const { return line_pipeline_; }
    VkPipelineLayout pipeline_layout() const { return pipeline_layout_; }

   private:
    void create_descriptors();
    void create_pipelines();
    void destroy();

    bool can_record() const;

    // Viewport, scissor and clear, once per frame before the first draw.
    void prepare_frame_state();

    DeviceContext   ctx_;
    VkCommandBuffer cmd_ = VK_NULL_HANDLE;

    VkDescriptorSetLayout desc_layout_     = VK_NULL_HANDLE;
    VkPipelineLayout      pipeline_layout_ = VK_NULL_HANDLE;
    VkDescriptorPool      desc_pool_       = VK_NULL_HANDLE;
    VkDescriptorSet       desc_set_        = VK_NULL_HANDLE;
    VkPipeline            marker_pipeline_ = VK_NULL_HANDLE;
    VkPipeline            line_pipeline_   = VK_NULL_HANDLE;

    GpuBuffer      uniform_buffer_;
    GrowableBuffer marker_buffer_;
    GrowableBuffer line_buffer_;

    UniformBlock uniforms_;
    Color        clear_color_    = colors::white;
    bool         has_data_       = false;
    bool         frame_prepared_ = false;
    uint32_t     marker_count_   = 0;
    uint32_t     line_count_     = 0;
};

}   // namespace lumaplot::vk
