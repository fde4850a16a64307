#include "vk_backend.hpp"

#include <cmath>
#include <lumaplot/logger.hpp>
#include <stdexcept>
#include <string>

#include "shader_spirv.hpp"

namespace lumaplot::vk
{

VulkanBackend::VulkanBackend(const DeviceContext& ctx) : ctx_(ctx)
{
    if (ctx_.device == VK_NULL_HANDLE || ctx_.physical_device == VK_NULL_HANDLE
        || ctx_.render_pass == VK_NULL_HANDLE)
    {
        throw std::runtime_error("VulkanBackend requires a device, physical device and render pass");
    }

    try
    {
        create_descriptors();
        create_pipelines();

        marker_buffer_.init(ctx_.device,
                            ctx_.physical_device,
                            sizeof(PointInstance),
                            VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
        line_buffer_.init(ctx_.device,
                          ctx_.physical_device,
                          sizeof(LineVertex),
                          VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    }
    catch (const std::runtime_error& e)
    {
        LUMAPLOT_LOG_ERROR("vulkan", "Backend creation failed: {}", e.what());
        destroy();
        throw;
    }

    LUMAPLOT_LOG_INFO("vulkan", "Plot pipelines ready");
}

VulkanBackend::~VulkanBackend()
{
    destroy();
}

void VulkanBackend::create_descriptors()
{
    desc_layout_     = create_uniform_descriptor_layout(ctx_.device);
    pipeline_layout_ = create_pipeline_layout(ctx_.device, {desc_layout_});

    uniform_buffer_ = GpuBuffer::create(ctx_.device,
                                        ctx_.physical_device,
                                        sizeof(UniformBlock),
                                        VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT,
                                        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT
                                            | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);

    VkDescriptorPoolSize pool_size{VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 1};

    VkDescriptorPoolCreateInfo pool_info{};
    pool_info.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    pool_info.maxSets       = 1;
    pool_info.poolSizeCount = 1;
    pool_info.pPoolSizes    = &pool_size;

    if (vkCreateDescriptorPool(ctx_.device, &pool_info, nullptr, &desc_pool_) != VK_SUCCESS)
    {
        throw std::runtime_error("Failed to create descriptor pool");
    }

    VkDescriptorSetAllocateInfo alloc_info{};
    alloc_info.sType              = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    alloc_info.descriptorPool     = desc_pool_;
    alloc_info.descriptorSetCount = 1;
    alloc_info.pSetLayouts        = &desc_layout_;

    if (vkAllocateDescriptorSets(ctx_.device, &alloc_info, &desc_set_) != VK_SUCCESS)
    {
        throw std::runtime_error("Failed to allocate uniform descriptor set");
    }

    VkDescriptorBufferInfo buffer_info{};
    buffer_info.buffer = uniform_buffer_.buffer();
    buffer_info.offset = 0;
    buffer_info.range  = sizeof(UniformBlock);

    VkWriteDescriptorSet write{};
    write.sType           = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    write.dstSet          = desc_set_;
    write.dstBinding      = 0;
    write.descriptorCount = 1;
    write.descriptorType  = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    write.pBufferInfo     = &buffer_info;

    vkUpdateDescriptorSets(ctx_.device, 1, &write, 0, nullptr);
}

void VulkanBackend::create_pipelines()
{
    PipelineConfig cfg;
    cfg.render_pass     = ctx_.render_pass;
    cfg.pipeline_layout = pipeline_layout_;
    cfg.topology        = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    cfg.enable_blending = true;

    cfg.vert_spirv        = shaders::marker_vert;
    cfg.vert_spirv_size   = shaders::marker_vert_size;
    cfg.frag_spirv        = shaders::marker_frag;
    cfg.frag_spirv_size   = shaders::marker_frag_size;
    cfg.vertex_bindings   = marker_vertex_bindings();
    cfg.vertex_attributes = marker_vertex_attributes();
    marker_pipeline_      = create_graphics_pipeline(ctx_.device, cfg);

    cfg.vert_spirv        = shaders::line_vert;
    cfg.vert_spirv_size   = shaders::line_vert_size;
    cfg.frag_spirv        = shaders::line_frag;
    cfg.frag_spirv_size   = shaders::line_frag_size;
    cfg.vertex_bindings   = line_vertex_bindings();
    cfg.vertex_attributes = line_vertex_attributes();
    line_pipeline_        = create_graphics_pipeline(ctx_.device, cfg);

    LUMAPLOT_LOG_DEBUG("vulkan", "Created marker and line pipelines");
}

void VulkanBackend::destroy()
{
    if (ctx_.device == VK_NULL_HANDLE)
        return;

    marker_buffer_.destroy();
    line_buffer_.destroy();
    uniform_buffer_.destroy();

    if (line_pipeline_ != VK_NULL_HANDLE)
    {
        vkDestroyPipeline(ctx_.device, line_pipeline_, nullptr);
        line_pipeline_ = VK_NULL_HANDLE;
    }
    if (marker_pipeline_ != VK_NULL_HANDLE)
    {
        vkDestroyPipeline(ctx_.device, marker_pipeline_, nullptr);
        marker_pipeline_ = VK_NULL_HANDLE;
    }
    // Destroying the pool frees desc_set_
    if (desc_pool_ != VK_NULL_HANDLE)
    {
        vkDestroyDescriptorPool(ctx_.device, desc_pool_, nullptr);
        desc_pool_ = VK_NULL_HANDLE;
        desc_set_  = VK_NULL_HANDLE;
    }
    if (pipeline_layout_ != VK_NULL_HANDLE)
    {
        vkDestroyPipelineLayout(ctx_.device, pipeline_layout_, nullptr);
        pipeline_layout_ = VK_NULL_HANDLE;
    }
    if (desc_layout_ != VK_NULL_HANDLE)
    {
        vkDestroyDescriptorSetLayout(ctx_.device, desc_layout_, nullptr);
        desc_layout_ = VK_NULL_HANDLE;
    }
}

void VulkanBackend::begin_frame(const Color& clear_color)
{
    clear_color_    = clear_color;
    has_data_       = false;
    frame_prepared_ = false;
}

bool VulkanBackend::update(const UniformBlock&            uniforms,
                           std::span<const PointInstance> points,
                           std::span<const LineVertex>    line_vertices)
{
    try
    {
        uniform_buffer_.upload(&uniforms, sizeof(UniformBlock));
        if (marker_buffer_.write(points.data(), points.size()))
        {
            LUMAPLOT_LOG_DEBUG("vulkan",
                               "Marker buffer grown to {} instances",
                               marker_buffer_.capacity());
        }
        if (line_buffer_.write(line_vertices.data(), line_vertices.size()))
        {
            LUMAPLOT_LOG_DEBUG("vulkan",
                               "Line buffer grown to {} vertices",
                               line_buffer_.capacity());
        }
    }
    catch (const std::runtime_error& e)
    {
        LUMAPLOT_LOG_ERROR("vulkan", "Frame upload failed: {}", e.what());
        has_data_ = false;
        return false;
    }

    uniforms_     = uniforms;
    marker_count_ = static_cast<uint32_t>(points.size());
    line_count_   = static_cast<uint32_t>(line_vertices.size());
    has_data_     = true;
    return true;
}

bool VulkanBackend::can_record() const
{
    if (!has_data_)
        return false;
    if (cmd_ == VK_NULL_HANDLE)
    {
        LUMAPLOT_LOG_WARN("vulkan", "No command buffer set; draw skipped");
        return false;
    }
    return true;
}

void VulkanBackend::prepare_frame_state()
{
    if (frame_prepared_)
        return;

    const float width  = uniforms_.viewport_size.x;
    const float height = uniforms_.viewport_size.y;

    VkViewport viewport = flipped_viewport(width, height);
    vkCmdSetViewport(cmd_, 0, 1, &viewport);

    VkRect2D scissor{};
    scissor.offset = {0, 0};
    scissor.extent = {static_cast<uint32_t>(std::lround(width)),
                      static_cast<uint32_t>(std::lround(height))};
    vkCmdSetScissor(cmd_, 0, 1, &scissor);

    VkClearAttachment clear{};
    clear.aspectMask      = VK_IMAGE_ASPECT_COLOR_BIT;
    clear.colorAttachment = 0;
    clear.clearValue.color = {{clear_color_.r, clear_color_.g, clear_color_.b, clear_color_.a}};

    VkClearRect clear_rect{};
    clear_rect.rect           = scissor;
    clear_rect.baseArrayLayer = 0;
    clear_rect.layerCount     = 1;
    vkCmdClearAttachments(cmd_, 1, &clear, 1, &clear_rect);

    frame_prepared_ = true;
}

void VulkanBackend::draw_lines(uint32_t vertex_count)
{
    if (!can_record())
        return;
    if (vertex_count > line_count_)
    {
        LUMAPLOT_LOG_WARN("vulkan",
                          "draw_lines({}) exceeds {} uploaded vertices; clamping",
                          vertex_count,
                          line_count_);
        vertex_count = line_count_;
    }
    if (vertex_count == 0)
        return;

    prepare_frame_state();

    VkBuffer     buffer = line_buffer_.buffer();
    VkDeviceSize offset = 0;
    vkCmdBindPipeline(cmd_, VK_PIPELINE_BIND_POINT_GRAPHICS, line_pipeline_);
    vkCmdBindDescriptorSets(cmd_,
                            VK_PIPELINE_BIND_POINT_GRAPHICS,
                            pipeline_layout_,
                            0,
                            1,
                            &desc_set_,
                            0,
                            nullptr);
    vkCmdBindVertexBuffers(cmd_, 0, 1, &buffer, &offset);
    vkCmdDraw(cmd_, vertex_count, 1, 0, 0);
}

void VulkanBackend::draw_markers(uint32_t instance_count)
{
    if (!can_record())
        return;
    if (instance_count > marker_count_)
    {
        LUMAPLOT_LOG_WARN("vulkan",
                          "draw_markers({}) exceeds {} uploaded instances; clamping",
                          instance_count,
                          marker_count_);
        instance_count = marker_count_;
    }
    if (instance_count == 0)
        return;

    prepare_frame_state();

    VkBuffer     buffer = marker_buffer_.buffer();
    VkDeviceSize offset = 0;
    vkCmdBindPipeline(cmd_, VK_PIPELINE_BIND_POINT_GRAPHICS, marker_pipeline_);
    vkCmdBindDescriptorSets(cmd_,
                            VK_PIPELINE_BIND_POINT_GRAPHICS,
                            pipeline_layout_,
                            0,
                            1,
                            &desc_set_,
                            0,
                            nullptr);
    vkCmdBindVertexBuffers(cmd_, 0, 1, &buffer, &offset);
    vkCmdDraw(cmd_, MARKER_QUAD_VERTEX_COUNT, instance_count, 0, 0);
}

void VulkanBackend::end_frame()
{
    // A frame with nothing to draw still clears
    if (can_record())
        prepare_frame_state();
    has_data_ = false;
}

}   // namespace lumaplot::vk
