#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <vulkan/vulkan.h>

namespace lumaplot::vk
{

struct PipelineConfig
{
    VkRenderPass                                   render_pass     = VK_NULL_HANDLE;
    VkPipelineLayout                               pipeline_layout = VK_NULL_HANDLE;
    const uint8_t*                                 vert_spirv      = nullptr;
    size_t                                         vert_spirv_size = 0;
    const uint8_t*                                 frag_spirv      = nullptr;
    size_t                                         frag_spirv_size = 0;
    VkPrimitiveTopology                            topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    bool                                           enable_blending = true;
    std::vector<VkVertexInputBindingDescription>   vertex_bindings;
    std::vector<VkVertexInputAttributeDescription> vertex_attributes;
};

VkShaderModule create_shader_module(VkDevice device, const uint8_t* spirv, size_t size);

// Triangle pipeline with dynamic viewport and scissor, no depth, no culling.
// Blending is straight-alpha over:
//   color = src*src.a + dst*(1-src.a),  alpha = src.a + dst.a*(1-src.a)
VkPipeline create_graphics_pipeline(VkDevice device, const PipelineConfig& config);

// Set 0: the UniformBlock at binding 0, visible to vertex and fragment stages.
VkDescriptorSetLayout create_uniform_descriptor_layout(VkDevice device);

VkPipelineLayout create_pipeline_layout(VkDevice                                  device,
                                        const std::vector<VkDescriptorSetLayout>& set_layouts);

// ─── Vertex input ────────────────────────────────────────────────────────────
// Marker pipeline: one PointInstance per instance at binding 0.
// Line pipeline: one LineVertex per vertex at binding 0.

std::vector<VkVertexInputBindingDescription>   marker_vertex_bindings();
std::vector<VkVertexInputAttributeDescription> marker_vertex_attributes();
std::vector<VkVertexInputBindingDescription>   line_vertex_bindings();
std::vector<VkVertexInputAttributeDescription> line_vertex_attributes();

// Full-target viewport with negative height, so that NDC +Y maps to the
// top row as the stage functions assume (VK_KHR_maintenance1, core in 1.1).
VkViewport flipped_viewport(float width, float height);

}   // namespace lumaplot::vk
