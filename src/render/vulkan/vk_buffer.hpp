#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vulkan/vulkan.h>

namespace lumaplot::vk
{

class GpuBuffer
{
   public:
    GpuBuffer() = default;
    ~GpuBuffer();

    GpuBuffer(const GpuBuffer&)            = delete;
    GpuBuffer& operator=(const GpuBuffer&) = delete;
    GpuBuffer(GpuBuffer&& other) noexcept;
    GpuBuffer& operator=(GpuBuffer&& other) noexcept;

    static GpuBuffer create(VkDevice              device,
                            VkPhysicalDevice      physical_device,
                            VkDeviceSize          size,
                            VkBufferUsageFlags    usage,
                            VkMemoryPropertyFlags memory_properties);

    void upload(const void* data, VkDeviceSize size, VkDeviceSize offset = 0);
    void destroy();

    VkBuffer     buffer() const { return buffer_; }
    VkDeviceSize size() const { return size_; }
    bool         valid() const { return buffer_ != VK_NULL_HANDLE; }
    void*        mapped_data() const { return mapped_; }

   private:
    VkDevice       device_ = VK_NULL_HANDLE;
    VkBuffer       buffer_ = VK_NULL_HANDLE;
    VkDeviceMemory memory_ = VK_NULL_HANDLE;
    VkDeviceSize   size_   = 0;
    void*          mapped_ = nullptr;
};

// Host-visible, host-coherent array buffer that reallocates when a write
// needs more room. Capacity is counted in elements.
class GrowableBuffer
{
   public:
    static constexpr size_t INITIAL_CAPACITY = 1024;

    // Capacity after a request for `required` elements: unchanged if it
    // fits, else max(current * 3/2, required).
    static constexpr size_t grown_capacity(size_t current, size_t required)
    {
        if (required <= current)
            return current;
        return std::max(current * 3 / 2, required);
    }

    GrowableBuffer() = default;

    void init(VkDevice           device,
              VkPhysicalDevice   physical_device,
              VkDeviceSize       element_size,
              VkBufferUsageFlags usage);
    void destroy();

    // Copies `count` elements to the start of the buffer, growing first if
    // needed. Returns true when the underlying VkBuffer was replaced.
    bool write(const void* data, size_t count);

    VkBuffer buffer() const { return buffer_.buffer(); }
    size_t   capacity() const { return capacity_; }

   private:
    void allocate(size_t capacity);

    VkDevice           device_          = VK_NULL_HANDLE;
    VkPhysicalDevice   physical_device_ = VK_NULL_HANDLE;
    VkDeviceSize       element_size_    = 0;
    VkBufferUsageFlags usage_           = 0;
    size_t             capacity_        = 0;
    GpuBuffer          buffer_;
};

}   // namespace lumaplot::vk
