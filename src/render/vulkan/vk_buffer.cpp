#include "vk_buffer.hpp"

#include <cstring>
#include <stdexcept>
#include <utility>

namespace lumaplot::vk
{

static uint32_t find_memory_type(VkPhysicalDevice      physical_device,
                                 uint32_t              type_filter,
                                 VkMemoryPropertyFlags properties)
{
    VkPhysicalDeviceMemoryProperties mem_props;
    vkGetPhysicalDeviceMemoryProperties(physical_device, &mem_props);

    for (uint32_t i = 0; i < mem_props.memoryTypeCount; ++i)
    {
        if ((type_filter & (1u << i))
            && (mem_props.memoryTypes[i].propertyFlags & properties) == properties)
        {
            return i;
        }
    }
    throw std::runtime_error("Failed to find suitable memory type");
}

// ─── GpuBuffer ───────────────────────────────────────────────────────────────

GpuBuffer::~GpuBuffer()
{
    destroy();
}

GpuBuffer::GpuBuffer(GpuBuffer&& other) noexcept
    : device_(other.device_),
      buffer_(other.buffer_),
      memory_(other.memory_),
      size_(other.size_),
      mapped_(other.mapped_)
{
    other.device_ = VK_NULL_HANDLE;
    other.buffer_ = VK_NULL_HANDLE;
    other.memory_ = VK_NULL_HANDLE;
    other.size_   = 0;
    other.mapped_ = nullptr;
}

GpuBuffer& GpuBuffer::operator=(GpuBuffer&& other) noexcept
{
    if (this != &other)
    {
        destroy();
        device_ = std::exchange(other.device_, VK_NULL_HANDLE);
        buffer_ = std::exchange(other.buffer_, VK_NULL_HANDLE);
        memory_ = std::exchange(other.memory_, VK_NULL_HANDLE);
        size_   = std::exchange(other.size_, 0);
        mapped_ = std::exchange(other.mapped_, nullptr);
    }
    return *this;
}

GpuBuffer GpuBuffer::create(VkDevice              device,
                            VkPhysicalDevice      physical_device,
                            VkDeviceSize          size,
                            VkBufferUsageFlags    usage,
                            VkMemoryPropertyFlags memory_properties)
{
    GpuBuffer buf;
    buf.device_ = device;
    buf.size_   = size;

    VkBufferCreateInfo buffer_info{};
    buffer_info.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    buffer_info.size        = size;
    buffer_info.usage       = usage;
    buffer_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    if (vkCreateBuffer(device, &buffer_info, nullptr, &buf.buffer_) != VK_SUCCESS)
    {
        throw std::runtime_error("Failed to create buffer");
    }

    VkMemoryRequirements mem_reqs;
    vkGetBufferMemoryRequirements(device, buf.buffer_, &mem_reqs);

    VkMemoryAllocateInfo alloc_info{};
    alloc_info.sType          = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    alloc_info.allocationSize = mem_reqs.size;
    alloc_info.memoryTypeIndex =
        find_memory_type(physical_device, mem_reqs.memoryTypeBits, memory_properties);

    // `buf` owns the VkBuffer from here on; a throw releases it
    if (vkAllocateMemory(device, &alloc_info, nullptr, &buf.memory_) != VK_SUCCESS)
    {
        throw std::runtime_error("Failed to allocate buffer memory");
    }

    if (vkBindBufferMemory(device, buf.buffer_, buf.memory_, 0) != VK_SUCCESS)
    {
        throw std::runtime_error("Failed to bind buffer memory");
    }

    // Persistently map host-visible buffers
    if (memory_properties & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT)
    {
        if (vkMapMemory(device, buf.memory_, 0, size, 0, &buf.mapped_) != VK_SUCCESS)
        {
            throw std::runtime_error("Failed to map buffer memory");
        }
    }

    return buf;
}

void GpuBuffer::upload(const void* data, VkDeviceSize size, VkDeviceSize offset)
{
    if (!mapped_)
    {
        throw std::runtime_error("Cannot upload to non-mapped buffer");
    }
    if (offset + size > size_)
    {
        throw std::runtime_error("Buffer upload out of range");
    }
    std::memcpy(static_cast<char*>(mapped_) + offset, data, size);
}

void GpuBuffer::destroy()
{
    if (device_ == VK_NULL_HANDLE)
        return;

    if (mapped_)
    {
        vkUnmapMemory(device_, memory_);
        mapped_ = nullptr;
    }
    if (buffer_ != VK_NULL_HANDLE)
    {
        vkDestroyBuffer(device_, buffer_, nullptr);
        buffer_ = VK_NULL_HANDLE;
    }
    if (memory_ != VK_NULL_HANDLE)
    {
        vkFreeMemory(device_, memory_, nullptr);
        memory_ = VK_NULL_HANDLE;
    }
    size_ = 0;
}

// ─── GrowableBuffer ──────────────────────────────────────────────────────────

void GrowableBuffer::init(VkDevice           device,
                          VkPhysicalDevice   physical_device,
                          VkDeviceSize       element_size,
                          VkBufferUsageFlags usage)
{
    device_          = device;
    physical_device_ = physical_device;
    element_size_    = element_size;
    usage_           = usage;
    allocate(INITIAL_CAPACITY);
}

void GrowableBuffer::destroy()
{
    buffer_.destroy();
    capacity_ = 0;
}

bool GrowableBuffer::write(const void* data, size_t count)
{
    bool replaced = false;
    if (count > capacity_)
    {
        allocate(grown_capacity(capacity_, count));
        replaced = true;
    }
    if (count > 0)
        buffer_.upload(data, count * element_size_);
    return replaced;
}

void GrowableBuffer::allocate(size_t capacity)
{
    buffer_   = GpuBuffer::create(device_,
                                physical_device_,
                                capacity * element_size_,
                                usage_,
                                VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT
                                    | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);
    capacity_ = capacity;
}

}   // namespace lumaplot::vk
