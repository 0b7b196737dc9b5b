#pragma once

#include <cstdint>
#include <vector>

#include <vk_mem_alloc.h>
#include <vulkan/vulkan.h>

namespace bimview::render::vulkan {

// Opaque buffer handle so device code can refer to buffers without holding VMA allocations.
using BufferHandle = std::uint32_t;
constexpr BufferHandle kInvalidBufferHandle = 0;

enum class BufferAccess : std::uint8_t {
    // Device-local; written by the GPU or through a staging copy.
    DeviceOnly = 0,
    // Host-visible, persistently mapped, written by the CPU every frame.
    HostWrite,
    // Host-visible, persistently mapped, read back by the CPU.
    HostRead
};

struct BufferCreateDesc {
    VkDeviceSize size = 0;
    VkBufferUsageFlags usage = 0;
    BufferAccess access = BufferAccess::DeviceOnly;
    const void* initialData = nullptr;
    const char* debugName = nullptr;
};

// Owns VkBuffer + VmaAllocation pairs behind uint32 handles.
class BufferAllocator {
public:
    bool init(VkDevice device, VmaAllocator allocator);
    void shutdown();

    [[nodiscard]] BufferHandle createBuffer(const BufferCreateDesc& desc);
    void destroyBuffer(BufferHandle handle);

    [[nodiscard]] VkBuffer getBuffer(BufferHandle handle) const;
    [[nodiscard]] VkDeviceSize getSize(BufferHandle handle) const;
    // nullptr for device-only buffers.
    [[nodiscard]] void* mappedData(BufferHandle handle) const;
    [[nodiscard]] std::uint32_t liveBufferCount() const;

private:
    struct BufferSlot {
        VkBuffer buffer = VK_NULL_HANDLE;
        VmaAllocation allocation = VK_NULL_HANDLE;
        void* mapped = nullptr;
        VkDeviceSize size = 0;
        bool inUse = false;
    };

    [[nodiscard]] BufferSlot* getSlot(BufferHandle handle);
    [[nodiscard]] const BufferSlot* getSlot(BufferHandle handle) const;

    VkDevice m_device = VK_NULL_HANDLE;
    VmaAllocator m_allocator = VK_NULL_HANDLE;
    std::vector<BufferSlot> m_slots;
    std::vector<std::uint32_t> m_freeSlots;
};

} // namespace bimview::render::vulkan
