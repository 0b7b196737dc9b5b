#include "render/backend/vulkan/buffer_allocator.h"

#include "core/log.h"

#include <cstring>

namespace bimview::render::vulkan {

namespace {

void setDebugObjectName(VkDevice device, VkBuffer buffer, const char* name) {
    if (device == VK_NULL_HANDLE || buffer == VK_NULL_HANDLE || name == nullptr) {
        return;
    }
    const auto setObjectName = reinterpret_cast<PFN_vkSetDebugUtilsObjectNameEXT>(
        vkGetDeviceProcAddr(device, "vkSetDebugUtilsObjectNameEXT"));
    if (setObjectName == nullptr) {
        return;
    }
    VkDebugUtilsObjectNameInfoEXT nameInfo{};
    nameInfo.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT;
    nameInfo.objectType = VK_OBJECT_TYPE_BUFFER;
    nameInfo.objectHandle = reinterpret_cast<std::uint64_t>(buffer);
    nameInfo.pObjectName = name;
    if (setObjectName(device, &nameInfo) != VK_SUCCESS) {
        BIM_LOGW("vulkan") << "debug name set failed: " << name;
    }
}

} // namespace

bool BufferAllocator::init(VkDevice device, VmaAllocator allocator) {
    m_device = device;
    m_allocator = allocator;
    m_slots.clear();
    m_freeSlots.clear();

    // Reserve slot 0 as an always-invalid sentinel.
    m_slots.push_back({});
    return m_device != VK_NULL_HANDLE && m_allocator != VK_NULL_HANDLE;
}

void BufferAllocator::shutdown() {
    if (m_allocator != VK_NULL_HANDLE) {
        for (std::size_t i = 1; i < m_slots.size(); ++i) {
            if (m_slots[i].inUse) {
                vmaDestroyBuffer(m_allocator, m_slots[i].buffer, m_slots[i].allocation);
                m_slots[i] = {};
            }
        }
    }
    m_slots.clear();
    m_freeSlots.clear();
    m_device = VK_NULL_HANDLE;
    m_allocator = VK_NULL_HANDLE;
}

BufferHandle BufferAllocator::createBuffer(const BufferCreateDesc& desc) {
    if (m_allocator == VK_NULL_HANDLE || desc.size == 0) {
        return kInvalidBufferHandle;
    }

    VkBufferCreateInfo bufferCreateInfo{};
    bufferCreateInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferCreateInfo.size = desc.size;
    bufferCreateInfo.usage = desc.usage;
    bufferCreateInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VmaAllocationCreateInfo allocationCreateInfo{};
    switch (desc.access) {
    case BufferAccess::HostWrite:
        allocationCreateInfo.usage = VMA_MEMORY_USAGE_AUTO;
        allocationCreateInfo.flags =
            VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
        allocationCreateInfo.requiredFlags = VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
        break;
    case BufferAccess::HostRead:
        allocationCreateInfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_HOST;
        allocationCreateInfo.flags =
            VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
        allocationCreateInfo.requiredFlags = VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
        break;
    case BufferAccess::DeviceOnly:
    default:
        allocationCreateInfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
        break;
    }

    BufferSlot slot;
    VmaAllocationInfo allocationInfo{};
    if (vmaCreateBuffer(m_allocator, &bufferCreateInfo, &allocationCreateInfo, &slot.buffer, &slot.allocation, &allocationInfo) != VK_SUCCESS) {
        BIM_LOGE("vulkan") << "buffer allocation failed: size=" << static_cast<unsigned long long>(desc.size)
                           << (desc.debugName != nullptr ? ", name=" : "") << (desc.debugName != nullptr ? desc.debugName : "");
        return kInvalidBufferHandle;
    }
    slot.mapped = allocationInfo.pMappedData;
    slot.size = desc.size;
    slot.inUse = true;
    setDebugObjectName(m_device, slot.buffer, desc.debugName);

    BIM_LOGD("vulkan") << "alloc buffer: size=" << static_cast<unsigned long long>(desc.size)
                       << ", usage=0x" << std::hex << static_cast<unsigned int>(desc.usage) << std::dec
                       << ", mapped=" << (slot.mapped != nullptr ? "yes" : "no");

    if (desc.initialData != nullptr) {
        if (slot.mapped == nullptr) {
            BIM_LOGE("vulkan") << "initial data given for a device-only buffer";
            vmaDestroyBuffer(m_allocator, slot.buffer, slot.allocation);
            return kInvalidBufferHandle;
        }
        std::memcpy(slot.mapped, desc.initialData, static_cast<std::size_t>(desc.size));
    }

    std::uint32_t slotIndex = 0;
    if (!m_freeSlots.empty()) {
        slotIndex = m_freeSlots.back();
        m_freeSlots.pop_back();
        m_slots[slotIndex] = slot;
    } else {
        slotIndex = static_cast<std::uint32_t>(m_slots.size());
        m_slots.push_back(slot);
    }
    return slotIndex;
}

void BufferAllocator::destroyBuffer(BufferHandle handle) {
    BufferSlot* slot = getSlot(handle);
    if (slot == nullptr) {
        return;
    }
    vmaDestroyBuffer(m_allocator, slot->buffer, slot->allocation);
    *slot = {};
    m_freeSlots.push_back(handle);
}

VkBuffer BufferAllocator::getBuffer(BufferHandle handle) const {
    const BufferSlot* slot = getSlot(handle);
    return (slot != nullptr) ? slot->buffer : VK_NULL_HANDLE;
}

VkDeviceSize BufferAllocator::getSize(BufferHandle handle) const {
    const BufferSlot* slot = getSlot(handle);
    return (slot != nullptr) ? slot->size : 0;
}

void* BufferAllocator::mappedData(BufferHandle handle) const {
    const BufferSlot* slot = getSlot(handle);
    return (slot != nullptr) ? slot->mapped : nullptr;
}

std::uint32_t BufferAllocator::liveBufferCount() const {
    return static_cast<std::uint32_t>(m_slots.empty() ? 0 : m_slots.size() - 1 - m_freeSlots.size());
}

BufferAllocator::BufferSlot* BufferAllocator::getSlot(BufferHandle handle) {
    if (handle == kInvalidBufferHandle || handle >= m_slots.size() || !m_slots[handle].inUse) {
        return nullptr;
    }
    return &m_slots[handle];
}

const BufferAllocator::BufferSlot* BufferAllocator::getSlot(BufferHandle handle) const {
    if (handle == kInvalidBufferHandle || handle >= m_slots.size() || !m_slots[handle].inUse) {
        return nullptr;
    }
    return &m_slots[handle];
}

} // namespace bimview::render::vulkan
