// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include <vk_mem_alloc.h>
#include <vulkan/vulkan.h>

namespace trekanten {

class CommandPool;
class Device;
class Queue;

// VkBuffer with its VMA allocation
// Throws Memory unless the memory is host visible and [offset, offset + size) lies inside the buffer
void CheckHostWrite(VmaMemoryUsage memoryUsage, VkDeviceSize bufferSize, size_t size, VkDeviceSize offset);

class DeviceBuffer {
public:
    static DeviceBuffer Empty(std::shared_ptr<Device> device, VkDeviceSize size, VkBufferUsageFlags usage,
                              VmaMemoryUsage memoryUsage);
    static DeviceBuffer StagingEmpty(std::shared_ptr<Device> device, VkDeviceSize size);
    static DeviceBuffer StagingWithData(std::shared_ptr<Device> device, const std::vector<uint8_t>& data);

    /**
     * @brief Create a GPU-only buffer and fill it through a staging buffer
     *
     * Blocks until the copy has finished on the given queue.
     */
    static DeviceBuffer DeviceLocalByStaging(std::shared_ptr<Device> device, const Queue& queue,
                                             const CommandPool& pool, VkBufferUsageFlags usage,
                                             const std::vector<uint8_t>& data);

    ~DeviceBuffer();

    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;
    DeviceBuffer(DeviceBuffer&& other) noexcept;
    DeviceBuffer& operator=(DeviceBuffer&& other) noexcept;

    VkBuffer GetRaw() const { return raw_; }
    VkDeviceSize Size() const { return size_; }
    VmaMemoryUsage MemoryUsage() const { return memory_usage_; }

    // Throws Memory if the buffer is not host visible or the write does not fit
    void UpdateDataAt(const void* data, size_t size, VkDeviceSize offset);
    void UpdateDataAt(const std::vector<uint8_t>& data, VkDeviceSize offset) {
        UpdateDataAt(data.data(), data.size(), offset);
    }

private:
    DeviceBuffer(std::shared_ptr<Device> device, VkBuffer raw, VmaAllocation allocation, VkDeviceSize size,
                 VmaMemoryUsage memoryUsage);
    void Destroy();

    std::shared_ptr<Device> device_;
    VkBuffer raw_ = VK_NULL_HANDLE;
    VmaAllocation allocation_ = VK_NULL_HANDLE;
    VkDeviceSize size_ = 0;
    VmaMemoryUsage memory_usage_ = VMA_MEMORY_USAGE_UNKNOWN;
};

} // namespace trekanten
