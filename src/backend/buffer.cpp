// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/buffer.h"
#include "trekanten/backend/allocator.h"
#include "trekanten/backend/command.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/queue.h"

#include <cstring>
#include <fmt/format.h>
#include <utility>

namespace trekanten {

DeviceBuffer::DeviceBuffer(std::shared_ptr<Device> device, VkBuffer raw, VmaAllocation allocation, VkDeviceSize size,
                           VmaMemoryUsage memoryUsage)
    : device_(std::move(device)), raw_(raw), allocation_(allocation), size_(size), memory_usage_(memoryUsage) {}

DeviceBuffer DeviceBuffer::Empty(std::shared_ptr<Device> device, VkDeviceSize size, VkBufferUsageFlags usage,
                                 VmaMemoryUsage memoryUsage) {
    VkBufferCreateInfo bufferInfo{};
    bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferInfo.size = size;
    bufferInfo.usage = usage;
    bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VmaAllocationCreateInfo allocInfo{};
    allocInfo.usage = memoryUsage;

    VkBuffer raw = VK_NULL_HANDLE;
    VmaAllocation allocation = VK_NULL_HANDLE;
    CheckVk(vmaCreateBuffer(device->GetAllocator(), &bufferInfo, &allocInfo, &raw, &allocation, nullptr),
            ErrorKind::Memory, "vmaCreateBuffer");

    return DeviceBuffer(std::move(device), raw, allocation, size, memoryUsage);
}

DeviceBuffer DeviceBuffer::StagingEmpty(std::shared_ptr<Device> device, VkDeviceSize size) {
    return Empty(std::move(device), size, VK_BUFFER_USAGE_TRANSFER_SRC_BIT, VMA_MEMORY_USAGE_CPU_ONLY);
}

DeviceBuffer DeviceBuffer::StagingWithData(std::shared_ptr<Device> device, const std::vector<uint8_t>& data) {
    DeviceBuffer staging = StagingEmpty(std::move(device), data.size());
    staging.UpdateDataAt(data, 0);
    return staging;
}

DeviceBuffer DeviceBuffer::DeviceLocalByStaging(std::shared_ptr<Device> device, const Queue& queue,
                                                const CommandPool& pool, VkBufferUsageFlags usage,
                                                const std::vector<uint8_t>& data) {
    DeviceBuffer staging = StagingWithData(device, data);
    DeviceBuffer dst = Empty(std::move(device), data.size(), usage | VK_BUFFER_USAGE_TRANSFER_DST_BIT,
                             VMA_MEMORY_USAGE_GPU_ONLY);

    CommandBuffer cmd = pool.BeginSingleSubmit();
    cmd.CopyBuffer(staging, dst, data.size()).End();
    queue.SubmitAndWait(cmd);

    return dst;
}

DeviceBuffer::~DeviceBuffer() {
    Destroy();
}

void DeviceBuffer::Destroy() {
    if (raw_ != VK_NULL_HANDLE) {
        vmaDestroyBuffer(device_->GetAllocator(), raw_, allocation_);
        raw_ = VK_NULL_HANDLE;
        allocation_ = VK_NULL_HANDLE;
    }
}

DeviceBuffer::DeviceBuffer(DeviceBuffer&& other) noexcept
    : device_(std::move(other.device_)),
      raw_(std::exchange(other.raw_, VK_NULL_HANDLE)),
      allocation_(std::exchange(other.allocation_, VK_NULL_HANDLE)),
      size_(other.size_),
      memory_usage_(other.memory_usage_) {}

DeviceBuffer& DeviceBuffer::operator=(DeviceBuffer&& other) noexcept {
    if (this != &other) {
        Destroy();
        device_ = std::move(other.device_);
        raw_ = std::exchange(other.raw_, VK_NULL_HANDLE);
        allocation_ = std::exchange(other.allocation_, VK_NULL_HANDLE);
        size_ = other.size_;
        memory_usage_ = other.memory_usage_;
    }
    return *this;
}

void CheckHostWrite(VmaMemoryUsage memoryUsage, VkDeviceSize bufferSize, size_t size, VkDeviceSize offset) {
    if (!IsHostVisible(memoryUsage)) {
        throw RenderError(ErrorKind::Memory, "Buffer memory is not host visible");
    }

    if (offset > bufferSize || size > bufferSize - offset) {
        throw RenderError(ErrorKind::Memory, fmt::format("Write of {} bytes at offset {} exceeds buffer size {}", size,
                                                         offset, bufferSize));
    }
}

void DeviceBuffer::UpdateDataAt(const void* data, size_t size, VkDeviceSize offset) {
    CheckHostWrite(memory_usage_, size_, size, offset);

    void* mapped = nullptr;
    CheckVk(vmaMapMemory(device_->GetAllocator(), allocation_, &mapped), ErrorKind::Memory, "vmaMapMemory");
    std::memcpy(static_cast<uint8_t*>(mapped) + offset, data, size);
    vmaUnmapMemory(device_->GetAllocator(), allocation_);
}

} // namespace trekanten
