// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/util.h"

#include <cstdint>
#include <memory>
#include <vector>
#include <vk_mem_alloc.h>
#include <vulkan/vulkan.h>

namespace trekanten {

class CommandBuffer;
class CommandPool;
class Device;
class Queue;

// floor(log2(max(width, height))) + 1
uint32_t MipLevelsFor(Extent2D extent);

// Halves both dimensions, never going below 1
Extent2D NextMipExtent(Extent2D extent);

struct TransitionMasks {
    VkAccessFlags src_access = 0;
    VkAccessFlags dst_access = 0;
    VkPipelineStageFlags src_stage = 0;
    VkPipelineStageFlags dst_stage = 0;
};

// Throws Memory for layout pairs without a known transition
TransitionMasks TransitionMasksFor(VkImageLayout oldLayout, VkImageLayout newLayout);

VkImageMemoryBarrier ImageBarrier(VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout,
                                  uint32_t baseMipLevel, uint32_t levelCount);

void TransitionImageLayout(CommandBuffer& cmd, VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout,
                           uint32_t mipLevels);

// VkImage with its VMA allocation
class DeviceImage {
public:
    static DeviceImage Empty2D(std::shared_ptr<Device> device, Extent2D extent, VkFormat format,
                               VkImageUsageFlags usage, VmaMemoryUsage memoryUsage, uint32_t mipLevels,
                               VkSampleCountFlagBits samples);

    /**
     * @brief Upload pixel data and generate a full mip chain
     *
     * Every level ends up in SHADER_READ_ONLY_OPTIMAL. Blocks until the
     * upload has finished.
     */
    static DeviceImage DeviceLocalMipmapped(std::shared_ptr<Device> device, const Queue& queue,
                                            const CommandPool& pool, Extent2D extent, VkFormat format,
                                            uint32_t mipLevels, const std::vector<uint8_t>& data);

    ~DeviceImage();

    DeviceImage(const DeviceImage&) = delete;
    DeviceImage& operator=(const DeviceImage&) = delete;
    DeviceImage(DeviceImage&& other) noexcept;
    DeviceImage& operator=(DeviceImage&& other) noexcept;

    VkImage GetRaw() const { return raw_; }
    Extent2D GetExtent() const { return extent_; }
    VkFormat GetFormat() const { return format_; }
    uint32_t MipLevels() const { return mip_levels_; }

private:
    DeviceImage(std::shared_ptr<Device> device, VkImage raw, VmaAllocation allocation, Extent2D extent,
                VkFormat format, uint32_t mipLevels);
    void Destroy();

    std::shared_ptr<Device> device_;
    VkImage raw_ = VK_NULL_HANDLE;
    VmaAllocation allocation_ = VK_NULL_HANDLE;
    Extent2D extent_;
    VkFormat format_ = VK_FORMAT_UNDEFINED;
    uint32_t mip_levels_ = 1;
};

} // namespace trekanten
