// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/image.h"
#include "trekanten/backend/buffer.h"
#include "trekanten/backend/command.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/queue.h"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <utility>

namespace trekanten {

uint32_t MipLevelsFor(Extent2D extent) {
    const uint32_t largest = std::max(extent.width, extent.height);
    if (largest == 0) {
        return 1;
    }
    return static_cast<uint32_t>(std::floor(std::log2(static_cast<double>(largest)))) + 1;
}

Extent2D NextMipExtent(Extent2D extent) {
    return Extent2D(std::max(extent.width / 2, 1u), std::max(extent.height / 2, 1u));
}

TransitionMasks TransitionMasksFor(VkImageLayout oldLayout, VkImageLayout newLayout) {
    if (oldLayout == VK_IMAGE_LAYOUT_UNDEFINED && newLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL) {
        return TransitionMasks{0, VK_ACCESS_TRANSFER_WRITE_BIT, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT,
                               VK_PIPELINE_STAGE_TRANSFER_BIT};
    }

    if (oldLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL && newLayout == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL) {
        return TransitionMasks{VK_ACCESS_TRANSFER_WRITE_BIT, VK_ACCESS_SHADER_READ_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT,
                               VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT};
    }

    throw RenderError(ErrorKind::Memory, fmt::format("Unsupported layout transition {} -> {}",
                                                     static_cast<int>(oldLayout), static_cast<int>(newLayout)));
}

VkImageMemoryBarrier ImageBarrier(VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout,
                                  uint32_t baseMipLevel, uint32_t levelCount) {
    VkImageMemoryBarrier barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    barrier.oldLayout = oldLayout;
    barrier.newLayout = newLayout;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    barrier.subresourceRange.baseMipLevel = baseMipLevel;
    barrier.subresourceRange.levelCount = levelCount;
    barrier.subresourceRange.baseArrayLayer = 0;
    barrier.subresourceRange.layerCount = 1;
    return barrier;
}

void TransitionImageLayout(CommandBuffer& cmd, VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout,
                           uint32_t mipLevels) {
    const TransitionMasks masks = TransitionMasksFor(oldLayout, newLayout);

    VkImageMemoryBarrier barrier = ImageBarrier(image, oldLayout, newLayout, 0, mipLevels);
    barrier.srcAccessMask = masks.src_access;
    barrier.dstAccessMask = masks.dst_access;

    cmd.PipelineBarrier(barrier, masks.src_stage, masks.dst_stage);
}

namespace {

VkOffset3D CornerOf(Extent2D extent) {
    return VkOffset3D{static_cast<int32_t>(extent.width), static_cast<int32_t>(extent.height), 1};
}

// Expects every level in TRANSFER_DST_OPTIMAL; leaves every level in SHADER_READ_ONLY_OPTIMAL
void GenerateMipmaps(CommandBuffer& cmd, VkImage image, Extent2D extent, uint32_t mipLevels) {
    Extent2D mipExtent = extent;

    for (uint32_t level = 1; level < mipLevels; ++level) {
        const uint32_t src = level - 1;

        VkImageMemoryBarrier toSrc =
            ImageBarrier(image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, src, 1);
        toSrc.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
        toSrc.dstAccessMask = VK_ACCESS_TRANSFER_READ_BIT;
        cmd.PipelineBarrier(toSrc, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT);

        const Extent2D nextExtent = NextMipExtent(mipExtent);

        VkImageBlit blit{};
        blit.srcOffsets[0] = {0, 0, 0};
        blit.srcOffsets[1] = CornerOf(mipExtent);
        blit.srcSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        blit.srcSubresource.mipLevel = src;
        blit.srcSubresource.baseArrayLayer = 0;
        blit.srcSubresource.layerCount = 1;
        blit.dstOffsets[0] = {0, 0, 0};
        blit.dstOffsets[1] = CornerOf(nextExtent);
        blit.dstSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        blit.dstSubresource.mipLevel = level;
        blit.dstSubresource.baseArrayLayer = 0;
        blit.dstSubresource.layerCount = 1;
        cmd.BlitImage(image, image, blit);

        VkImageMemoryBarrier toRead =
            ImageBarrier(image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, src, 1);
        toRead.srcAccessMask = VK_ACCESS_TRANSFER_READ_BIT;
        toRead.dstAccessMask = VK_ACCESS_SHADER_READ_BIT;
        cmd.PipelineBarrier(toRead, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT);

        mipExtent = nextExtent;
    }

    // The last level was only ever written to
    VkImageMemoryBarrier last = ImageBarrier(image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                                             VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, mipLevels - 1, 1);
    last.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
    last.dstAccessMask = VK_ACCESS_SHADER_READ_BIT;
    cmd.PipelineBarrier(last, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT);
}

} // namespace

DeviceImage::DeviceImage(std::shared_ptr<Device> device, VkImage raw, VmaAllocation allocation, Extent2D extent,
                         VkFormat format, uint32_t mipLevels)
    : device_(std::move(device)),
      raw_(raw),
      allocation_(allocation),
      extent_(extent),
      format_(format),
      mip_levels_(mipLevels) {}

DeviceImage DeviceImage::Empty2D(std::shared_ptr<Device> device, Extent2D extent, VkFormat format,
                                 VkImageUsageFlags usage, VmaMemoryUsage memoryUsage, uint32_t mipLevels,
                                 VkSampleCountFlagBits samples) {
    VkImageCreateInfo imageInfo{};
    imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageInfo.imageType = VK_IMAGE_TYPE_2D;
    imageInfo.extent = Extent3D::From2D(extent, 1);
    imageInfo.mipLevels = mipLevels;
    imageInfo.arrayLayers = 1;
    imageInfo.format = format;
    imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
    imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    imageInfo.usage = usage;
    imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    imageInfo.samples = samples;

    VmaAllocationCreateInfo allocInfo{};
    allocInfo.usage = memoryUsage;

    VkImage raw = VK_NULL_HANDLE;
    VmaAllocation allocation = VK_NULL_HANDLE;
    CheckVk(vmaCreateImage(device->GetAllocator(), &imageInfo, &allocInfo, &raw, &allocation, nullptr),
            ErrorKind::Memory, "vmaCreateImage");

    return DeviceImage(std::move(device), raw, allocation, extent, format, mipLevels);
}

DeviceImage DeviceImage::DeviceLocalMipmapped(std::shared_ptr<Device> device, const Queue& queue,
                                              const CommandPool& pool, Extent2D extent, VkFormat format,
                                              uint32_t mipLevels, const std::vector<uint8_t>& data) {
    DeviceBuffer staging = DeviceBuffer::StagingWithData(device, data);

    const VkImageUsageFlags usage =
        VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_SAMPLED_BIT;
    DeviceImage image = Empty2D(std::move(device), extent, format, usage, VMA_MEMORY_USAGE_GPU_ONLY, mipLevels,
                                VK_SAMPLE_COUNT_1_BIT);

    CommandBuffer cmd = pool.BeginSingleSubmit();
    TransitionImageLayout(cmd, image.GetRaw(), VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                          mipLevels);
    cmd.CopyBufferToImage(staging, image, extent.width, extent.height);
    GenerateMipmaps(cmd, image.GetRaw(), extent, mipLevels);
    cmd.End();

    queue.SubmitAndWait(cmd);
    return image;
}

DeviceImage::~DeviceImage() {
    Destroy();
}

void DeviceImage::Destroy() {
    if (raw_ != VK_NULL_HANDLE) {
        vmaDestroyImage(device_->GetAllocator(), raw_, allocation_);
        raw_ = VK_NULL_HANDLE;
        allocation_ = VK_NULL_HANDLE;
    }
}

DeviceImage::DeviceImage(DeviceImage&& other) noexcept
    : device_(std::move(other.device_)),
      raw_(std::exchange(other.raw_, VK_NULL_HANDLE)),
      allocation_(std::exchange(other.allocation_, VK_NULL_HANDLE)),
      extent_(other.extent_),
      format_(other.format_),
      mip_levels_(other.mip_levels_) {}

DeviceImage& DeviceImage::operator=(DeviceImage&& other) noexcept {
    if (this != &other) {
        Destroy();
        device_ = std::move(other.device_);
        raw_ = std::exchange(other.raw_, VK_NULL_HANDLE);
        allocation_ = std::exchange(other.allocation_, VK_NULL_HANDLE);
        extent_ = other.extent_;
        format_ = other.format_;
        mip_levels_ = other.mip_levels_;
    }
    return *this;
}

} // namespace trekanten
