// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/attachment.h"
#include "trekanten/backend/device.h"

namespace trekanten {

ColorBuffer::ColorBuffer(std::shared_ptr<Device> device, Extent2D extent, VkFormat format,
                         VkSampleCountFlagBits samples)
    : image_(DeviceImage::Empty2D(device, extent, format,
                                  VK_IMAGE_USAGE_TRANSIENT_ATTACHMENT_BIT | VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT,
                                  VMA_MEMORY_USAGE_GPU_ONLY, 1, samples)),
      view_(device, image_.GetRaw(), format, VK_IMAGE_ASPECT_COLOR_BIT, 1) {}

DepthBuffer::DepthBuffer(std::shared_ptr<Device> device, Extent2D extent)
    : image_(DeviceImage::Empty2D(device, extent, device->DepthFormat(),
                                  VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT, VMA_MEMORY_USAGE_GPU_ONLY, 1,
                                  VK_SAMPLE_COUNT_1_BIT)),
      view_(device, image_.GetRaw(), image_.GetFormat(), VK_IMAGE_ASPECT_DEPTH_BIT, 1) {}

} // namespace trekanten
