// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/image.h"
#include "trekanten/backend/image_view.h"
#include "trekanten/backend/util.h"

#include <memory>
#include <vulkan/vulkan.h>

namespace trekanten {

class Device;

// Transient color target, e.g. for multisampling
class ColorBuffer {
public:
    ColorBuffer(std::shared_ptr<Device> device, Extent2D extent, VkFormat format, VkSampleCountFlagBits samples);

    const DeviceImage& GetImage() const { return image_; }
    const ImageView& GetImageView() const { return view_; }

private:
    DeviceImage image_;
    ImageView view_;
};

// Uses the depth format the device picked at creation
class DepthBuffer {
public:
    DepthBuffer(std::shared_ptr<Device> device, Extent2D extent);

    VkFormat GetFormat() const { return image_.GetFormat(); }
    const DeviceImage& GetImage() const { return image_; }
    const ImageView& GetImageView() const { return view_; }

private:
    DeviceImage image_;
    ImageView view_;
};

} // namespace trekanten
