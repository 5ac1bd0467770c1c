// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <vulkan/vulkan.h>

namespace trekanten {

class Device;

// 2D view with identity swizzle over the first array layer
class ImageView {
public:
    ImageView(std::shared_ptr<Device> device, VkImage image, VkFormat format, VkImageAspectFlags aspect,
              uint32_t mipLevels);
    ~ImageView();

    ImageView(const ImageView&) = delete;
    ImageView& operator=(const ImageView&) = delete;
    ImageView(ImageView&& other) noexcept;
    ImageView& operator=(ImageView&& other) noexcept;

    VkImageView GetRaw() const { return raw_; }

private:
    void Destroy();

    std::shared_ptr<Device> device_;
    VkImageView raw_ = VK_NULL_HANDLE;
};

} // namespace trekanten
