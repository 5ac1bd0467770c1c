// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/image_view.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"

#include <utility>

namespace trekanten {

ImageView::ImageView(std::shared_ptr<Device> device, VkImage image, VkFormat format, VkImageAspectFlags aspect,
                     uint32_t mipLevels)
    : device_(std::move(device)) {
    VkImageViewCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    info.image = image;
    info.viewType = VK_IMAGE_VIEW_TYPE_2D;
    info.format = format;
    info.components.r = VK_COMPONENT_SWIZZLE_IDENTITY;
    info.components.g = VK_COMPONENT_SWIZZLE_IDENTITY;
    info.components.b = VK_COMPONENT_SWIZZLE_IDENTITY;
    info.components.a = VK_COMPONENT_SWIZZLE_IDENTITY;
    info.subresourceRange.aspectMask = aspect;
    info.subresourceRange.baseMipLevel = 0;
    info.subresourceRange.levelCount = mipLevels;
    info.subresourceRange.baseArrayLayer = 0;
    info.subresourceRange.layerCount = 1;

    CheckVk(vkCreateImageView(device_->GetRaw(), &info, nullptr, &raw_), ErrorKind::ImageView, "vkCreateImageView");
}

ImageView::~ImageView() {
    Destroy();
}

void ImageView::Destroy() {
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroyImageView(device_->GetRaw(), raw_, nullptr);
        raw_ = VK_NULL_HANDLE;
    }
}

ImageView::ImageView(ImageView&& other) noexcept
    : device_(std::move(other.device_)), raw_(std::exchange(other.raw_, VK_NULL_HANDLE)) {}

ImageView& ImageView::operator=(ImageView&& other) noexcept {
    if (this != &other) {
        Destroy();
        device_ = std::move(other.device_);
        raw_ = std::exchange(other.raw_, VK_NULL_HANDLE);
    }
    return *this;
}

} // namespace trekanten
