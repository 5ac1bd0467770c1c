// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/swapchain.h"
#include "trekanten/backend/attachment.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/queue.h"
#include "trekanten/backend/render_pass.h"
#include "trekanten/backend/surface.h"
#include "trekanten/backend/sync.h"
#include "trekanten/core/log.h"

#include <algorithm>
#include <cstdint>

namespace trekanten {

VkSurfaceFormatKHR ChooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats) {
    if (formats.empty()) {
        throw RenderError(ErrorKind::Swapchain, "Surface reports no formats");
    }

    for (const auto& f : formats) {
        if (f.format == VK_FORMAT_B8G8R8A8_SRGB && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
            return f;
        }
    }

    return formats.front();
}

VkPresentModeKHR ChoosePresentMode(const std::vector<VkPresentModeKHR>& modes, bool vsync) {
    const std::vector<VkPresentModeKHR> preference =
        vsync ? std::vector<VkPresentModeKHR>{VK_PRESENT_MODE_FIFO_RELAXED_KHR, VK_PRESENT_MODE_FIFO_KHR}
              : std::vector<VkPresentModeKHR>{VK_PRESENT_MODE_MAILBOX_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR};

    for (auto preferred : preference) {
        if (std::find(modes.begin(), modes.end(), preferred) != modes.end()) {
            return preferred;
        }
    }

    // Always supported
    return VK_PRESENT_MODE_FIFO_KHR;
}

Extent2D ChooseExtent(const VkSurfaceCapabilitiesKHR& capabilities, Extent2D requested) {
    if (capabilities.currentExtent.width != UINT32_MAX) {
        return Extent2D(capabilities.currentExtent);
    }

    return Extent2D(
        std::clamp(requested.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width),
        std::clamp(requested.height, capabilities.minImageExtent.height, capabilities.maxImageExtent.height));
}

uint32_t ChooseImageCount(const VkSurfaceCapabilitiesKHR& capabilities) {
    uint32_t count = std::max(3u, capabilities.minImageCount);
    if (capabilities.maxImageCount > 0) {
        count = std::min(count, capabilities.maxImageCount);
    }
    return count;
}

Swapchain::Swapchain(std::shared_ptr<Device> device, Extent2D requested, bool vsync, const Swapchain* old)
    : device_(std::move(device)) {
    const Surface& surface = *device_->GetSurface();
    const SwapchainSupport support = surface.QuerySwapchainSupport(device_->GetPhysicalDevice());

    const VkSurfaceFormatKHR format = ChooseSurfaceFormat(support.formats);
    const VkPresentModeKHR presentMode = ChoosePresentMode(support.present_modes, vsync);
    const Extent2D extent = ChooseExtent(support.capabilities, requested);
    if (extent.IsEmpty()) {
        throw RenderError(ErrorKind::Swapchain, "Surface has an empty extent");
    }

    const VkSurfaceTransformFlagBitsKHR preTransform =
        (support.capabilities.supportedTransforms & VK_SURFACE_TRANSFORM_IDENTITY_BIT_KHR)
            ? VK_SURFACE_TRANSFORM_IDENTITY_BIT_KHR
            : support.capabilities.currentTransform;

    VkSwapchainCreateInfoKHR info{};
    info.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    info.surface = surface.GetRaw();
    info.minImageCount = ChooseImageCount(support.capabilities);
    info.imageFormat = format.format;
    info.imageColorSpace = format.colorSpace;
    info.imageExtent = extent;
    info.imageArrayLayers = 1;
    info.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    info.preTransform = preTransform;
    info.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    info.presentMode = presentMode;
    info.clipped = VK_TRUE;
    info.oldSwapchain = old != nullptr ? old->GetRaw() : VK_NULL_HANDLE;

    const QueueFamilies& families = device_->GetQueueFamilies();
    const uint32_t familyIndices[] = {families.graphics->index, families.present->index};
    if (familyIndices[0] != familyIndices[1]) {
        info.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        info.queueFamilyIndexCount = 2;
        info.pQueueFamilyIndices = familyIndices;
    } else {
        info.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }

    VkDevice vkDevice = device_->GetRaw();
    CheckVk(vkCreateSwapchainKHR(vkDevice, &info, nullptr, &raw_), ErrorKind::Swapchain, "vkCreateSwapchainKHR");

    uint32_t imageCount = 0;
    CheckVk(vkGetSwapchainImagesKHR(vkDevice, raw_, &imageCount, nullptr), ErrorKind::Swapchain,
            "vkGetSwapchainImagesKHR");
    images_.resize(imageCount);
    CheckVk(vkGetSwapchainImagesKHR(vkDevice, raw_, &imageCount, images_.data()), ErrorKind::Swapchain,
            "vkGetSwapchainImagesKHR");

    info_ = SwapchainInfo{format.format, extent};

    image_views_.reserve(images_.size());
    for (VkImage image : images_) {
        image_views_.emplace_back(device_, image, format.format, VK_IMAGE_ASPECT_COLOR_BIT, 1);
    }

    TREKANTEN_LOG_INFO("Created swapchain {}x{} with {} images", extent.width, extent.height, images_.size());
}

Swapchain::~Swapchain() {
    image_views_.clear();
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device_->GetRaw(), raw_, nullptr);
    }
}

std::vector<Framebuffer> Swapchain::CreateFramebuffersFor(const RenderPass& renderPass,
                                                          const DepthBuffer& depthBuffer) const {
    std::vector<Framebuffer> framebuffers;
    framebuffers.reserve(image_views_.size());
    for (const auto& view : image_views_) {
        const std::vector<VkImageView> attachments = {view.GetRaw(), depthBuffer.GetImageView().GetRaw()};
        framebuffers.emplace_back(device_, attachments, renderPass, info_.extent);
    }
    return framebuffers;
}

SwapchainStatus CheckSwapchainResult(VkResult result, const char* what) {
    switch (result) {
    case VK_SUCCESS:
        return SwapchainStatus::Optimal;
    case VK_SUBOPTIMAL_KHR:
        return SwapchainStatus::Suboptimal;
    case VK_ERROR_OUT_OF_DATE_KHR:
        return SwapchainStatus::OutOfDate;
    default:
        throw RenderError::Vulkan(ErrorKind::Swapchain, what, result);
    }
}

uint32_t Swapchain::AcquireNextImage(const Semaphore& signal) const {
    uint32_t idx = 0;
    const VkResult result =
        vkAcquireNextImageKHR(device_->GetRaw(), raw_, UINT64_MAX, signal.GetRaw(), VK_NULL_HANDLE, &idx);

    const SwapchainStatus status = CheckSwapchainResult(result, "vkAcquireNextImageKHR");
    if (status == SwapchainStatus::OutOfDate) {
        throw RenderError::NeedsResize();
    }
    if (status == SwapchainStatus::Suboptimal) {
        TREKANTEN_LOG_DEBUG("Acquired image {} from a suboptimal swapchain", idx);
    }

    return idx;
}

void Swapchain::EnqueuePresent(const Queue& queue, const VkPresentInfoKHR& info) const {
    const VkResult result = vkQueuePresentKHR(queue.GetRaw(), &info);

    if (CheckSwapchainResult(result, "vkQueuePresentKHR") != SwapchainStatus::Optimal) {
        throw RenderError::NeedsResize();
    }
}

} // namespace trekanten
