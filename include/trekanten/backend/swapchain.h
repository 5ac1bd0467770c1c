// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/framebuffer.h"
#include "trekanten/backend/image_view.h"
#include "trekanten/backend/util.h"

#include <memory>
#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

class DepthBuffer;
class Device;
class Queue;
class RenderPass;
class Semaphore;

VkSurfaceFormatKHR ChooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats);
VkPresentModeKHR ChoosePresentMode(const std::vector<VkPresentModeKHR>& modes, bool vsync);
Extent2D ChooseExtent(const VkSurfaceCapabilitiesKHR& capabilities, Extent2D requested);
uint32_t ChooseImageCount(const VkSurfaceCapabilitiesKHR& capabilities);

enum class SwapchainStatus {
    Optimal,
    Suboptimal,
    OutOfDate,
};

// Throws a Swapchain error for any failure other than VK_ERROR_OUT_OF_DATE_KHR
SwapchainStatus CheckSwapchainResult(VkResult result, const char* what);

struct SwapchainInfo {
    VkFormat format = VK_FORMAT_UNDEFINED;
    Extent2D extent;
};

class Swapchain {
public:
    Swapchain(std::shared_ptr<Device> device, Extent2D requested, bool vsync, const Swapchain* old = nullptr);
    ~Swapchain();

    Swapchain(const Swapchain&) = delete;
    Swapchain& operator=(const Swapchain&) = delete;

    VkSwapchainKHR GetRaw() const { return raw_; }
    const SwapchainInfo& Info() const { return info_; }
    uint32_t NumImages() const { return static_cast<uint32_t>(images_.size()); }
    const ImageView& GetImageView(uint32_t idx) const { return image_views_.at(idx); }

    // One framebuffer per swapchain image, color view first then depth
    std::vector<Framebuffer> CreateFramebuffersFor(const RenderPass& renderPass, const DepthBuffer& depthBuffer) const;

    /**
     * @brief Acquire the next image, signalling the semaphore
     *
     * Throws NeedsResize when the swapchain is out of date. A suboptimal
     * acquire still hands out the image and signals the semaphore, so it is
     * returned normally and the resize is reported by EnqueuePresent.
     */
    uint32_t AcquireNextImage(const Semaphore& signal) const;
    // Throws NeedsResize when the swapchain is suboptimal or out of date
    void EnqueuePresent(const Queue& queue, const VkPresentInfoKHR& info) const;

private:
    std::shared_ptr<Device> device_;
    VkSwapchainKHR raw_ = VK_NULL_HANDLE;
    SwapchainInfo info_;
    std::vector<VkImage> images_;
    std::vector<ImageView> image_views_;
};

} // namespace trekanten
