// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <vector>
#include <vulkan/vulkan.h>

struct GLFWwindow;

namespace trekanten {

class Instance;

struct SwapchainSupport {
    VkSurfaceCapabilitiesKHR capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> present_modes;
};

class Surface {
public:
    static std::shared_ptr<Surface> Create(std::shared_ptr<Instance> instance, GLFWwindow* window);

    ~Surface();

    Surface(const Surface&) = delete;
    Surface& operator=(const Surface&) = delete;

    VkSurfaceKHR GetRaw() const { return raw_; }

    bool IsSupportedBy(VkPhysicalDevice physicalDevice, uint32_t queueFamily) const;
    SwapchainSupport QuerySwapchainSupport(VkPhysicalDevice physicalDevice) const;

private:
    Surface(std::shared_ptr<Instance> instance, VkSurfaceKHR raw);

    std::shared_ptr<Instance> instance_;
    VkSurfaceKHR raw_ = VK_NULL_HANDLE;
};

} // namespace trekanten
