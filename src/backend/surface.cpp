// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/surface.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/instance.h"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

namespace trekanten {

std::shared_ptr<Surface> Surface::Create(std::shared_ptr<Instance> instance, GLFWwindow* window) {
    if (!instance || window == nullptr) {
        throw RenderError(ErrorKind::Surface, "Surface needs an instance and a window");
    }

    VkSurfaceKHR raw = VK_NULL_HANDLE;
    CheckVk(glfwCreateWindowSurface(instance->GetRaw(), window, nullptr, &raw), ErrorKind::Surface,
            "glfwCreateWindowSurface");

    return std::shared_ptr<Surface>(new Surface(std::move(instance), raw));
}

Surface::Surface(std::shared_ptr<Instance> instance, VkSurfaceKHR raw) : instance_(std::move(instance)), raw_(raw) {}

Surface::~Surface() {
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroySurfaceKHR(instance_->GetRaw(), raw_, nullptr);
    }
}

bool Surface::IsSupportedBy(VkPhysicalDevice physicalDevice, uint32_t queueFamily) const {
    VkBool32 supported = VK_FALSE;
    CheckVk(vkGetPhysicalDeviceSurfaceSupportKHR(physicalDevice, queueFamily, raw_, &supported), ErrorKind::Surface,
            "vkGetPhysicalDeviceSurfaceSupportKHR");
    return supported == VK_TRUE;
}

SwapchainSupport Surface::QuerySwapchainSupport(VkPhysicalDevice physicalDevice) const {
    SwapchainSupport support;
    CheckVk(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(physicalDevice, raw_, &support.capabilities),
            ErrorKind::Surface, "vkGetPhysicalDeviceSurfaceCapabilitiesKHR");

    uint32_t formatCount = 0;
    CheckVk(vkGetPhysicalDeviceSurfaceFormatsKHR(physicalDevice, raw_, &formatCount, nullptr), ErrorKind::Surface,
            "vkGetPhysicalDeviceSurfaceFormatsKHR");
    support.formats.resize(formatCount);
    CheckVk(vkGetPhysicalDeviceSurfaceFormatsKHR(physicalDevice, raw_, &formatCount, support.formats.data()),
            ErrorKind::Surface, "vkGetPhysicalDeviceSurfaceFormatsKHR");

    uint32_t modeCount = 0;
    CheckVk(vkGetPhysicalDeviceSurfacePresentModesKHR(physicalDevice, raw_, &modeCount, nullptr), ErrorKind::Surface,
            "vkGetPhysicalDeviceSurfacePresentModesKHR");
    support.present_modes.resize(modeCount);
    CheckVk(vkGetPhysicalDeviceSurfacePresentModesKHR(physicalDevice, raw_, &modeCount, support.present_modes.data()),
            ErrorKind::Surface, "vkGetPhysicalDeviceSurfacePresentModesKHR");

    return support;
}

} // namespace trekanten
