// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

enum class ErrorKind {
    Instance,
    DebugUtils,
    Surface,
    DeviceCreation,
    Device,
    Swapchain,
    RenderPass,
    Framebuffer,
    ImageView,
    Pipeline,
    Spirv,
    Material,
    CommandPool,
    CommandBuffer,
    Semaphore,
    Fence,
    Queue,
    Memory,
    VertexBuffer,
    IndexBuffer,
    UniformBuffer,
    DescriptorSet,
    Texture,
    Frame,
    Window,
    NeedsResize,
};

const char* ToString(ErrorKind kind);
const char* ToString(VkResult result);

/**
 * @brief Error raised by every trekanten wrapper
 *
 * Errors nest: wrapping a swapchain error in a device error yields the context
 * {Device, Swapchain} and the message "Device: Swapchain: ...".
 */
class RenderError : public std::runtime_error {
public:
    RenderError(ErrorKind kind, const std::string& message, VkResult result = VK_SUCCESS);

    static RenderError Vulkan(ErrorKind kind, const std::string& what, VkResult result);
    static RenderError Wrap(ErrorKind outer, const RenderError& inner);
    static RenderError NeedsResize();

    // Outermost kind
    ErrorKind GetKind() const { return context_.front(); }
    // Innermost kind, where the error originated
    ErrorKind GetRootKind() const { return context_.back(); }
    const std::vector<ErrorKind>& GetContext() const { return context_; }
    VkResult GetVulkanResult() const { return result_; }

    bool IsNeedsResize() const { return GetRootKind() == ErrorKind::NeedsResize; }

private:
    RenderError(std::vector<ErrorKind> context, const std::string& message, VkResult result);

    std::vector<ErrorKind> context_;
    VkResult result_;
};

// Throws RenderError::Vulkan unless result is VK_SUCCESS.
void CheckVk(VkResult result, ErrorKind kind, const char* what);

} // namespace trekanten
