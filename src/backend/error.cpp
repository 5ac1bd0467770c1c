// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/error.h"

#include <fmt/format.h>

namespace trekanten {

const char* ToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Instance: return "Instance";
    case ErrorKind::DebugUtils: return "DebugUtils";
    case ErrorKind::Surface: return "Surface";
    case ErrorKind::DeviceCreation: return "DeviceCreation";
    case ErrorKind::Device: return "Device";
    case ErrorKind::Swapchain: return "Swapchain";
    case ErrorKind::RenderPass: return "RenderPass";
    case ErrorKind::Framebuffer: return "Framebuffer";
    case ErrorKind::ImageView: return "ImageView";
    case ErrorKind::Pipeline: return "Pipeline";
    case ErrorKind::Spirv: return "Spirv";
    case ErrorKind::Material: return "Material";
    case ErrorKind::CommandPool: return "CommandPool";
    case ErrorKind::CommandBuffer: return "CommandBuffer";
    case ErrorKind::Semaphore: return "Semaphore";
    case ErrorKind::Fence: return "Fence";
    case ErrorKind::Queue: return "Queue";
    case ErrorKind::Memory: return "Memory";
    case ErrorKind::VertexBuffer: return "VertexBuffer";
    case ErrorKind::IndexBuffer: return "IndexBuffer";
    case ErrorKind::UniformBuffer: return "UniformBuffer";
    case ErrorKind::DescriptorSet: return "DescriptorSet";
    case ErrorKind::Texture: return "Texture";
    case ErrorKind::Frame: return "Frame";
    case ErrorKind::Window: return "Window";
    case ErrorKind::NeedsResize: return "NeedsResize";
    }
    return "Unknown";
}

const char* ToString(VkResult result) {
    switch (result) {
    case VK_SUCCESS: return "VK_SUCCESS";
    case VK_NOT_READY: return "VK_NOT_READY";
    case VK_TIMEOUT: return "VK_TIMEOUT";
    case VK_EVENT_SET: return "VK_EVENT_SET";
    case VK_EVENT_RESET: return "VK_EVENT_RESET";
    case VK_INCOMPLETE: return "VK_INCOMPLETE";
    case VK_ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
    case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
    case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
    case VK_ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
    case VK_ERROR_MEMORY_MAP_FAILED: return "VK_ERROR_MEMORY_MAP_FAILED";
    case VK_ERROR_LAYER_NOT_PRESENT: return "VK_ERROR_LAYER_NOT_PRESENT";
    case VK_ERROR_EXTENSION_NOT_PRESENT: return "VK_ERROR_EXTENSION_NOT_PRESENT";
    case VK_ERROR_FEATURE_NOT_PRESENT: return "VK_ERROR_FEATURE_NOT_PRESENT";
    case VK_ERROR_INCOMPATIBLE_DRIVER: return "VK_ERROR_INCOMPATIBLE_DRIVER";
    case VK_ERROR_TOO_MANY_OBJECTS: return "VK_ERROR_TOO_MANY_OBJECTS";
    case VK_ERROR_FORMAT_NOT_SUPPORTED: return "VK_ERROR_FORMAT_NOT_SUPPORTED";
    case VK_ERROR_FRAGMENTED_POOL: return "VK_ERROR_FRAGMENTED_POOL";
    case VK_ERROR_OUT_OF_POOL_MEMORY: return "VK_ERROR_OUT_OF_POOL_MEMORY";
    case VK_ERROR_SURFACE_LOST_KHR: return "VK_ERROR_SURFACE_LOST_KHR";
    case VK_ERROR_NATIVE_WINDOW_IN_USE_KHR: return "VK_ERROR_NATIVE_WINDOW_IN_USE_KHR";
    case VK_SUBOPTIMAL_KHR: return "VK_SUBOPTIMAL_KHR";
    case VK_ERROR_OUT_OF_DATE_KHR: return "VK_ERROR_OUT_OF_DATE_KHR";
    case VK_ERROR_VALIDATION_FAILED_EXT: return "VK_ERROR_VALIDATION_FAILED_EXT";
    default: return "VK_ERROR_UNKNOWN";
    }
}

RenderError::RenderError(ErrorKind kind, const std::string& message, VkResult result)
    : RenderError(std::vector<ErrorKind>{kind}, fmt::format("{}: {}", ToString(kind), message), result) {}

RenderError::RenderError(std::vector<ErrorKind> context, const std::string& message, VkResult result)
    : std::runtime_error(message), context_(std::move(context)), result_(result) {}

RenderError RenderError::Vulkan(ErrorKind kind, const std::string& what, VkResult result) {
    return RenderError(kind, fmt::format("{} failed ({})", what, ToString(result)), result);
}

RenderError RenderError::Wrap(ErrorKind outer, const RenderError& inner) {
    std::vector<ErrorKind> context;
    context.reserve(inner.context_.size() + 1);
    context.push_back(outer);
    context.insert(context.end(), inner.context_.begin(), inner.context_.end());
    return RenderError(std::move(context), fmt::format("{}: {}", ToString(outer), inner.what()), inner.result_);
}

RenderError RenderError::NeedsResize() {
    return RenderError(ErrorKind::NeedsResize, "swapchain is out of date");
}

void CheckVk(VkResult result, ErrorKind kind, const char* what) {
    if (result != VK_SUCCESS) {
        throw RenderError::Vulkan(kind, what, result);
    }
}

} // namespace trekanten
