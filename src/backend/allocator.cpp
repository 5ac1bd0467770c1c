// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/allocator.h"
#include "trekanten/backend/error.h"
#include "trekanten/core/log.h"

#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>

namespace trekanten {

std::unique_ptr<Allocator> Allocator::Create(VkInstance instance, VkPhysicalDevice physicalDevice, VkDevice device) {
    VmaVulkanFunctions functions{};
    functions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
    functions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

    VmaAllocatorCreateInfo info{};
    info.vulkanApiVersion = VK_API_VERSION_1_2;
    info.instance = instance;
    info.physicalDevice = physicalDevice;
    info.device = device;
    info.pVulkanFunctions = &functions;

    VmaAllocator raw = VK_NULL_HANDLE;
    CheckVk(vmaCreateAllocator(&info, &raw), ErrorKind::Memory, "vmaCreateAllocator");

    TREKANTEN_LOG_INFO("Created VMA allocator");
    return std::unique_ptr<Allocator>(new Allocator(raw));
}

Allocator::~Allocator() {
    if (raw_ != VK_NULL_HANDLE) {
        vmaDestroyAllocator(raw_);
    }
}

bool IsHostVisible(VmaMemoryUsage usage) {
    switch (usage) {
    case VMA_MEMORY_USAGE_CPU_ONLY:
    case VMA_MEMORY_USAGE_CPU_TO_GPU:
    case VMA_MEMORY_USAGE_GPU_TO_CPU:
    case VMA_MEMORY_USAGE_CPU_COPY:
        return true;
    default:
        return false;
    }
}

} // namespace trekanten
