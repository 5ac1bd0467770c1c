// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <vk_mem_alloc.h>
#include <vulkan/vulkan.h>

namespace trekanten {

// Owns the VMA allocator for a device
class Allocator {
public:
    static std::unique_ptr<Allocator> Create(VkInstance instance, VkPhysicalDevice physicalDevice, VkDevice device);

    ~Allocator();

    Allocator(const Allocator&) = delete;
    Allocator& operator=(const Allocator&) = delete;

    VmaAllocator GetRaw() const { return raw_; }

private:
    explicit Allocator(VmaAllocator raw) : raw_(raw) {}

    VmaAllocator raw_ = VK_NULL_HANDLE;
};

// True for usages whose memory can be mapped
bool IsHostVisible(VmaMemoryUsage usage);

} // namespace trekanten
