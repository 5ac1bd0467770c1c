// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/device_selection.h"
#include "trekanten/backend/queue.h"

#include <memory>
#include <vk_mem_alloc.h>
#include <vulkan/vulkan.h>

namespace trekanten {

class Allocator;
class Instance;
class Surface;

/**
 * @brief Logical device plus everything that lives exactly as long as it
 *
 * Owns the VMA allocator and hands out the graphics, present and util queues.
 * Resources hold a shared_ptr to the device so it is destroyed last.
 */
class Device {
public:
    static std::shared_ptr<Device> Create(std::shared_ptr<Instance> instance, std::shared_ptr<Surface> surface);

    ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    VkDevice GetRaw() const { return raw_; }
    VkPhysicalDevice GetPhysicalDevice() const { return physical_device_; }
    VmaAllocator GetAllocator() const;

    const Queue& GraphicsQueue() const { return graphics_queue_; }
    const Queue& PresentQueue() const { return present_queue_; }
    const Queue& UtilQueue() const { return util_queue_; }
    const QueueFamilies& GetQueueFamilies() const { return queue_families_; }

    const std::shared_ptr<Surface>& GetSurface() const { return surface_; }

    VkFormat DepthFormat() const { return depth_format_; }
    bool SupportsSamplerAnisotropy() const { return sampler_anisotropy_; }
    const VkPhysicalDeviceMemoryProperties& MemoryProperties() const { return memory_properties_; }

    void WaitIdle() const;

private:
    Device() = default;

    std::shared_ptr<Instance> instance_;
    std::shared_ptr<Surface> surface_;
    VkPhysicalDevice physical_device_ = VK_NULL_HANDLE;
    VkDevice raw_ = VK_NULL_HANDLE;
    std::unique_ptr<Allocator> allocator_;

    QueueFamilies queue_families_;
    Queue graphics_queue_;
    Queue present_queue_;
    Queue util_queue_;

    VkFormat depth_format_ = VK_FORMAT_UNDEFINED;
    bool sampler_anisotropy_ = false;
    VkPhysicalDeviceMemoryProperties memory_properties_{};
};

} // namespace trekanten
