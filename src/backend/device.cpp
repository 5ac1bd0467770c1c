// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/device.h"
#include "trekanten/backend/allocator.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/instance.h"
#include "trekanten/backend/surface.h"
#include "trekanten/core/log.h"

namespace trekanten {

std::shared_ptr<Device> Device::Create(std::shared_ptr<Instance> instance, std::shared_ptr<Surface> surface) {
    const DeviceCandidate candidate = SelectPhysicalDevice(*instance, *surface);
    VkPhysicalDevice physical = candidate.physical_device;

    VkPhysicalDeviceFeatures supported{};
    vkGetPhysicalDeviceFeatures(physical, &supported);

    VkPhysicalDeviceFeatures enabled{};
    enabled.samplerAnisotropy = supported.samplerAnisotropy;

    const float priority = 1.0f;
    const auto queueInfos = QueueCreateInfos(candidate.queue_families, &priority);

    const auto extensions = ToCStrings(RequiredDeviceExtensions());
    // Device layers are deprecated but older loaders still read them
    const auto layers = ToCStrings(instance->GetEnabledLayers());

    VkDeviceCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    info.queueCreateInfoCount = static_cast<uint32_t>(queueInfos.size());
    info.pQueueCreateInfos = queueInfos.data();
    info.pEnabledFeatures = &enabled;
    info.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
    info.ppEnabledExtensionNames = extensions.data();
    info.enabledLayerCount = static_cast<uint32_t>(layers.size());
    info.ppEnabledLayerNames = layers.data();

    std::shared_ptr<Device> device(new Device());
    device->instance_ = std::move(instance);
    device->surface_ = std::move(surface);
    device->physical_device_ = physical;
    device->queue_families_ = candidate.queue_families;
    device->sampler_anisotropy_ = supported.samplerAnisotropy == VK_TRUE;
    vkGetPhysicalDeviceMemoryProperties(physical, &device->memory_properties_);

    CheckVk(vkCreateDevice(physical, &info, nullptr, &device->raw_), ErrorKind::DeviceCreation, "vkCreateDevice");

    try {
        device->allocator_ = Allocator::Create(device->instance_->GetRaw(), physical, device->raw_);
    } catch (const RenderError& e) {
        throw RenderError::Wrap(ErrorKind::DeviceCreation, e);
    }

    const QueueFamily& gfx = *candidate.queue_families.graphics;
    const QueueFamily& present = *candidate.queue_families.present;

    VkQueue rawGfx = VK_NULL_HANDLE;
    VkQueue rawPresent = VK_NULL_HANDLE;
    vkGetDeviceQueue(device->raw_, gfx.index, 0, &rawGfx);
    vkGetDeviceQueue(device->raw_, present.index, 0, &rawPresent);

    device->graphics_queue_ = Queue(device->raw_, rawGfx, gfx);
    device->present_queue_ = Queue(device->raw_, rawPresent, present);
    device->util_queue_ = device->graphics_queue_;

    device->depth_format_ = FindDepthFormat([physical](VkFormat format) {
        VkFormatProperties props{};
        vkGetPhysicalDeviceFormatProperties(physical, format, &props);
        return props;
    });

    TREKANTEN_LOG_INFO("Created device (graphics family {}, present family {})", gfx.index, present.index);
    return device;
}

Device::~Device() {
    allocator_.reset();
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroyDevice(raw_, nullptr);
    }
}

VmaAllocator Device::GetAllocator() const {
    return allocator_->GetRaw();
}

void Device::WaitIdle() const {
    CheckVk(vkDeviceWaitIdle(raw_), ErrorKind::Device, "vkDeviceWaitIdle");
}

} // namespace trekanten
