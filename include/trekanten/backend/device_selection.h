// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

class Instance;
class Surface;

struct QueueFamily {
    uint32_t index = 0;
    VkQueueFamilyProperties props{};
};

struct QueueFamilies {
    std::optional<QueueFamily> graphics;
    std::optional<QueueFamily> present;
};

enum class DeviceSuitability {
    Suitable,
    MissingRequiredExtensions,
    MissingGraphicsQueue,
    MissingPresentQueue,
};

const char* ToString(DeviceSuitability suitability);

// Graphics is the first graphics-capable family. Present prefers the graphics family.
QueueFamilies FindQueueFamilies(const std::vector<VkQueueFamilyProperties>& families,
                                const std::vector<bool>& presentSupport);

DeviceSuitability CheckSuitability(const QueueFamilies& families,
                                   const std::vector<std::string>& availableExtensions,
                                   const std::vector<std::string>& requiredExtensions);

int ScoreDevice(VkPhysicalDeviceType type, DeviceSuitability suitability);

struct DeviceCandidate {
    VkPhysicalDevice physical_device = VK_NULL_HANDLE;
    std::string name;
    VkPhysicalDeviceType type = VK_PHYSICAL_DEVICE_TYPE_OTHER;
    DeviceSuitability suitability = DeviceSuitability::Suitable;
    QueueFamilies queue_families;
    int score = 0;
};

/**
 * @brief Pick the highest scoring suitable candidate
 *
 * Candidates are stable sorted by descending score. Throws DeviceCreation with
 * "MissingPhysicalDevice" for an empty list and "UnsuitableDevice(<reason>)"
 * when the best candidate is not suitable, where the reason is the first
 * enumerated device's suitability.
 */
DeviceCandidate SelectBestCandidate(std::vector<DeviceCandidate> candidates);

// One create info per distinct family. priority must outlive the returned infos.
std::vector<VkDeviceQueueCreateInfo> QueueCreateInfos(const QueueFamilies& families, const float* priority);

using FormatPropertiesQuery = std::function<VkFormatProperties(VkFormat)>;

// Throws RenderError of kind Device when no candidate matches
VkFormat FindSupportedFormat(const std::vector<VkFormat>& candidates, VkImageTiling tiling,
                             VkFormatFeatureFlags features, const FormatPropertiesQuery& query);

VkFormat FindDepthFormat(const FormatPropertiesQuery& query);

const std::vector<std::string>& RequiredDeviceExtensions();

// Enumerates physical devices and picks one with the rules above
DeviceCandidate SelectPhysicalDevice(const Instance& instance, const Surface& surface);

} // namespace trekanten
