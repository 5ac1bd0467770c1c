// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/device_selection.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/instance.h"
#include "trekanten/backend/surface.h"
#include "trekanten/core/log.h"

#include <algorithm>

namespace trekanten {

const char* ToString(DeviceSuitability suitability) {
    switch (suitability) {
    case DeviceSuitability::Suitable: return "Suitable";
    case DeviceSuitability::MissingRequiredExtensions: return "MissingRequiredExtensions";
    case DeviceSuitability::MissingGraphicsQueue: return "MissingGraphicsQueue";
    case DeviceSuitability::MissingPresentQueue: return "MissingPresentQueue";
    }
    return "Unknown";
}

const std::vector<std::string>& RequiredDeviceExtensions() {
    static const std::vector<std::string> extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};
    return extensions;
}

QueueFamilies FindQueueFamilies(const std::vector<VkQueueFamilyProperties>& families,
                                const std::vector<bool>& presentSupport) {
    QueueFamilies result;

    for (uint32_t i = 0; i < families.size(); ++i) {
        if (families[i].queueCount > 0 && (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT)) {
            result.graphics = QueueFamily{i, families[i]};
            break;
        }
    }

    auto canPresent = [&](uint32_t i) { return i < presentSupport.size() && presentSupport[i]; };

    if (result.graphics && canPresent(result.graphics->index)) {
        result.present = result.graphics;
        return result;
    }

    for (uint32_t i = 0; i < families.size(); ++i) {
        if (canPresent(i)) {
            result.present = QueueFamily{i, families[i]};
            break;
        }
    }

    return result;
}

DeviceSuitability CheckSuitability(const QueueFamilies& families,
                                   const std::vector<std::string>& availableExtensions,
                                   const std::vector<std::string>& requiredExtensions) {
    for (const auto& req : requiredExtensions) {
        if (std::find(availableExtensions.begin(), availableExtensions.end(), req) == availableExtensions.end()) {
            return DeviceSuitability::MissingRequiredExtensions;
        }
    }

    if (!families.graphics) {
        return DeviceSuitability::MissingGraphicsQueue;
    }

    if (!families.present) {
        return DeviceSuitability::MissingPresentQueue;
    }

    return DeviceSuitability::Suitable;
}

int ScoreDevice(VkPhysicalDeviceType type, DeviceSuitability suitability) {
    int score = 0;
    if (type == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
        score += 100;
    }
    if (suitability == DeviceSuitability::Suitable) {
        score += 1000;
    }
    return score;
}

DeviceCandidate SelectBestCandidate(std::vector<DeviceCandidate> candidates) {
    if (candidates.empty()) {
        throw RenderError(ErrorKind::DeviceCreation, "MissingPhysicalDevice");
    }

    const DeviceSuitability firstSuitability = candidates.front().suitability;

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const DeviceCandidate& a, const DeviceCandidate& b) { return a.score > b.score; });

    if (candidates.front().suitability != DeviceSuitability::Suitable) {
        throw RenderError(ErrorKind::DeviceCreation,
                          std::string("UnsuitableDevice(") + ToString(firstSuitability) + ")");
    }

    return candidates.front();
}

std::vector<VkDeviceQueueCreateInfo> QueueCreateInfos(const QueueFamilies& families, const float* priority) {
    std::vector<uint32_t> indices;
    if (families.graphics) {
        indices.push_back(families.graphics->index);
    }
    if (families.present && (indices.empty() || families.present->index != indices.front())) {
        indices.push_back(families.present->index);
    }

    std::vector<VkDeviceQueueCreateInfo> infos;
    infos.reserve(indices.size());
    for (uint32_t idx : indices) {
        VkDeviceQueueCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        info.queueFamilyIndex = idx;
        info.queueCount = 1;
        info.pQueuePriorities = priority;
        infos.push_back(info);
    }
    return infos;
}

VkFormat FindSupportedFormat(const std::vector<VkFormat>& candidates, VkImageTiling tiling,
                             VkFormatFeatureFlags features, const FormatPropertiesQuery& query) {
    for (VkFormat format : candidates) {
        const VkFormatProperties props = query(format);
        const VkFormatFeatureFlags supported =
            tiling == VK_IMAGE_TILING_LINEAR ? props.linearTilingFeatures : props.optimalTilingFeatures;
        if ((supported & features) == features) {
            return format;
        }
    }

    throw RenderError(ErrorKind::Device, "No supported format among candidates");
}

VkFormat FindDepthFormat(const FormatPropertiesQuery& query) {
    return FindSupportedFormat(
        {VK_FORMAT_D32_SFLOAT, VK_FORMAT_D32_SFLOAT_S8_UINT, VK_FORMAT_D24_UNORM_S8_UINT}, VK_IMAGE_TILING_OPTIMAL,
        VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT, query);
}

namespace {

std::vector<std::string> DeviceExtensions(VkPhysicalDevice device) {
    uint32_t count = 0;
    CheckVk(vkEnumerateDeviceExtensionProperties(device, nullptr, &count, nullptr), ErrorKind::DeviceCreation,
            "vkEnumerateDeviceExtensionProperties");
    std::vector<VkExtensionProperties> props(count);
    CheckVk(vkEnumerateDeviceExtensionProperties(device, nullptr, &count, props.data()), ErrorKind::DeviceCreation,
            "vkEnumerateDeviceExtensionProperties");

    std::vector<std::string> names;
    names.reserve(props.size());
    for (const auto& p : props) {
        names.emplace_back(p.extensionName);
    }
    return names;
}

DeviceCandidate InspectDevice(VkPhysicalDevice device, const Surface& surface) {
    VkPhysicalDeviceProperties props{};
    vkGetPhysicalDeviceProperties(device, &props);

    uint32_t familyCount = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &familyCount, nullptr);
    std::vector<VkQueueFamilyProperties> families(familyCount);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &familyCount, families.data());

    std::vector<bool> presentSupport(familyCount);
    for (uint32_t i = 0; i < familyCount; ++i) {
        presentSupport[i] = surface.IsSupportedBy(device, i);
    }

    DeviceCandidate candidate;
    candidate.physical_device = device;
    candidate.name = props.deviceName;
    candidate.type = props.deviceType;
    candidate.queue_families = FindQueueFamilies(families, presentSupport);
    candidate.suitability =
        CheckSuitability(candidate.queue_families, DeviceExtensions(device), RequiredDeviceExtensions());

    // A device that cannot create a swapchain for this surface is as good as one without the extension
    if (candidate.suitability == DeviceSuitability::Suitable) {
        const SwapchainSupport support = surface.QuerySwapchainSupport(device);
        if (support.formats.empty() || support.present_modes.empty()) {
            candidate.suitability = DeviceSuitability::MissingRequiredExtensions;
        }
    }

    candidate.score = ScoreDevice(candidate.type, candidate.suitability);
    return candidate;
}

} // namespace

DeviceCandidate SelectPhysicalDevice(const Instance& instance, const Surface& surface) {
    uint32_t count = 0;
    CheckVk(vkEnumeratePhysicalDevices(instance.GetRaw(), &count, nullptr), ErrorKind::DeviceCreation,
            "vkEnumeratePhysicalDevices");
    std::vector<VkPhysicalDevice> devices(count);
    if (count > 0) {
        CheckVk(vkEnumeratePhysicalDevices(instance.GetRaw(), &count, devices.data()), ErrorKind::DeviceCreation,
                "vkEnumeratePhysicalDevices");
    }

    std::vector<DeviceCandidate> candidates;
    candidates.reserve(devices.size());
    for (VkPhysicalDevice device : devices) {
        candidates.push_back(InspectDevice(device, surface));
        const auto& c = candidates.back();
        TREKANTEN_LOG_DEBUG("Physical device {}: {} (score {})", c.name, ToString(c.suitability), c.score);
    }

    DeviceCandidate best = SelectBestCandidate(std::move(candidates));
    TREKANTEN_LOG_INFO("Selected physical device: {}", best.name);
    return best;
}

} // namespace trekanten
