// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vulkan/vulkan.h>

namespace trekanten {

class Instance;

// "[<types>][ID <n>(<id name>)]\n(<message>)"
std::string FormatDebugMessage(VkDebugUtilsMessageTypeFlagsEXT types, int32_t messageIdNumber,
                               const char* messageIdName, const char* message);

std::string MessageTypesToString(VkDebugUtilsMessageTypeFlagsEXT types);

class DebugUtils {
public:
    // Only creates a messenger when the instance enabled VK_EXT_debug_utils
    explicit DebugUtils(std::shared_ptr<Instance> instance);
    ~DebugUtils();

    DebugUtils(const DebugUtils&) = delete;
    DebugUtils& operator=(const DebugUtils&) = delete;
    DebugUtils(DebugUtils&& other) noexcept;
    DebugUtils& operator=(DebugUtils&& other) = delete;

    bool IsActive() const { return messenger_ != VK_NULL_HANDLE; }

private:
    std::shared_ptr<Instance> instance_;
    VkDebugUtilsMessengerEXT messenger_ = VK_NULL_HANDLE;
    PFN_vkDestroyDebugUtilsMessengerEXT vkDestroyDebugUtilsMessengerEXT_ = nullptr;
};

} // namespace trekanten
