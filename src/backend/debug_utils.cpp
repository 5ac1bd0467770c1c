// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/debug_utils.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/instance.h"
#include "trekanten/core/log.h"

#include <fmt/format.h>

namespace trekanten {
namespace {

const char* OrNull(const char* s) {
    return s != nullptr ? s : "NULL";
}

VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                                             VkDebugUtilsMessageTypeFlagsEXT types,
                                             const VkDebugUtilsMessengerCallbackDataEXT* data, void* /*user*/) {
    const std::string msg =
        FormatDebugMessage(types, data->messageIdNumber, data->pMessageIdName, data->pMessage);

    switch (severity) {
    case VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT:
        TREKANTEN_LOG_TRACE("{}", msg);
        break;
    case VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT:
        TREKANTEN_LOG_INFO("{}", msg);
        break;
    case VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT:
        TREKANTEN_LOG_WARN("{}", msg);
        break;
    case VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT:
        TREKANTEN_LOG_ERROR("{}", msg);
        break;
    default:
        TREKANTEN_LOG_INFO("{}", msg);
        break;
    }

    return VK_FALSE;
}

} // namespace

std::string MessageTypesToString(VkDebugUtilsMessageTypeFlagsEXT types) {
    std::string out;
    auto append = [&out](const char* name) {
        if (!out.empty()) {
            out += " | ";
        }
        out += name;
    };

    if (types & VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT) {
        append("GENERAL");
    }
    if (types & VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT) {
        append("VALIDATION");
    }
    if (types & VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT) {
        append("PERFORMANCE");
    }
    return out;
}

std::string FormatDebugMessage(VkDebugUtilsMessageTypeFlagsEXT types, int32_t messageIdNumber,
                               const char* messageIdName, const char* message) {
    return fmt::format("[{}][ID {}({})]\n({})", MessageTypesToString(types), messageIdNumber, OrNull(messageIdName),
                       OrNull(message));
}

DebugUtils::DebugUtils(std::shared_ptr<Instance> instance) : instance_(std::move(instance)) {
    if (!instance_->HasExtension(VK_EXT_DEBUG_UTILS_EXTENSION_NAME)) {
        TREKANTEN_LOG_DEBUG("Debug utils extension not enabled, skipping messenger");
        return;
    }

    VkInstance raw = instance_->GetRaw();
    auto create = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(raw, "vkCreateDebugUtilsMessengerEXT"));
    vkDestroyDebugUtilsMessengerEXT_ = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(raw, "vkDestroyDebugUtilsMessengerEXT"));

    if (create == nullptr || vkDestroyDebugUtilsMessengerEXT_ == nullptr) {
        throw RenderError(ErrorKind::DebugUtils, "Failed to load debug utils entry points");
    }

    VkDebugUtilsMessengerCreateInfoEXT info{};
    info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    info.pfnUserCallback = DebugCallback;

    CheckVk(create(raw, &info, nullptr, &messenger_), ErrorKind::DebugUtils, "vkCreateDebugUtilsMessengerEXT");
}

DebugUtils::DebugUtils(DebugUtils&& other) noexcept
    : instance_(std::move(other.instance_)),
      messenger_(other.messenger_),
      vkDestroyDebugUtilsMessengerEXT_(other.vkDestroyDebugUtilsMessengerEXT_) {
    other.messenger_ = VK_NULL_HANDLE;
}

DebugUtils::~DebugUtils() {
    if (messenger_ != VK_NULL_HANDLE) {
        vkDestroyDebugUtilsMessengerEXT_(instance_->GetRaw(), messenger_, nullptr);
    }
}

} // namespace trekanten
