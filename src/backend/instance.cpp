// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/instance.h"
#include "trekanten/backend/error.h"
#include "trekanten/core/log.h"

#include <algorithm>
#include <cstdlib>

namespace trekanten {
namespace {

bool Contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::vector<std::string> AvailableInstanceExtensions() {
    uint32_t count = 0;
    CheckVk(vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr), ErrorKind::Instance,
            "vkEnumerateInstanceExtensionProperties");
    std::vector<VkExtensionProperties> props(count);
    CheckVk(vkEnumerateInstanceExtensionProperties(nullptr, &count, props.data()), ErrorKind::Instance,
            "vkEnumerateInstanceExtensionProperties");

    std::vector<std::string> names;
    names.reserve(props.size());
    for (const auto& p : props) {
        TREKANTEN_LOG_TRACE("Available vk instance extension: {}", p.extensionName);
        names.emplace_back(p.extensionName);
    }
    return names;
}

std::vector<std::string> AvailableInstanceLayers() {
    uint32_t count = 0;
    if (vkEnumerateInstanceLayerProperties(&count, nullptr) != VK_SUCCESS) {
        return {};
    }
    std::vector<VkLayerProperties> props(count);
    if (vkEnumerateInstanceLayerProperties(&count, props.data()) != VK_SUCCESS) {
        return {};
    }

    std::vector<std::string> names;
    names.reserve(props.size());
    for (const auto& p : props) {
        TREKANTEN_LOG_TRACE("Found vk layer: {}", p.layerName);
        names.emplace_back(p.layerName);
    }
    return names;
}

} // namespace

bool ValidationDisabledByEnvironment() {
    return std::getenv(kDisableValidationLayersEnvVar) != nullptr;
}

std::vector<std::string> ChooseInstanceExtensions(const std::vector<std::string>& required,
                                                  const std::vector<std::string>& available,
                                                  bool validation) {
    for (const auto& req : required) {
        if (!Contains(available, req)) {
            throw RenderError(ErrorKind::Instance, "Missing extension " + req);
        }
    }

    std::vector<std::string> extensions = required;

    // GLFW may report only the xcb surface extension on X11 while the surface is created through xlib
    if (Contains(extensions, "VK_KHR_xcb_surface") && !Contains(extensions, "VK_KHR_xlib_surface")) {
        extensions.emplace_back("VK_KHR_xlib_surface");
    }

    if (validation && Contains(available, VK_EXT_DEBUG_UTILS_EXTENSION_NAME)) {
        extensions.emplace_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    return extensions;
}

std::vector<std::string> ChooseValidationLayers(const std::vector<std::string>& available, bool validation) {
    if (!validation) {
        return {};
    }

    if (!Contains(available, kValidationLayerName)) {
        TREKANTEN_LOG_WARN("Validation requested but {} is not available", kValidationLayerName);
        return {};
    }

    return {kValidationLayerName};
}

std::vector<const char*> ToCStrings(const std::vector<std::string>& strings) {
    std::vector<const char*> ptrs;
    ptrs.reserve(strings.size());
    for (const auto& s : strings) {
        ptrs.push_back(s.c_str());
    }
    return ptrs;
}

Instance::Instance(VkInstance raw, std::vector<std::string> extensions, std::vector<std::string> layers)
    : raw_(raw), extensions_(std::move(extensions)), layers_(std::move(layers)) {}

Instance::~Instance() {
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroyInstance(raw_, nullptr);
    }
}

bool Instance::HasExtension(const std::string& name) const {
    return Contains(extensions_, name);
}

std::shared_ptr<Instance> Instance::Create(const std::vector<std::string>& requiredWindowExtensions,
                                           bool enableValidation) {
    const bool validation = enableValidation && !ValidationDisabledByEnvironment();

    auto extensions = ChooseInstanceExtensions(requiredWindowExtensions, AvailableInstanceExtensions(), validation);
    auto layers = ChooseValidationLayers(AvailableInstanceLayers(), validation);

    for (const auto& ext : extensions) {
        TREKANTEN_LOG_TRACE("Choosing instance extension: {}", ext);
    }
    for (const auto& layer : layers) {
        TREKANTEN_LOG_TRACE("Choosing layer: {}", layer);
    }

    const auto extensionPtrs = ToCStrings(extensions);
    const auto layerPtrs = ToCStrings(layers);

    VkApplicationInfo appInfo{};
    appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName = "trekanten";
    appInfo.applicationVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    appInfo.pEngineName = "trekanten";
    appInfo.engineVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    appInfo.apiVersion = VK_API_VERSION_1_2;

    VkInstanceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    createInfo.pApplicationInfo = &appInfo;
    createInfo.enabledExtensionCount = static_cast<uint32_t>(extensionPtrs.size());
    createInfo.ppEnabledExtensionNames = extensionPtrs.data();
    createInfo.enabledLayerCount = static_cast<uint32_t>(layerPtrs.size());
    createInfo.ppEnabledLayerNames = layerPtrs.data();

    VkInstance raw = VK_NULL_HANDLE;
    CheckVk(vkCreateInstance(&createInfo, nullptr, &raw), ErrorKind::Instance, "vkCreateInstance");

    TREKANTEN_LOG_INFO("Created Vulkan instance with {} extensions and {} layers", extensions.size(), layers.size());
    return std::shared_ptr<Instance>(new Instance(raw, std::move(extensions), std::move(layers)));
}

} // namespace trekanten
