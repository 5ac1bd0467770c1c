// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

constexpr const char* kDisableValidationLayersEnvVar = "TREK_DISABLE_VALIDATION_LAYERS";
constexpr const char* kValidationLayerName = "VK_LAYER_KHRONOS_validation";

// True when TREK_DISABLE_VALIDATION_LAYERS is set
bool ValidationDisabledByEnvironment();

/**
 * @brief Pick the instance extensions to enable
 *
 * Every required window extension must be available, otherwise a RenderError
 * of kind Instance is thrown. The xlib surface extension is appended when only
 * xcb is required, and debug utils when validation is on and it is available.
 */
std::vector<std::string> ChooseInstanceExtensions(const std::vector<std::string>& required,
                                                  const std::vector<std::string>& available,
                                                  bool validation);

// Returns the validation layer if requested and available, else nothing.
std::vector<std::string> ChooseValidationLayers(const std::vector<std::string>& available, bool validation);

class Instance {
public:
    static std::shared_ptr<Instance> Create(const std::vector<std::string>& requiredWindowExtensions,
                                            bool enableValidation);

    ~Instance();

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    VkInstance GetRaw() const { return raw_; }

    bool HasExtension(const std::string& name) const;
    const std::vector<std::string>& GetEnabledExtensions() const { return extensions_; }
    const std::vector<std::string>& GetEnabledLayers() const { return layers_; }

private:
    Instance(VkInstance raw, std::vector<std::string> extensions, std::vector<std::string> layers);

    VkInstance raw_ = VK_NULL_HANDLE;
    std::vector<std::string> extensions_;
    std::vector<std::string> layers_;
};

// Converts owned strings to the pointer array Vulkan create infos expect.
std::vector<const char*> ToCStrings(const std::vector<std::string>& strings);

} // namespace trekanten
