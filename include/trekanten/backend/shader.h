// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

class Device;

constexpr uint32_t kSpirvMagic = 0x07230203;

/**
 * @brief Read a SPIR-V binary into 32-bit words
 *
 * Throws a Pipeline error if the file cannot be read, its size is not a
 * multiple of four, or it does not start with the SPIR-V magic number.
 */
std::vector<uint32_t> ReadSpirv(const std::filesystem::path& path);

class ShaderModule {
public:
    ShaderModule(std::shared_ptr<Device> device, const std::vector<uint32_t>& code);
    ~ShaderModule();

    ShaderModule(const ShaderModule&) = delete;
    ShaderModule& operator=(const ShaderModule&) = delete;

    VkShaderModule GetRaw() const { return raw_; }

private:
    std::shared_ptr<Device> device_;
    VkShaderModule raw_ = VK_NULL_HANDLE;
};

} // namespace trekanten
