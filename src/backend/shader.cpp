// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/shader.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"

#include <cstring>
#include <fmt/format.h>
#include <fstream>

namespace trekanten {

std::vector<uint32_t> ReadSpirv(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw RenderError(ErrorKind::Pipeline, fmt::format("Failed to open shader file {}", path.string()));
    }

    const std::streamsize size = file.tellg();
    if (size <= 0 || size % 4 != 0) {
        throw RenderError(ErrorKind::Pipeline,
                          fmt::format("Shader file {} has invalid size {}", path.string(), static_cast<long long>(size)));
    }

    std::vector<uint32_t> words(static_cast<size_t>(size) / 4);
    file.seekg(0);
    if (!file.read(reinterpret_cast<char*>(words.data()), size)) {
        throw RenderError(ErrorKind::Pipeline, fmt::format("Failed to read shader file {}", path.string()));
    }

    if (words.front() != kSpirvMagic) {
        throw RenderError(ErrorKind::Pipeline, fmt::format("{} is not a SPIR-V binary", path.string()));
    }

    return words;
}

ShaderModule::ShaderModule(std::shared_ptr<Device> device, const std::vector<uint32_t>& code)
    : device_(std::move(device)) {
    VkShaderModuleCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    info.codeSize = code.size() * sizeof(uint32_t);
    info.pCode = code.data();

    CheckVk(vkCreateShaderModule(device_->GetRaw(), &info, nullptr, &raw_), ErrorKind::Pipeline,
            "vkCreateShaderModule");
}

ShaderModule::~ShaderModule() {
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroyShaderModule(device_->GetRaw(), raw_, nullptr);
    }
}

} // namespace trekanten
