// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/reflection.h"
#include "trekanten/backend/error.h"
#include "trekanten/core/log.h"

#include <algorithm>
#include <fmt/format.h>
#include <map>
#include <spirv_reflect.h>

namespace trekanten {
namespace {

// Owns the reflection data for one module
class ReflectModule {
public:
    explicit ReflectModule(const std::vector<uint32_t>& spirv) {
        const SpvReflectResult result =
            spvReflectCreateShaderModule(spirv.size() * sizeof(uint32_t), spirv.data(), &module_);
        if (result != SPV_REFLECT_RESULT_SUCCESS) {
            throw RenderError(ErrorKind::Spirv,
                              fmt::format("Failed to create reflection module ({})", static_cast<int>(result)));
        }
    }

    ~ReflectModule() { spvReflectDestroyShaderModule(&module_); }

    ReflectModule(const ReflectModule&) = delete;
    ReflectModule& operator=(const ReflectModule&) = delete;

    const SpvReflectShaderModule& Get() const { return module_; }

private:
    SpvReflectShaderModule module_{};
};

VkDescriptorType ConvertDescriptorType(SpvReflectDescriptorType type) {
    switch (type) {
    case SPV_REFLECT_DESCRIPTOR_TYPE_UNIFORM_BUFFER:
        return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    case SPV_REFLECT_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER:
        return VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    default:
        throw RenderError(ErrorKind::Spirv,
                          fmt::format("Unsupported descriptor type {}", static_cast<int>(type)));
    }
}

VkShaderStageFlags ConvertShaderStage(SpvReflectShaderStageFlagBits stage) {
    switch (stage) {
    case SPV_REFLECT_SHADER_STAGE_VERTEX_BIT:
        return VK_SHADER_STAGE_VERTEX_BIT;
    case SPV_REFLECT_SHADER_STAGE_FRAGMENT_BIT:
        return VK_SHADER_STAGE_FRAGMENT_BIT;
    default:
        throw RenderError(ErrorKind::Spirv, fmt::format("Unsupported shader stage {}", static_cast<int>(stage)));
    }
}

} // namespace

std::vector<DescriptorSetLayoutData> ParseDescriptorSets(const std::vector<uint32_t>& spirv) {
    ReflectModule module(spirv);
    const VkShaderStageFlags stage = ConvertShaderStage(module.Get().shader_stage);

    uint32_t count = 0;
    SpvReflectResult result = spvReflectEnumerateDescriptorSets(&module.Get(), &count, nullptr);
    if (result != SPV_REFLECT_RESULT_SUCCESS) {
        throw RenderError(ErrorKind::Spirv, "Failed to enumerate descriptor sets");
    }

    std::vector<SpvReflectDescriptorSet*> sets(count);
    result = spvReflectEnumerateDescriptorSets(&module.Get(), &count, sets.data());
    if (result != SPV_REFLECT_RESULT_SUCCESS) {
        throw RenderError(ErrorKind::Spirv, "Failed to enumerate descriptor sets");
    }

    std::vector<DescriptorSetLayoutData> layouts;
    layouts.reserve(count);
    for (const SpvReflectDescriptorSet* set : sets) {
        DescriptorSetLayoutData data;
        data.set_idx = set->set;
        data.bindings.reserve(set->binding_count);

        for (uint32_t i = 0; i < set->binding_count; ++i) {
            const SpvReflectDescriptorBinding& refl = *set->bindings[i];

            VkDescriptorSetLayoutBinding binding{};
            binding.binding = refl.binding;
            binding.descriptorType = ConvertDescriptorType(refl.descriptor_type);
            binding.descriptorCount = 1;
            binding.stageFlags = stage;
            data.bindings.push_back(binding);

            TREKANTEN_LOG_TRACE("Reflected set {} binding {} ({})", data.set_idx, binding.binding,
                                refl.name != nullptr ? refl.name : "");
        }

        std::sort(data.bindings.begin(), data.bindings.end(),
                  [](const auto& l, const auto& r) { return l.binding < r.binding; });
        layouts.push_back(std::move(data));
    }

    std::sort(layouts.begin(), layouts.end(), [](const auto& l, const auto& r) { return l.set_idx < r.set_idx; });
    return layouts;
}

std::vector<DescriptorSetLayoutData> MergeDescriptorSetLayouts(const std::vector<DescriptorSetLayoutData>& a,
                                                               const std::vector<DescriptorSetLayoutData>& b) {
    std::map<uint32_t, std::map<uint32_t, VkDescriptorSetLayoutBinding>> merged;

    for (const auto* layouts : {&a, &b}) {
        for (const auto& set : *layouts) {
            auto& bindings = merged[set.set_idx];
            for (const auto& binding : set.bindings) {
                auto it = bindings.find(binding.binding);
                if (it == bindings.end()) {
                    bindings.emplace(binding.binding, binding);
                    continue;
                }
                if (it->second.descriptorType != binding.descriptorType) {
                    throw RenderError(ErrorKind::Spirv,
                                      fmt::format("Set {} binding {} has conflicting descriptor types",
                                                  set.set_idx, binding.binding));
                }
                it->second.stageFlags |= binding.stageFlags;
            }
        }
    }

    std::vector<DescriptorSetLayoutData> result;
    result.reserve(merged.size());
    for (const auto& [setIdx, bindings] : merged) {
        DescriptorSetLayoutData data;
        data.set_idx = setIdx;
        for (const auto& [bindingIdx, binding] : bindings) {
            data.bindings.push_back(binding);
        }
        result.push_back(std::move(data));
    }
    return result;
}

} // namespace trekanten
