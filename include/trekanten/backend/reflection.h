// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

struct DescriptorSetLayoutData {
    uint32_t set_idx = 0;
    std::vector<VkDescriptorSetLayoutBinding> bindings;
};

/**
 * @brief Reflect the descriptor set layouts a shader stage declares
 *
 * Only uniform buffers and combined image samplers in vertex or fragment
 * shaders are supported; anything else throws a Spirv error. Sets are sorted
 * by index and bindings by binding number.
 */
std::vector<DescriptorSetLayoutData> ParseDescriptorSets(const std::vector<uint32_t>& spirv);

// Joins the sets of two stages; a binding present in both gets both stage flags
std::vector<DescriptorSetLayoutData> MergeDescriptorSetLayouts(const std::vector<DescriptorSetLayoutData>& a,
                                                               const std::vector<DescriptorSetLayoutData>& b);

} // namespace trekanten
