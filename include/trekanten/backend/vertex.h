// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

struct VertexDescription {
    std::vector<VkVertexInputBindingDescription> bindings;
    std::vector<VkVertexInputAttributeDescription> attributes;

    bool operator==(const VertexDescription& other) const;
    bool operator!=(const VertexDescription& other) const { return !(*this == other); }
};

/**
 * @brief Collect the vertex input layout of a vertex type
 *
 * V provides static BindingDescription() and AttributeDescription(), the
 * latter returning a container of VkVertexInputAttributeDescription.
 */
template <typename V>
VertexDescription VertexDescriptionOf() {
    VertexDescription desc;
    desc.bindings.push_back(V::BindingDescription());
    const auto attributes = V::AttributeDescription();
    desc.attributes.assign(attributes.begin(), attributes.end());
    return desc;
}

} // namespace trekanten
