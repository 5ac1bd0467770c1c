// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/vertex.h"

#include <algorithm>

namespace trekanten {

bool VertexDescription::operator==(const VertexDescription& other) const {
    const auto sameBinding = [](const VkVertexInputBindingDescription& l, const VkVertexInputBindingDescription& r) {
        return l.binding == r.binding && l.stride == r.stride && l.inputRate == r.inputRate;
    };
    const auto sameAttribute = [](const VkVertexInputAttributeDescription& l,
                                  const VkVertexInputAttributeDescription& r) {
        return l.location == r.location && l.binding == r.binding && l.format == r.format && l.offset == r.offset;
    };

    return bindings.size() == other.bindings.size() && attributes.size() == other.attributes.size() &&
           std::equal(bindings.begin(), bindings.end(), other.bindings.begin(), sameBinding) &&
           std::equal(attributes.begin(), attributes.end(), other.attributes.begin(), sameAttribute);
}

} // namespace trekanten
