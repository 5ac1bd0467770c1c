// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/util.h"
#include "trekanten/backend/error.h"

#include <fmt/format.h>

namespace trekanten {

Format Format::FromVk(VkFormat format) {
    switch (format) {
    case VK_FORMAT_R8G8B8A8_SRGB: return Format{ComponentLayout::R8G8B8A8, ColorSpace::Srgb};
    case VK_FORMAT_R8G8B8A8_UNORM: return Format{ComponentLayout::R8G8B8A8, ColorSpace::Linear};
    case VK_FORMAT_B8G8R8A8_SRGB: return Format{ComponentLayout::B8G8R8A8, ColorSpace::Srgb};
    case VK_FORMAT_B8G8R8A8_UNORM: return Format{ComponentLayout::B8G8R8A8, ColorSpace::Linear};
    default:
        throw RenderError(ErrorKind::Memory, fmt::format("unsupported VkFormat {}", static_cast<int>(format)));
    }
}

VkFormat Format::ToVk() const {
    const bool srgb = color_space == ColorSpace::Srgb;
    switch (component_layout) {
    case ComponentLayout::R8G8B8A8: return srgb ? VK_FORMAT_R8G8B8A8_SRGB : VK_FORMAT_R8G8B8A8_UNORM;
    case ComponentLayout::B8G8R8A8: return srgb ? VK_FORMAT_B8G8R8A8_SRGB : VK_FORMAT_B8G8R8A8_UNORM;
    }
    return VK_FORMAT_UNDEFINED;
}

} // namespace trekanten
