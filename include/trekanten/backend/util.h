// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <vulkan/vulkan.h>

namespace trekanten {

struct Extent2D {
    uint32_t width = 0;
    uint32_t height = 0;

    Extent2D() = default;
    Extent2D(uint32_t w, uint32_t h) : width(w), height(h) {}
    explicit Extent2D(const VkExtent2D& e) : width(e.width), height(e.height) {}

    operator VkExtent2D() const { return VkExtent2D{width, height}; }

    // A minimized window reports an empty framebuffer
    bool IsEmpty() const { return width == 0 || height == 0; }

    bool operator==(const Extent2D& other) const { return width == other.width && height == other.height; }
    bool operator!=(const Extent2D& other) const { return !(*this == other); }
};

struct Extent3D {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t depth = 0;

    static Extent3D From2D(const Extent2D& e, uint32_t depth) { return Extent3D{e.width, e.height, depth}; }

    operator VkExtent3D() const { return VkExtent3D{width, height, depth}; }
};

/// First channel is the lowest address, last is the highest (same as Vulkan).
enum class ComponentLayout {
    R8G8B8A8,
    B8G8R8A8,
};

enum class ColorSpace {
    Linear,
    Srgb,
};

struct Format {
    ComponentLayout component_layout = ComponentLayout::R8G8B8A8;
    ColorSpace color_space = ColorSpace::Srgb;

    // Throws RenderError for formats without a mapping
    static Format FromVk(VkFormat format);
    VkFormat ToVk() const;

    bool operator==(const Format& other) const {
        return component_layout == other.component_layout && color_space == other.color_space;
    }
    bool operator!=(const Format& other) const { return !(*this == other); }
};

} // namespace trekanten
