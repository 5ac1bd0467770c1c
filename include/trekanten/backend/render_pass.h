// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <array>
#include <memory>
#include <vulkan/vulkan.h>

namespace trekanten {

class Device;

/**
 * @brief Single subpass pass with one color and one depth attachment
 *
 * The color attachment is cleared and ends up ready for presentation; depth is
 * cleared to 1.0 and discarded after the pass.
 */
class RenderPass {
public:
    RenderPass(std::shared_ptr<Device> device, VkFormat colorFormat, VkFormat depthFormat);
    ~RenderPass();

    RenderPass(const RenderPass&) = delete;
    RenderPass& operator=(const RenderPass&) = delete;
    RenderPass(RenderPass&& other) noexcept;
    RenderPass& operator=(RenderPass&& other) noexcept;

    VkRenderPass GetRaw() const { return raw_; }

    // Color first, then depth; matches the attachment order
    const std::array<VkClearValue, 2>& ClearValues() const { return clear_values_; }

private:
    void Destroy();

    std::shared_ptr<Device> device_;
    VkRenderPass raw_ = VK_NULL_HANDLE;
    std::array<VkClearValue, 2> clear_values_{};
};

} // namespace trekanten
