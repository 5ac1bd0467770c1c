// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/util.h"

#include <memory>
#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

class Device;
class RenderPass;

class Framebuffer {
public:
    Framebuffer(std::shared_ptr<Device> device, const std::vector<VkImageView>& attachments,
                const RenderPass& renderPass, Extent2D extent);
    ~Framebuffer();

    Framebuffer(const Framebuffer&) = delete;
    Framebuffer& operator=(const Framebuffer&) = delete;
    Framebuffer(Framebuffer&& other) noexcept;
    Framebuffer& operator=(Framebuffer&& other) noexcept;

    VkFramebuffer GetRaw() const { return raw_; }

private:
    void Destroy();

    std::shared_ptr<Device> device_;
    VkFramebuffer raw_ = VK_NULL_HANDLE;
};

} // namespace trekanten
