// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/framebuffer.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/render_pass.h"

#include <utility>

namespace trekanten {

Framebuffer::Framebuffer(std::shared_ptr<Device> device, const std::vector<VkImageView>& attachments,
                         const RenderPass& renderPass, Extent2D extent)
    : device_(std::move(device)) {
    VkFramebufferCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
    info.renderPass = renderPass.GetRaw();
    info.attachmentCount = static_cast<uint32_t>(attachments.size());
    info.pAttachments = attachments.data();
    info.width = extent.width;
    info.height = extent.height;
    info.layers = 1;

    CheckVk(vkCreateFramebuffer(device_->GetRaw(), &info, nullptr, &raw_), ErrorKind::Framebuffer,
            "vkCreateFramebuffer");
}

Framebuffer::~Framebuffer() {
    Destroy();
}

void Framebuffer::Destroy() {
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroyFramebuffer(device_->GetRaw(), raw_, nullptr);
        raw_ = VK_NULL_HANDLE;
    }
}

Framebuffer::Framebuffer(Framebuffer&& other) noexcept
    : device_(std::move(other.device_)), raw_(std::exchange(other.raw_, VK_NULL_HANDLE)) {}

Framebuffer& Framebuffer::operator=(Framebuffer&& other) noexcept {
    if (this != &other) {
        Destroy();
        device_ = std::move(other.device_);
        raw_ = std::exchange(other.raw_, VK_NULL_HANDLE);
    }
    return *this;
}

} // namespace trekanten
