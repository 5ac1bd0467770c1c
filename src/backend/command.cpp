// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/command.h"
#include "trekanten/backend/buffer.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/framebuffer.h"
#include "trekanten/backend/image.h"
#include "trekanten/backend/material.h"
#include "trekanten/backend/mesh.h"
#include "trekanten/backend/pipeline.h"
#include "trekanten/backend/render_pass.h"

#include <utility>

namespace trekanten {

CommandBuffer::CommandBuffer(VkDevice device, VkCommandPool pool, VkCommandBuffer raw, VkQueueFlags queueFlags)
    : device_(device), pool_(pool), raw_(raw), queue_flags_(queueFlags) {}

CommandBuffer::~CommandBuffer() {
    Free();
}

CommandBuffer::CommandBuffer(CommandBuffer&& other) noexcept
    : device_(other.device_),
      pool_(other.pool_),
      raw_(std::exchange(other.raw_, VK_NULL_HANDLE)),
      queue_flags_(other.queue_flags_),
      started_(std::exchange(other.started_, false)) {}

CommandBuffer& CommandBuffer::operator=(CommandBuffer&& other) noexcept {
    if (this != &other) {
        Free();
        device_ = other.device_;
        pool_ = other.pool_;
        raw_ = std::exchange(other.raw_, VK_NULL_HANDLE);
        queue_flags_ = other.queue_flags_;
        started_ = std::exchange(other.started_, false);
    }
    return *this;
}

void CommandBuffer::Free() {
    if (raw_ != VK_NULL_HANDLE && pool_ != VK_NULL_HANDLE) {
        vkFreeCommandBuffers(device_, pool_, 1, &raw_);
    }
    raw_ = VK_NULL_HANDLE;
}

void CommandBuffer::RequireGraphics(const char* what) const {
    if (!(queue_flags_ & VK_QUEUE_GRAPHICS_BIT)) {
        throw RenderError(ErrorKind::CommandBuffer, std::string(what) + " requires a graphics queue");
    }
}

CommandBuffer& CommandBuffer::Begin(CommandBufferSubmission submission) {
    VkCommandBufferBeginInfo info{};
    info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    info.flags = submission == CommandBufferSubmission::Single ? VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT : 0;

    CheckVk(vkBeginCommandBuffer(raw_, &info), ErrorKind::CommandBuffer, "vkBeginCommandBuffer");
    started_ = true;
    return *this;
}

CommandBuffer& CommandBuffer::End() {
    if (!started_) {
        throw RenderError(ErrorKind::CommandBuffer, "End called on a command buffer that was never begun");
    }

    CheckVk(vkEndCommandBuffer(raw_), ErrorKind::CommandBuffer, "vkEndCommandBuffer");
    started_ = false;
    return *this;
}

CommandBuffer& CommandBuffer::BeginRenderPass(const RenderPass& renderPass, const Framebuffer& framebuffer,
                                              Extent2D extent) {
    RequireGraphics("BeginRenderPass");

    const auto& clearValues = renderPass.ClearValues();

    VkRenderPassBeginInfo info{};
    info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    info.renderPass = renderPass.GetRaw();
    info.framebuffer = framebuffer.GetRaw();
    info.renderArea.offset = {0, 0};
    info.renderArea.extent = extent;
    info.clearValueCount = static_cast<uint32_t>(clearValues.size());
    info.pClearValues = clearValues.data();

    vkCmdBeginRenderPass(raw_, &info, VK_SUBPASS_CONTENTS_INLINE);
    return *this;
}

CommandBuffer& CommandBuffer::EndRenderPass() {
    RequireGraphics("EndRenderPass");
    vkCmdEndRenderPass(raw_);
    return *this;
}

CommandBuffer& CommandBuffer::BindGraphicsPipeline(const GraphicsPipeline& pipeline) {
    RequireGraphics("BindGraphicsPipeline");
    vkCmdBindPipeline(raw_, GraphicsPipeline::kBindPoint, pipeline.GetRaw());
    return *this;
}

CommandBuffer& CommandBuffer::BindMaterial(const Material& material) {
    return BindGraphicsPipeline(material.GetPipeline());
}

CommandBuffer& CommandBuffer::BindVertexBuffer(const VertexBuffer& buffer) {
    RequireGraphics("BindVertexBuffer");
    const VkBuffer raw = buffer.GetBuffer().GetRaw();
    const VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(raw_, 0, 1, &raw, &offset);
    return *this;
}

CommandBuffer& CommandBuffer::BindIndexBuffer(const IndexBuffer& buffer) {
    RequireGraphics("BindIndexBuffer");
    vkCmdBindIndexBuffer(raw_, buffer.GetBuffer().GetRaw(), 0, IndexBuffer::kIndexType);
    return *this;
}

CommandBuffer& CommandBuffer::BindDescriptorSet(VkDescriptorSet set, const GraphicsPipeline& pipeline) {
    RequireGraphics("BindDescriptorSet");
    vkCmdBindDescriptorSets(raw_, GraphicsPipeline::kBindPoint, pipeline.GetLayout(), 0, 1, &set, 0, nullptr);
    return *this;
}

CommandBuffer& CommandBuffer::DrawIndexed(uint32_t indexCount) {
    RequireGraphics("DrawIndexed");
    vkCmdDrawIndexed(raw_, indexCount, 1, 0, 0, 0);
    return *this;
}

CommandBuffer& CommandBuffer::CopyBuffer(const DeviceBuffer& src, const DeviceBuffer& dst, VkDeviceSize size) {
    VkBufferCopy region{};
    region.srcOffset = 0;
    region.dstOffset = 0;
    region.size = size;
    vkCmdCopyBuffer(raw_, src.GetRaw(), dst.GetRaw(), 1, &region);
    return *this;
}

CommandBuffer& CommandBuffer::CopyBufferToImage(const DeviceBuffer& src, const DeviceImage& dst, uint32_t width,
                                                uint32_t height) {
    VkBufferImageCopy region{};
    region.bufferOffset = 0;
    region.bufferRowLength = 0;
    region.bufferImageHeight = 0;
    region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    region.imageSubresource.mipLevel = 0;
    region.imageSubresource.baseArrayLayer = 0;
    region.imageSubresource.layerCount = 1;
    region.imageOffset = {0, 0, 0};
    region.imageExtent = {width, height, 1};

    vkCmdCopyBufferToImage(raw_, src.GetRaw(), dst.GetRaw(), VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);
    return *this;
}

CommandBuffer& CommandBuffer::PipelineBarrier(const VkImageMemoryBarrier& barrier, VkPipelineStageFlags srcStage,
                                              VkPipelineStageFlags dstStage) {
    vkCmdPipelineBarrier(raw_, srcStage, dstStage, 0, 0, nullptr, 0, nullptr, 1, &barrier);
    return *this;
}

CommandBuffer& CommandBuffer::BlitImage(VkImage src, VkImage dst, const VkImageBlit& blit) {
    RequireGraphics("BlitImage");
    vkCmdBlitImage(raw_, src, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, dst, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &blit,
                   VK_FILTER_LINEAR);
    return *this;
}

CommandPool::CommandPool(std::shared_ptr<Device> device, uint32_t queueFamily, VkQueueFlags queueFlags)
    : device_(std::move(device)), queue_flags_(queueFlags) {
    VkCommandPoolCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    info.queueFamilyIndex = queueFamily;

    CheckVk(vkCreateCommandPool(device_->GetRaw(), &info, nullptr, &raw_), ErrorKind::CommandPool,
            "vkCreateCommandPool");
}

CommandPool CommandPool::Graphics(std::shared_ptr<Device> device) {
    const QueueFamily family = device->GraphicsQueue().GetFamily();
    return CommandPool(std::move(device), family.index, family.props.queueFlags);
}

CommandPool CommandPool::Util(std::shared_ptr<Device> device) {
    const QueueFamily family = device->UtilQueue().GetFamily();
    return CommandPool(std::move(device), family.index, family.props.queueFlags);
}

CommandPool::~CommandPool() {
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroyCommandPool(device_->GetRaw(), raw_, nullptr);
    }
}

CommandPool::CommandPool(CommandPool&& other) noexcept
    : device_(std::move(other.device_)),
      raw_(std::exchange(other.raw_, VK_NULL_HANDLE)),
      queue_flags_(other.queue_flags_) {}

CommandPool& CommandPool::operator=(CommandPool&& other) noexcept {
    if (this != &other) {
        if (raw_ != VK_NULL_HANDLE) {
            vkDestroyCommandPool(device_->GetRaw(), raw_, nullptr);
        }
        device_ = std::move(other.device_);
        raw_ = std::exchange(other.raw_, VK_NULL_HANDLE);
        queue_flags_ = other.queue_flags_;
    }
    return *this;
}

std::vector<CommandBuffer> CommandPool::CreateCommandBuffers(uint32_t count) const {
    VkCommandBufferAllocateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    info.commandPool = raw_;
    info.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    info.commandBufferCount = count;

    std::vector<VkCommandBuffer> raws(count);
    CheckVk(vkAllocateCommandBuffers(device_->GetRaw(), &info, raws.data()), ErrorKind::CommandBuffer,
            "vkAllocateCommandBuffers");

    std::vector<CommandBuffer> buffers;
    buffers.reserve(count);
    for (VkCommandBuffer raw : raws) {
        buffers.emplace_back(device_->GetRaw(), raw_, raw, queue_flags_);
    }
    return buffers;
}

CommandBuffer CommandPool::CreateCommandBuffer() const {
    auto buffers = CreateCommandBuffers(1);
    return std::move(buffers.front());
}

CommandBuffer CommandPool::BeginSingleSubmit() const {
    CommandBuffer cmd = CreateCommandBuffer();
    cmd.BeginSingleSubmit();
    return cmd;
}

} // namespace trekanten
