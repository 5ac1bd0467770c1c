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
class DeviceBuffer;
class DeviceImage;
class Framebuffer;
class GraphicsPipeline;
class IndexBuffer;
class Material;
class RenderPass;
class VertexBuffer;

enum class CommandBufferSubmission {
    Single,
    Multi,
};

/**
 * @brief Primary command buffer, recorded through a chain of calls
 *
 * Every recording call returns the buffer itself. Graphics commands throw a
 * RenderError of kind CommandBuffer when the pool's queue family cannot do
 * graphics, before anything reaches Vulkan.
 */
class CommandBuffer {
public:
    CommandBuffer(VkDevice device, VkCommandPool pool, VkCommandBuffer raw, VkQueueFlags queueFlags);
    ~CommandBuffer();

    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;
    CommandBuffer(CommandBuffer&& other) noexcept;
    CommandBuffer& operator=(CommandBuffer&& other) noexcept;

    VkCommandBuffer GetRaw() const { return raw_; }
    bool IsStarted() const { return started_; }
    VkQueueFlags GetQueueFlags() const { return queue_flags_; }

    CommandBuffer& Begin(CommandBufferSubmission submission);
    CommandBuffer& BeginSingleSubmit() { return Begin(CommandBufferSubmission::Single); }
    CommandBuffer& End();

    CommandBuffer& BeginRenderPass(const RenderPass& renderPass, const Framebuffer& framebuffer, Extent2D extent);
    CommandBuffer& EndRenderPass();

    CommandBuffer& BindGraphicsPipeline(const GraphicsPipeline& pipeline);
    CommandBuffer& BindMaterial(const Material& material);
    CommandBuffer& BindVertexBuffer(const VertexBuffer& buffer);
    CommandBuffer& BindIndexBuffer(const IndexBuffer& buffer);
    CommandBuffer& BindDescriptorSet(VkDescriptorSet set, const GraphicsPipeline& pipeline);
    CommandBuffer& DrawIndexed(uint32_t indexCount);

    CommandBuffer& CopyBuffer(const DeviceBuffer& src, const DeviceBuffer& dst, VkDeviceSize size);
    CommandBuffer& CopyBufferToImage(const DeviceBuffer& src, const DeviceImage& dst, uint32_t width, uint32_t height);
    CommandBuffer& PipelineBarrier(const VkImageMemoryBarrier& barrier, VkPipelineStageFlags srcStage,
                                   VkPipelineStageFlags dstStage);
    CommandBuffer& BlitImage(VkImage src, VkImage dst, const VkImageBlit& blit);

private:
    void RequireGraphics(const char* what) const;
    void Free();

    VkDevice device_ = VK_NULL_HANDLE;
    VkCommandPool pool_ = VK_NULL_HANDLE;
    VkCommandBuffer raw_ = VK_NULL_HANDLE;
    VkQueueFlags queue_flags_ = 0;
    bool started_ = false;
};

class CommandPool {
public:
    static CommandPool Graphics(std::shared_ptr<Device> device);
    static CommandPool Util(std::shared_ptr<Device> device);

    ~CommandPool();

    CommandPool(const CommandPool&) = delete;
    CommandPool& operator=(const CommandPool&) = delete;
    CommandPool(CommandPool&& other) noexcept;
    CommandPool& operator=(CommandPool&& other) noexcept;

    VkCommandPool GetRaw() const { return raw_; }

    CommandBuffer CreateCommandBuffer() const;
    std::vector<CommandBuffer> CreateCommandBuffers(uint32_t count) const;
    CommandBuffer BeginSingleSubmit() const;

private:
    CommandPool(std::shared_ptr<Device> device, uint32_t queueFamily, VkQueueFlags queueFlags);

    std::shared_ptr<Device> device_;
    VkCommandPool raw_ = VK_NULL_HANDLE;
    VkQueueFlags queue_flags_ = 0;
};

} // namespace trekanten
