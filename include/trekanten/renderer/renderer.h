// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/attachment.h"
#include "trekanten/backend/command.h"
#include "trekanten/backend/debug_utils.h"
#include "trekanten/backend/descriptor.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/framebuffer.h"
#include "trekanten/backend/material.h"
#include "trekanten/backend/mesh.h"
#include "trekanten/backend/render_pass.h"
#include "trekanten/backend/swapchain.h"
#include "trekanten/backend/sync.h"
#include "trekanten/backend/texture.h"
#include "trekanten/backend/uniform.h"
#include "trekanten/core/config.h"
#include "trekanten/renderer/frame_scheduler.h"
#include "trekanten/resource/resource_manager.h"

#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace trekanten {

class Device;
class Instance;
class Surface;
class Window;

struct FrameSynchronization {
    Semaphore image_available;
    Semaphore render_done;
    Fence in_flight;

    explicit FrameSynchronization(VkDevice device)
        : image_available(device), render_done(device), in_flight(Fence::Signaled(device)) {}
};

// Everything recorded for one frame in flight
class Frame {
public:
    Frame(u32 frameIdx, u32 swapchainImageIdx, CommandPool gfxCommandPool)
        : frame_idx_(frameIdx), swapchain_image_idx_(swapchainImageIdx), gfx_command_pool_(std::move(gfxCommandPool)) {}

    Frame(Frame&&) = default;
    Frame& operator=(Frame&&) = default;

    u32 FrameIdx() const { return frame_idx_; }
    u32 SwapchainImageIdx() const { return swapchain_image_idx_; }

    CommandBuffer NewCommandBuffer() const { return gfx_command_pool_.CreateCommandBuffer(); }
    void AddCommandBuffer(CommandBuffer cmd) { recorded_command_buffers_.push_back(std::move(cmd)); }

    const std::vector<CommandBuffer>& RecordedCommandBuffers() const { return recorded_command_buffers_; }

private:
    u32 frame_idx_;
    u32 swapchain_image_idx_;
    // Declared before the buffers so the buffers are freed first
    CommandPool gfx_command_pool_;
    std::vector<CommandBuffer> recorded_command_buffers_;
};

/**
 * @brief Owns the whole Vulkan stack and drives frames
 *
 * Resources are created through the ResourceManager interfaces and
 * addressed by handles, which stay valid across Resize.
 */
constexpr u32 kDescriptorSetPairs = 16;

class Renderer : public ResourceManager<VertexBufferDescriptor, VertexBuffer>,
                 public ResourceManager<IndexBufferDescriptor, IndexBuffer>,
                 public ResourceManager<MaterialDescriptor, Material>,
                 public ResourceManager<UniformBufferDescriptor, UniformBuffer>,
                 public ResourceManager<TextureDescriptor, Texture> {
public:
    Renderer(const Window& window, const config::AppConfig& config);
    ~Renderer() override;

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Throws a NeedsResize error when the swapchain has to be recreated first
    Frame NextFrame();
    void Submit(Frame frame);
    void Resize(Extent2D extent);

    const VertexBuffer* GetResource(const VertexBufferHandle& h) const override;
    VertexBufferHandle CreateResource(const VertexBufferDescriptor& descriptor) override;

    const IndexBuffer* GetResource(const IndexBufferHandle& h) const override;
    IndexBufferHandle CreateResource(const IndexBufferDescriptor& descriptor) override;

    const Material* GetResource(const MaterialHandle& h) const override;
    MaterialHandle CreateResource(const MaterialDescriptor& descriptor) override;

    // Returns the copy for the current frame slot
    const UniformBuffer* GetResource(const UniformBufferHandle& h) const override;
    UniformBufferHandle CreateResource(const UniformBufferDescriptor& descriptor) override;

    const Texture* GetResource(const TextureHandle& h) const override;
    TextureHandle CreateResource(const TextureDescriptor& descriptor) override;

    DescriptorSetHandle CreateDescriptorSet(const MaterialHandle& material, const UniformBufferHandle& uniformBuffer,
                                            std::optional<TextureHandle> texture = std::nullopt);
    VkDescriptorSet GetDescriptorSet(const DescriptorSetHandle& h, u32 frameIdx) const;

    const UniformBuffer* GetUniformBuffer(const UniformBufferHandle& h, u32 frameIdx) const {
        return uniform_buffers_.Get(h, frameIdx);
    }

    template <typename T>
    void UpdateUniformBuffer(const Frame& frame, const UniformBufferHandle& h, const T& value) {
        UniformBuffer* ubo = uniform_buffers_.GetMut(h, frame.FrameIdx());
        if (ubo == nullptr) {
            throw RenderError(ErrorKind::UniformBuffer, "Unknown uniform buffer handle");
        }
        ubo->UpdateWith(value);
    }

    const RenderPass& GetRenderPass() const { return *render_pass_; }
    Extent2D SwapchainExtent() const { return swapchain_->Info().extent; }
    const Framebuffer& GetFramebuffer(const Frame& frame) const;

private:
    void CreateSwapchainResources(Extent2D extent, const Swapchain* old);
    void RecreateFrameSynchronization();

    config::AppConfig config_;

    std::shared_ptr<Instance> instance_;
    std::unique_ptr<DebugUtils> debug_utils_;
    std::shared_ptr<Surface> surface_;
    std::shared_ptr<Device> device_;

    std::unique_ptr<Swapchain> swapchain_;
    std::unique_ptr<RenderPass> render_pass_;
    std::unique_ptr<DepthBuffer> depth_buffer_;
    std::vector<Framebuffer> framebuffers_;

    std::vector<FrameSynchronization> frame_synchronization_;
    FrameScheduler scheduler_;
    std::array<std::optional<Frame>, kMaxFramesInFlight> frames_;

    std::unique_ptr<CommandPool> util_command_pool_;

    Storage<VertexBuffer> vertex_buffers_;
    Storage<IndexBuffer> index_buffers_;
    Storage<Material> materials_;
    UniformBuffers uniform_buffers_;
    Textures textures_;
    std::unique_ptr<DescriptorSets> descriptor_sets_;
};

} // namespace trekanten
