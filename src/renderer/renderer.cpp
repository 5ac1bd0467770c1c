// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/renderer/renderer.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/instance.h"
#include "trekanten/backend/surface.h"
#include "trekanten/core/log.h"
#include "trekanten/window/window.h"


namespace trekanten {

Renderer::Renderer(const Window& window, const config::AppConfig& config) : config_(config) {
    instance_ = Instance::Create(window.RequiredInstanceExtensions(), config_.enable_validation);
    debug_utils_ = std::make_unique<DebugUtils>(instance_);
    surface_ = window.CreateSurface(instance_);
    device_ = Device::Create(instance_, surface_);

    CreateSwapchainResources(window.Extents(), nullptr);

    RecreateFrameSynchronization();

    util_command_pool_ = std::make_unique<CommandPool>(CommandPool::Util(device_));
    descriptor_sets_ = std::make_unique<DescriptorSets>(device_, kDescriptorSetPairs);

    TREKANTEN_LOG_INFO("Renderer initialized");
}

Renderer::~Renderer() {
    try {
        if (device_) {
            device_->WaitIdle();
        }
    } catch (const RenderError& e) {
        TREKANTEN_LOG_ERROR("Failed to wait for device idle during shutdown: {}", e.what());
    }
}

void Renderer::RecreateFrameSynchronization() {
    frame_synchronization_.clear();
    frame_synchronization_.reserve(kMaxFramesInFlight);
    for (u32 i = 0; i < kMaxFramesInFlight; ++i) {
        frame_synchronization_.emplace_back(device_->GetRaw());
    }
}

void Renderer::CreateSwapchainResources(Extent2D extent, const Swapchain* old) {
    if (extent.IsEmpty()) {
        throw RenderError(ErrorKind::Swapchain, "Cannot create a swapchain for an empty extent");
    }

    std::unique_ptr<Swapchain> swapchain;
    try {
        swapchain = std::make_unique<Swapchain>(device_, extent, config_.vsync, old);
    } catch (const RenderError& e) {
        throw RenderError::Wrap(ErrorKind::Device, e);
    }

    // The render pass only depends on formats, which survive a resize
    if (!render_pass_) {
        render_pass_ = std::make_unique<RenderPass>(device_, swapchain->Info().format, device_->DepthFormat());
    }

    framebuffers_.clear();
    depth_buffer_.reset();
    swapchain_ = std::move(swapchain);

    depth_buffer_ = std::make_unique<DepthBuffer>(device_, swapchain_->Info().extent);
    framebuffers_ = swapchain_->CreateFramebuffersFor(*render_pass_, *depth_buffer_);
    scheduler_.Reset(swapchain_->NumImages());
}

Frame Renderer::NextFrame() {
    const u32 frameIdx = scheduler_.FrameIdx();
    FrameSynchronization& sync = frame_synchronization_[frameIdx];
    sync.in_flight.BlockingWait();

    const u32 imageIdx = swapchain_->AcquireNextImage(sync.image_available);

    // The image may still be rendered to by another frame in flight
    if (const auto bound = scheduler_.BoundFrame(imageIdx); bound && *bound != frameIdx) {
        frame_synchronization_[*bound].in_flight.BlockingWait();
    }

    frames_[frameIdx].reset();

    CommandPool pool = CommandPool::Graphics(device_);
    scheduler_.BindImage(imageIdx);

    return Frame(frameIdx, imageIdx, std::move(pool));
}

void Renderer::Submit(Frame frame) {
    scheduler_.CheckCurrent(frame.FrameIdx());
    const u32 frameIdx = scheduler_.FrameIdx();

    FrameSynchronization& sync = frame_synchronization_[frameIdx];

    std::vector<VkCommandBuffer> cmds;
    cmds.reserve(frame.RecordedCommandBuffers().size());
    for (const auto& cmd : frame.RecordedCommandBuffers()) {
        cmds.push_back(cmd.GetRaw());
    }

    const VkSemaphore waitSemaphore = sync.image_available.GetRaw();
    const VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    const VkSemaphore signalSemaphore = sync.render_done.GetRaw();

    VkSubmitInfo submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.waitSemaphoreCount = 1;
    submitInfo.pWaitSemaphores = &waitSemaphore;
    submitInfo.pWaitDstStageMask = &waitStage;
    submitInfo.commandBufferCount = static_cast<uint32_t>(cmds.size());
    submitInfo.pCommandBuffers = cmds.data();
    submitInfo.signalSemaphoreCount = 1;
    submitInfo.pSignalSemaphores = &signalSemaphore;

    sync.in_flight.Reset();
    try {
        device_->GraphicsQueue().Submit(submitInfo, &sync.in_flight);
    } catch (const RenderError& e) {
        // The fence would never signal and image_available stays pending, so the slot gets fresh objects
        TREKANTEN_LOG_ERROR("Frame {} submit failed: {}", frameIdx, e.what());
        device_->WaitIdle();
        frame_synchronization_[frameIdx] = FrameSynchronization(device_->GetRaw());
        throw;
    }

    const VkSwapchainKHR swapchain = swapchain_->GetRaw();
    const uint32_t imageIdx = frame.SwapchainImageIdx();

    VkPresentInfoKHR presentInfo{};
    presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    presentInfo.waitSemaphoreCount = 1;
    presentInfo.pWaitSemaphores = &signalSemaphore;
    presentInfo.swapchainCount = 1;
    presentInfo.pSwapchains = &swapchain;
    presentInfo.pImageIndices = &imageIdx;

    // The frame has been submitted either way, so it is kept alive until its fence signals
    frames_[frameIdx] = std::move(frame);
    scheduler_.Advance();

    swapchain_->EnqueuePresent(device_->PresentQueue(), presentInfo);
}

void Renderer::Resize(Extent2D extent) {
    device_->WaitIdle();

    TREKANTEN_LOG_DEBUG("Resizing swapchain to {}x{}", extent.width, extent.height);
    CreateSwapchainResources(extent, swapchain_.get());

    // A semaphore signalled by an acquire or left waiting by a failed present must not be reused
    RecreateFrameSynchronization();

    for (Material& material : materials_) {
        material.Recreate(device_, *render_pass_, swapchain_->Info().extent);
    }
}

const Framebuffer& Renderer::GetFramebuffer(const Frame& frame) const {
    return framebuffers_.at(frame.SwapchainImageIdx());
}

const VertexBuffer* Renderer::GetResource(const VertexBufferHandle& h) const {
    return vertex_buffers_.Get(h);
}

VertexBufferHandle Renderer::CreateResource(const VertexBufferDescriptor& descriptor) {
    return vertex_buffers_.Add(
        VertexBuffer::Create(device_, device_->UtilQueue(), *util_command_pool_, descriptor));
}

const IndexBuffer* Renderer::GetResource(const IndexBufferHandle& h) const {
    return index_buffers_.Get(h);
}

IndexBufferHandle Renderer::CreateResource(const IndexBufferDescriptor& descriptor) {
    return index_buffers_.Add(IndexBuffer::Create(device_, device_->UtilQueue(), *util_command_pool_, descriptor));
}

const Material* Renderer::GetResource(const MaterialHandle& h) const {
    return materials_.Get(h);
}

MaterialHandle Renderer::CreateResource(const MaterialDescriptor& descriptor) {
    return materials_.Add(Material(device_, *render_pass_, swapchain_->Info().extent, descriptor));
}

const UniformBuffer* Renderer::GetResource(const UniformBufferHandle& h) const {
    return uniform_buffers_.Get(h, scheduler_.FrameIdx());
}

UniformBufferHandle Renderer::CreateResource(const UniformBufferDescriptor& descriptor) {
    return uniform_buffers_.Create(device_, device_->UtilQueue(), *util_command_pool_, descriptor);
}

const Texture* Renderer::GetResource(const TextureHandle& h) const {
    return textures_.Get(h);
}

TextureHandle Renderer::CreateResource(const TextureDescriptor& descriptor) {
    return textures_.CreateOrAdd(descriptor, [this](const TextureDescriptor& desc) {
        return Texture::Create(device_, device_->UtilQueue(), *util_command_pool_, desc);
    });
}

DescriptorSetHandle Renderer::CreateDescriptorSet(const MaterialHandle& material,
                                                  const UniformBufferHandle& uniformBuffer,
                                                  std::optional<TextureHandle> texture) {
    const Material* mat = materials_.Get(material);
    if (mat == nullptr) {
        throw RenderError(ErrorKind::DescriptorSet, "Unknown material handle");
    }

    const GraphicsPipeline& pipeline = mat->GetPipeline();
    CheckDescriptorSetLayout(pipeline.GetDescriptorSetLayoutData(), texture.has_value());

    const auto ubos = uniform_buffers_.GetAll(uniformBuffer);
    if (!ubos) {
        throw RenderError(ErrorKind::DescriptorSet, "Unknown uniform buffer handle");
    }

    DescriptorSetDescriptor desc;
    desc.layout = pipeline.GetDescriptorSetLayouts().front();
    desc.uniform_buffers = *ubos;

    if (texture) {
        desc.texture = textures_.Get(*texture);
        if (desc.texture == nullptr) {
            throw RenderError(ErrorKind::DescriptorSet, "Unknown texture handle");
        }
    }

    return descriptor_sets_->Create(desc);
}

VkDescriptorSet Renderer::GetDescriptorSet(const DescriptorSetHandle& h, u32 frameIdx) const {
    const DescriptorSet* set = descriptor_sets_->Get(h, frameIdx);
    if (set == nullptr) {
        throw RenderError(ErrorKind::DescriptorSet, "Unknown descriptor set handle");
    }
    return set->raw;
}

} // namespace trekanten
