// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/queue.h"
#include "trekanten/backend/command.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/sync.h"

namespace trekanten {

void Queue::Submit(const VkSubmitInfo& info, const Fence* fence) const {
    const VkFence rawFence = fence != nullptr ? fence->GetRaw() : VK_NULL_HANDLE;
    CheckVk(vkQueueSubmit(raw_, 1, &info, rawFence), ErrorKind::Queue, "vkQueueSubmit");
}

void Queue::SubmitAndWait(const CommandBuffer& cmd) const {
    const VkCommandBuffer raw = cmd.GetRaw();

    VkSubmitInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    info.commandBufferCount = 1;
    info.pCommandBuffers = &raw;

    try {
        Fence fence = Fence::Unsignaled(device_);
        Submit(info, &fence);
        fence.BlockingWait();
    } catch (const RenderError& e) {
        if (e.GetKind() == ErrorKind::Queue) {
            throw;
        }
        throw RenderError::Wrap(ErrorKind::Queue, e);
    }
}

} // namespace trekanten
