// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/device_selection.h"

#include <vulkan/vulkan.h>

namespace trekanten {

class CommandBuffer;
class Fence;

// Queues are owned by the device; this is a non-owning view
class Queue {
public:
    Queue() = default;
    Queue(VkDevice device, VkQueue raw, QueueFamily family) : device_(device), raw_(raw), family_(family) {}

    VkQueue GetRaw() const { return raw_; }
    const QueueFamily& GetFamily() const { return family_; }

    void Submit(const VkSubmitInfo& info, const Fence* fence) const;
    void SubmitAndWait(const CommandBuffer& cmd) const;

private:
    VkDevice device_ = VK_NULL_HANDLE;
    VkQueue raw_ = VK_NULL_HANDLE;
    QueueFamily family_;
};

} // namespace trekanten
