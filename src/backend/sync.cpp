// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/sync.h"
#include "trekanten/backend/error.h"

#include <cstdint>
#include <utility>

namespace trekanten {

Semaphore::Semaphore(VkDevice device) : device_(device) {
    VkSemaphoreCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    CheckVk(vkCreateSemaphore(device_, &info, nullptr, &raw_), ErrorKind::Semaphore, "vkCreateSemaphore");
}

Semaphore::~Semaphore() {
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroySemaphore(device_, raw_, nullptr);
    }
}

Semaphore::Semaphore(Semaphore&& other) noexcept
    : device_(other.device_), raw_(std::exchange(other.raw_, VK_NULL_HANDLE)) {}

Semaphore& Semaphore::operator=(Semaphore&& other) noexcept {
    if (this != &other) {
        if (raw_ != VK_NULL_HANDLE) {
            vkDestroySemaphore(device_, raw_, nullptr);
        }
        device_ = other.device_;
        raw_ = std::exchange(other.raw_, VK_NULL_HANDLE);
    }
    return *this;
}

Fence::Fence(VkDevice device, VkFenceCreateFlags flags) : device_(device) {
    VkFenceCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    info.flags = flags;
    CheckVk(vkCreateFence(device_, &info, nullptr, &raw_), ErrorKind::Fence, "vkCreateFence");
}

Fence Fence::Signaled(VkDevice device) {
    return Fence(device, VK_FENCE_CREATE_SIGNALED_BIT);
}

Fence Fence::Unsignaled(VkDevice device) {
    return Fence(device, 0);
}

Fence::~Fence() {
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroyFence(device_, raw_, nullptr);
    }
}

Fence::Fence(Fence&& other) noexcept : device_(other.device_), raw_(std::exchange(other.raw_, VK_NULL_HANDLE)) {}

Fence& Fence::operator=(Fence&& other) noexcept {
    if (this != &other) {
        if (raw_ != VK_NULL_HANDLE) {
            vkDestroyFence(device_, raw_, nullptr);
        }
        device_ = other.device_;
        raw_ = std::exchange(other.raw_, VK_NULL_HANDLE);
    }
    return *this;
}

void Fence::BlockingWait() const {
    CheckVk(vkWaitForFences(device_, 1, &raw_, VK_TRUE, UINT64_MAX), ErrorKind::Fence, "vkWaitForFences");
}

void Fence::Reset() {
    CheckVk(vkResetFences(device_, 1, &raw_), ErrorKind::Fence, "vkResetFences");
}

} // namespace trekanten
