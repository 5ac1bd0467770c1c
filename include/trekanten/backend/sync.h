// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <vulkan/vulkan.h>

namespace trekanten {

class Semaphore {
public:
    explicit Semaphore(VkDevice device);
    ~Semaphore();

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;
    Semaphore(Semaphore&& other) noexcept;
    Semaphore& operator=(Semaphore&& other) noexcept;

    VkSemaphore GetRaw() const { return raw_; }

private:
    VkDevice device_ = VK_NULL_HANDLE;
    VkSemaphore raw_ = VK_NULL_HANDLE;
};

class Fence {
public:
    static Fence Signaled(VkDevice device);
    static Fence Unsignaled(VkDevice device);

    ~Fence();

    Fence(const Fence&) = delete;
    Fence& operator=(const Fence&) = delete;
    Fence(Fence&& other) noexcept;
    Fence& operator=(Fence&& other) noexcept;

    VkFence GetRaw() const { return raw_; }

    void BlockingWait() const;
    void Reset();

private:
    Fence(VkDevice device, VkFenceCreateFlags flags);

    VkDevice device_ = VK_NULL_HANDLE;
    VkFence raw_ = VK_NULL_HANDLE;
};

} // namespace trekanten
