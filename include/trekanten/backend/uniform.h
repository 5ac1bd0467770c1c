// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/buffer.h"
#include "trekanten/resource/storage.h"

#include <array>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <vector>

namespace trekanten {

class CommandPool;
class Device;
class Queue;

struct UniformBufferDescriptor {
    enum class Kind {
        Initialized,
        Uninitialized,
    };

    Kind kind = Kind::Uninitialized;
    std::vector<uint8_t> data;
    uint32_t elem_size = 0;
    uint32_t n_elems = 0;

    // Device local, filled once through staging
    static UniformBufferDescriptor Initialized(std::vector<uint8_t> data, uint32_t elemSize);

    template <typename T>
    static UniformBufferDescriptor InitializedWith(const std::vector<T>& values) {
        std::vector<uint8_t> bytes(values.size() * sizeof(T));
        if (!values.empty()) {
            std::memcpy(bytes.data(), values.data(), bytes.size());
        }
        return Initialized(std::move(bytes), static_cast<uint32_t>(sizeof(T)));
    }

    // Host visible, written with UniformBuffer::UpdateWith
    static UniformBufferDescriptor Uninitialized(uint32_t elemSize, uint32_t nElems);

    template <typename T>
    static UniformBufferDescriptor UninitializedFor(uint32_t nElems) {
        return Uninitialized(static_cast<uint32_t>(sizeof(T)), nElems);
    }

    VkDeviceSize Size() const;
};

class UniformBuffer {
public:
    static UniformBuffer Create(std::shared_ptr<Device> device, const Queue& queue, const CommandPool& pool,
                                const UniformBufferDescriptor& descriptor);

    const DeviceBuffer& GetBuffer() const { return buffer_; }
    uint32_t ElemSize() const { return elem_size_; }

    template <typename T>
    void UpdateWith(const T& value) {
        buffer_.UpdateDataAt(&value, sizeof(T), 0);
    }

private:
    UniformBuffer(DeviceBuffer buffer, uint32_t elemSize) : buffer_(std::move(buffer)), elem_size_(elemSize) {}

    DeviceBuffer buffer_;
    uint32_t elem_size_ = 0;
};

using UniformBufferHandle = Handle<UniformBuffer>;

// One uniform buffer per frame in flight behind a single handle
class UniformBuffers {
public:
    UniformBufferHandle Create(const std::shared_ptr<Device>& device, const Queue& queue, const CommandPool& pool,
                               const UniformBufferDescriptor& descriptor);

    const UniformBuffer* Get(const UniformBufferHandle& h, size_t frameIdx) const { return storage_.Get(h, frameIdx); }
    UniformBuffer* GetMut(const UniformBufferHandle& h, size_t frameIdx) { return storage_.GetMut(h, frameIdx); }

    std::optional<std::array<const UniformBuffer*, kMaxFramesInFlight>> GetAll(const UniformBufferHandle& h) const {
        return storage_.GetAll(h);
    }

    size_t Size() const { return storage_.Size(); }

private:
    BufferedStorage<UniformBuffer> storage_;
};

} // namespace trekanten
