// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/buffer.h"
#include "trekanten/resource/storage.h"

#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

class CommandPool;
class Device;
class Queue;

struct VertexBufferDescriptor {
    std::vector<uint8_t> data;
    uint32_t element_size = 0;

    template <typename V>
    static VertexBufferDescriptor FromSlice(const std::vector<V>& vertices) {
        VertexBufferDescriptor desc;
        desc.element_size = static_cast<uint32_t>(sizeof(V));
        desc.data.resize(vertices.size() * sizeof(V));
        if (!vertices.empty()) {
            std::memcpy(desc.data.data(), vertices.data(), desc.data.size());
        }
        return desc;
    }

    uint32_t NumElements() const { return element_size == 0 ? 0 : static_cast<uint32_t>(data.size() / element_size); }
};

struct IndexBufferDescriptor {
    std::vector<uint8_t> data;

    static IndexBufferDescriptor FromSlice(const std::vector<uint32_t>& indices);

    uint32_t NumElements() const { return static_cast<uint32_t>(data.size() / sizeof(uint32_t)); }
};

class VertexBuffer {
public:
    static VertexBuffer Create(std::shared_ptr<Device> device, const Queue& queue, const CommandPool& pool,
                               const VertexBufferDescriptor& descriptor);

    const DeviceBuffer& GetBuffer() const { return buffer_; }
    uint32_t NumElements() const { return num_elements_; }

private:
    VertexBuffer(DeviceBuffer buffer, uint32_t numElements) : buffer_(std::move(buffer)), num_elements_(numElements) {}

    DeviceBuffer buffer_;
    uint32_t num_elements_ = 0;
};

class IndexBuffer {
public:
    static constexpr VkIndexType kIndexType = VK_INDEX_TYPE_UINT32;

    static IndexBuffer Create(std::shared_ptr<Device> device, const Queue& queue, const CommandPool& pool,
                              const IndexBufferDescriptor& descriptor);

    const DeviceBuffer& GetBuffer() const { return buffer_; }
    uint32_t NumElements() const { return num_elements_; }

private:
    IndexBuffer(DeviceBuffer buffer, uint32_t numElements) : buffer_(std::move(buffer)), num_elements_(numElements) {}

    DeviceBuffer buffer_;
    uint32_t num_elements_ = 0;
};

using VertexBufferHandle = Handle<VertexBuffer>;
using IndexBufferHandle = Handle<IndexBuffer>;

} // namespace trekanten
