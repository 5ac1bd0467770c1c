// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/mesh.h"
#include "trekanten/backend/error.h"

namespace trekanten {

IndexBufferDescriptor IndexBufferDescriptor::FromSlice(const std::vector<uint32_t>& indices) {
    IndexBufferDescriptor desc;
    desc.data.resize(indices.size() * sizeof(uint32_t));
    if (!indices.empty()) {
        std::memcpy(desc.data.data(), indices.data(), desc.data.size());
    }
    return desc;
}

VertexBuffer VertexBuffer::Create(std::shared_ptr<Device> device, const Queue& queue, const CommandPool& pool,
                                  const VertexBufferDescriptor& descriptor) {
    if (descriptor.data.empty()) {
        throw RenderError(ErrorKind::VertexBuffer, "Cannot create an empty vertex buffer");
    }

    try {
        DeviceBuffer buffer = DeviceBuffer::DeviceLocalByStaging(std::move(device), queue, pool,
                                                                 VK_BUFFER_USAGE_VERTEX_BUFFER_BIT, descriptor.data);
        return VertexBuffer(std::move(buffer), descriptor.NumElements());
    } catch (const RenderError& e) {
        throw RenderError::Wrap(ErrorKind::VertexBuffer, e);
    }
}

IndexBuffer IndexBuffer::Create(std::shared_ptr<Device> device, const Queue& queue, const CommandPool& pool,
                                const IndexBufferDescriptor& descriptor) {
    if (descriptor.data.empty()) {
        throw RenderError(ErrorKind::IndexBuffer, "Cannot create an empty index buffer");
    }

    try {
        DeviceBuffer buffer = DeviceBuffer::DeviceLocalByStaging(std::move(device), queue, pool,
                                                                 VK_BUFFER_USAGE_INDEX_BUFFER_BIT, descriptor.data);
        return IndexBuffer(std::move(buffer), descriptor.NumElements());
    } catch (const RenderError& e) {
        throw RenderError::Wrap(ErrorKind::IndexBuffer, e);
    }
}

} // namespace trekanten
