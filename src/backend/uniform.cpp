// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/uniform.h"
#include "trekanten/backend/error.h"

namespace trekanten {

UniformBufferDescriptor UniformBufferDescriptor::Initialized(std::vector<uint8_t> data, uint32_t elemSize) {
    UniformBufferDescriptor desc;
    desc.kind = Kind::Initialized;
    desc.elem_size = elemSize;
    desc.n_elems = elemSize == 0 ? 0 : static_cast<uint32_t>(data.size() / elemSize);
    desc.data = std::move(data);
    return desc;
}

UniformBufferDescriptor UniformBufferDescriptor::Uninitialized(uint32_t elemSize, uint32_t nElems) {
    UniformBufferDescriptor desc;
    desc.kind = Kind::Uninitialized;
    desc.elem_size = elemSize;
    desc.n_elems = nElems;
    return desc;
}

VkDeviceSize UniformBufferDescriptor::Size() const {
    if (kind == Kind::Initialized) {
        return data.size();
    }
    return static_cast<VkDeviceSize>(elem_size) * n_elems;
}

UniformBuffer UniformBuffer::Create(std::shared_ptr<Device> device, const Queue& queue, const CommandPool& pool,
                                    const UniformBufferDescriptor& descriptor) {
    if (descriptor.Size() == 0) {
        throw RenderError(ErrorKind::UniformBuffer, "Cannot create an empty uniform buffer");
    }

    try {
        if (descriptor.kind == UniformBufferDescriptor::Kind::Initialized) {
            return UniformBuffer(DeviceBuffer::DeviceLocalByStaging(std::move(device), queue, pool,
                                                                    VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT,
                                                                    descriptor.data),
                                 descriptor.elem_size);
        }

        return UniformBuffer(DeviceBuffer::Empty(std::move(device), descriptor.Size(),
                                                 VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, VMA_MEMORY_USAGE_CPU_TO_GPU),
                             descriptor.elem_size);
    } catch (const RenderError& e) {
        throw RenderError::Wrap(ErrorKind::UniformBuffer, e);
    }
}

UniformBufferHandle UniformBuffers::Create(const std::shared_ptr<Device>& device, const Queue& queue,
                                           const CommandPool& pool, const UniformBufferDescriptor& descriptor) {
    static_assert(kMaxFramesInFlight == 2, "one buffer per frame in flight");
    return storage_.Add({UniformBuffer::Create(device, queue, pool, descriptor),
                         UniformBuffer::Create(device, queue, pool, descriptor)});
}

} // namespace trekanten
