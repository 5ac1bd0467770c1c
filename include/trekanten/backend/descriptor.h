// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/reflection.h"
#include "trekanten/core/common.h"
#include "trekanten/resource/storage.h"

#include <array>
#include <memory>
#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

class Device;
class Texture;
class UniformBuffer;

struct DescriptorSet {
    VkDescriptorSet raw = VK_NULL_HANDLE;
};

using DescriptorSetHandle = Handle<DescriptorSet>;

constexpr uint32_t kUniformBufferBinding = 0;
constexpr uint32_t kTextureBinding = 1;

/**
 * @brief Check that reflected layouts match what a descriptor set writes
 *
 * Set 0 must hold a uniform buffer at binding 0. A combined image sampler at
 * binding 1 must be there exactly when a texture is bound. Throws a
 * DescriptorSet error otherwise.
 */
void CheckDescriptorSetLayout(const std::vector<DescriptorSetLayoutData>& layouts, bool withTexture);

struct DescriptorSetDescriptor {
    VkDescriptorSetLayout layout = VK_NULL_HANDLE;
    // Bound at binding 0, one per frame in flight
    std::array<const UniformBuffer*, kMaxFramesInFlight> uniform_buffers{};
    // Bound at binding 1 when present
    const Texture* texture = nullptr;
};

/**
 * @brief Descriptor pool plus the per-frame sets allocated from it
 *
 * Each Create allocates one set per frame in flight, so the pool is sized in
 * pairs of sets. Sets are freed together with the pool.
 */
class DescriptorSets {
public:
    explicit DescriptorSets(std::shared_ptr<Device> device, uint32_t setPairs = 1);
    ~DescriptorSets();

    DescriptorSets(const DescriptorSets&) = delete;
    DescriptorSets& operator=(const DescriptorSets&) = delete;

    // Throws DescriptorSet when the pool is exhausted
    DescriptorSetHandle Create(const DescriptorSetDescriptor& descriptor);

    const DescriptorSet* Get(const DescriptorSetHandle& h, size_t frameIdx) const { return sets_.Get(h, frameIdx); }
    size_t Size() const { return sets_.Size(); }

private:
    std::shared_ptr<Device> device_;
    VkDescriptorPool pool_ = VK_NULL_HANDLE;
    BufferedStorage<DescriptorSet> sets_;
};

} // namespace trekanten
