// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/descriptor.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/texture.h"
#include "trekanten/backend/uniform.h"

#include <algorithm>
#include <fmt/format.h>
#include <vector>

namespace trekanten {
namespace {

const VkDescriptorSetLayoutBinding* FindBinding(const DescriptorSetLayoutData& set, uint32_t binding) {
    auto it = std::find_if(set.bindings.begin(), set.bindings.end(),
                           [binding](const VkDescriptorSetLayoutBinding& b) { return b.binding == binding; });
    return it != set.bindings.end() ? &*it : nullptr;
}

} // namespace

void CheckDescriptorSetLayout(const std::vector<DescriptorSetLayoutData>& layouts, bool withTexture) {
    auto set0 = std::find_if(layouts.begin(), layouts.end(),
                             [](const DescriptorSetLayoutData& data) { return data.set_idx == 0; });
    if (set0 == layouts.end()) {
        throw RenderError(ErrorKind::DescriptorSet, "Shaders declare no descriptor set 0");
    }

    const VkDescriptorSetLayoutBinding* ubo = FindBinding(*set0, kUniformBufferBinding);
    if (ubo == nullptr || ubo->descriptorType != VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER) {
        throw RenderError(ErrorKind::DescriptorSet,
                          fmt::format("Set 0 has no uniform buffer at binding {}", kUniformBufferBinding));
    }

    const VkDescriptorSetLayoutBinding* sampler = FindBinding(*set0, kTextureBinding);
    const bool hasSampler = sampler != nullptr && sampler->descriptorType == VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    if (withTexture && !hasSampler) {
        throw RenderError(ErrorKind::DescriptorSet,
                          fmt::format("Set 0 has no combined image sampler at binding {}", kTextureBinding));
    }
    if (!withTexture && sampler != nullptr) {
        throw RenderError(ErrorKind::DescriptorSet,
                          fmt::format("Set 0 binding {} expects a texture", kTextureBinding));
    }
}

DescriptorSets::DescriptorSets(std::shared_ptr<Device> device, uint32_t setPairs) : device_(std::move(device)) {
    const uint32_t maxSets = setPairs * kMaxFramesInFlight;

    std::array<VkDescriptorPoolSize, 2> sizes{};
    sizes[0].type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    sizes[0].descriptorCount = maxSets;
    sizes[1].type = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    sizes[1].descriptorCount = maxSets;

    VkDescriptorPoolCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    info.poolSizeCount = static_cast<uint32_t>(sizes.size());
    info.pPoolSizes = sizes.data();
    info.maxSets = maxSets;

    CheckVk(vkCreateDescriptorPool(device_->GetRaw(), &info, nullptr, &pool_), ErrorKind::DescriptorSet,
            "vkCreateDescriptorPool");
}

DescriptorSets::~DescriptorSets() {
    if (pool_ != VK_NULL_HANDLE) {
        vkDestroyDescriptorPool(device_->GetRaw(), pool_, nullptr);
    }
}

DescriptorSetHandle DescriptorSets::Create(const DescriptorSetDescriptor& descriptor) {
    for (const UniformBuffer* ubo : descriptor.uniform_buffers) {
        if (ubo == nullptr) {
            throw RenderError(ErrorKind::DescriptorSet, "Missing uniform buffer for a frame in flight");
        }
    }

    std::array<VkDescriptorSetLayout, kMaxFramesInFlight> layouts;
    layouts.fill(descriptor.layout);

    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool = pool_;
    allocInfo.descriptorSetCount = static_cast<uint32_t>(layouts.size());
    allocInfo.pSetLayouts = layouts.data();

    std::array<VkDescriptorSet, kMaxFramesInFlight> raws{};
    CheckVk(vkAllocateDescriptorSets(device_->GetRaw(), &allocInfo, raws.data()), ErrorKind::DescriptorSet,
            "vkAllocateDescriptorSets");

    BufferedStorage<DescriptorSet>::Slots slots{};
    for (size_t i = 0; i < kMaxFramesInFlight; ++i) {
        const UniformBuffer& ubo = *descriptor.uniform_buffers[i];

        VkDescriptorBufferInfo bufferInfo{};
        bufferInfo.buffer = ubo.GetBuffer().GetRaw();
        bufferInfo.offset = 0;
        bufferInfo.range = ubo.ElemSize();

        std::vector<VkWriteDescriptorSet> writes;

        VkWriteDescriptorSet uboWrite{};
        uboWrite.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        uboWrite.dstSet = raws[i];
        uboWrite.dstBinding = kUniformBufferBinding;
        uboWrite.dstArrayElement = 0;
        uboWrite.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        uboWrite.descriptorCount = 1;
        uboWrite.pBufferInfo = &bufferInfo;
        writes.push_back(uboWrite);

        VkDescriptorImageInfo imageInfo{};
        if (descriptor.texture != nullptr) {
            imageInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
            imageInfo.imageView = descriptor.texture->GetImageView().GetRaw();
            imageInfo.sampler = descriptor.texture->GetSampler().GetRaw();

            VkWriteDescriptorSet texWrite{};
            texWrite.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
            texWrite.dstSet = raws[i];
            texWrite.dstBinding = kTextureBinding;
            texWrite.dstArrayElement = 0;
            texWrite.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            texWrite.descriptorCount = 1;
            texWrite.pImageInfo = &imageInfo;
            writes.push_back(texWrite);
        }

        vkUpdateDescriptorSets(device_->GetRaw(), static_cast<uint32_t>(writes.size()), writes.data(), 0, nullptr);
        slots[i] = DescriptorSet{raws[i]};
    }

    return sets_.Add(slots);
}

} // namespace trekanten
