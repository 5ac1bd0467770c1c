// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/reflection.h"
#include "trekanten/backend/util.h"
#include "trekanten/backend/vertex.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>
#include <vulkan/vulkan.h>

namespace trekanten {

class Device;
class RenderPass;

struct GraphicsPipelineDescriptor {
    std::filesystem::path vertex_shader;
    std::filesystem::path fragment_shader;
    VertexDescription vertex_description;

    bool operator==(const GraphicsPipelineDescriptor& other) const {
        return vertex_shader == other.vertex_shader && fragment_shader == other.fragment_shader &&
               vertex_description == other.vertex_description;
    }
};

class GraphicsPipeline {
public:
    static constexpr VkPipelineBindPoint kBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;

    /**
     * @brief Build a pipeline for the given render pass and viewport
     *
     * Descriptor set layouts are reflected from both shader stages and owned
     * by the pipeline. Viewport and scissor are baked from the extent, so the
     * pipeline has to be rebuilt when the swapchain is resized.
     */
    GraphicsPipeline(std::shared_ptr<Device> device, const RenderPass& renderPass, Extent2D viewportExtent,
                     const GraphicsPipelineDescriptor& descriptor);
    ~GraphicsPipeline();

    GraphicsPipeline(const GraphicsPipeline&) = delete;
    GraphicsPipeline& operator=(const GraphicsPipeline&) = delete;
    GraphicsPipeline(GraphicsPipeline&& other) noexcept;
    GraphicsPipeline& operator=(GraphicsPipeline&& other) noexcept;

    VkPipeline GetRaw() const { return raw_; }
    VkPipelineLayout GetLayout() const { return layout_; }
    const std::vector<VkDescriptorSetLayout>& GetDescriptorSetLayouts() const { return set_layouts_; }
    // Merged reflection of both stages, only the sets the shaders declare
    const std::vector<DescriptorSetLayoutData>& GetDescriptorSetLayoutData() const { return set_layout_data_; }

private:
    void Destroy();

    std::shared_ptr<Device> device_;
    VkPipeline raw_ = VK_NULL_HANDLE;
    VkPipelineLayout layout_ = VK_NULL_HANDLE;
    std::vector<VkDescriptorSetLayout> set_layouts_;
    std::vector<DescriptorSetLayoutData> set_layout_data_;
};

} // namespace trekanten
