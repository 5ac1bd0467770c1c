// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/pipeline.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/reflection.h"
#include "trekanten/backend/render_pass.h"
#include "trekanten/backend/shader.h"
#include "trekanten/core/log.h"

#include <array>
#include <utility>

namespace trekanten {

GraphicsPipeline::GraphicsPipeline(std::shared_ptr<Device> device, const RenderPass& renderPass,
                                   Extent2D viewportExtent, const GraphicsPipelineDescriptor& descriptor)
    : device_(std::move(device)) {
    VkDevice vkDevice = device_->GetRaw();

    try {
        const auto vertCode = ReadSpirv(descriptor.vertex_shader);
        const auto fragCode = ReadSpirv(descriptor.fragment_shader);

        set_layout_data_ =
            MergeDescriptorSetLayouts(ParseDescriptorSets(vertCode), ParseDescriptorSets(fragCode));

        // Pipeline layouts index sets by position, so gaps get an empty layout
        uint32_t nextSet = 0;
        for (const auto& data : set_layout_data_) {
            for (; nextSet <= data.set_idx; ++nextSet) {
                VkDescriptorSetLayoutCreateInfo info{};
                info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
                if (nextSet == data.set_idx) {
                    info.bindingCount = static_cast<uint32_t>(data.bindings.size());
                    info.pBindings = data.bindings.data();
                }

                VkDescriptorSetLayout layout = VK_NULL_HANDLE;
                CheckVk(vkCreateDescriptorSetLayout(vkDevice, &info, nullptr, &layout), ErrorKind::Pipeline,
                        "vkCreateDescriptorSetLayout");
                set_layouts_.push_back(layout);
            }
        }

        // Destroyed when they go out of scope, after the pipeline is created
        const ShaderModule vert(device_, vertCode);
        const ShaderModule frag(device_, fragCode);

        std::array<VkPipelineShaderStageCreateInfo, 2> stages{};
        stages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        stages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
        stages[0].module = vert.GetRaw();
        stages[0].pName = "main";
        stages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        stages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
        stages[1].module = frag.GetRaw();
        stages[1].pName = "main";

        const VertexDescription& vertexDesc = descriptor.vertex_description;
        VkPipelineVertexInputStateCreateInfo vertexInput{};
        vertexInput.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        vertexInput.vertexBindingDescriptionCount = static_cast<uint32_t>(vertexDesc.bindings.size());
        vertexInput.pVertexBindingDescriptions = vertexDesc.bindings.data();
        vertexInput.vertexAttributeDescriptionCount = static_cast<uint32_t>(vertexDesc.attributes.size());
        vertexInput.pVertexAttributeDescriptions = vertexDesc.attributes.data();

        VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
        inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        inputAssembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        inputAssembly.primitiveRestartEnable = VK_FALSE;

        VkViewport viewport{};
        viewport.x = 0.0f;
        viewport.y = 0.0f;
        viewport.width = static_cast<float>(viewportExtent.width);
        viewport.height = static_cast<float>(viewportExtent.height);
        viewport.minDepth = 0.0f;
        viewport.maxDepth = 1.0f;

        VkRect2D scissor{};
        scissor.offset = {0, 0};
        scissor.extent = viewportExtent;

        VkPipelineViewportStateCreateInfo viewportState{};
        viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        viewportState.viewportCount = 1;
        viewportState.pViewports = &viewport;
        viewportState.scissorCount = 1;
        viewportState.pScissors = &scissor;

        VkPipelineRasterizationStateCreateInfo rasterizer{};
        rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        rasterizer.depthClampEnable = VK_FALSE;
        rasterizer.rasterizerDiscardEnable = VK_FALSE;
        rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
        rasterizer.lineWidth = 1.0f;
        rasterizer.cullMode = VK_CULL_MODE_BACK_BIT;
        rasterizer.frontFace = VK_FRONT_FACE_CLOCKWISE;
        rasterizer.depthBiasEnable = VK_FALSE;

        VkPipelineMultisampleStateCreateInfo multisampling{};
        multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        multisampling.sampleShadingEnable = VK_FALSE;
        multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;
        multisampling.minSampleShading = 1.0f;

        VkPipelineDepthStencilStateCreateInfo depthStencil{};
        depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
        depthStencil.depthTestEnable = VK_TRUE;
        depthStencil.depthWriteEnable = VK_TRUE;
        depthStencil.depthCompareOp = VK_COMPARE_OP_LESS;
        depthStencil.depthBoundsTestEnable = VK_FALSE;
        depthStencil.stencilTestEnable = VK_FALSE;

        VkPipelineColorBlendAttachmentState blendAttachment{};
        blendAttachment.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                                         VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
        blendAttachment.blendEnable = VK_FALSE;

        VkPipelineColorBlendStateCreateInfo colorBlending{};
        colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        colorBlending.logicOpEnable = VK_FALSE;
        colorBlending.attachmentCount = 1;
        colorBlending.pAttachments = &blendAttachment;

        VkPipelineLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        layoutInfo.setLayoutCount = static_cast<uint32_t>(set_layouts_.size());
        layoutInfo.pSetLayouts = set_layouts_.data();

        CheckVk(vkCreatePipelineLayout(vkDevice, &layoutInfo, nullptr, &layout_), ErrorKind::Pipeline,
                "vkCreatePipelineLayout");

        VkGraphicsPipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        pipelineInfo.stageCount = static_cast<uint32_t>(stages.size());
        pipelineInfo.pStages = stages.data();
        pipelineInfo.pVertexInputState = &vertexInput;
        pipelineInfo.pInputAssemblyState = &inputAssembly;
        pipelineInfo.pViewportState = &viewportState;
        pipelineInfo.pRasterizationState = &rasterizer;
        pipelineInfo.pMultisampleState = &multisampling;
        pipelineInfo.pDepthStencilState = &depthStencil;
        pipelineInfo.pColorBlendState = &colorBlending;
        pipelineInfo.layout = layout_;
        pipelineInfo.renderPass = renderPass.GetRaw();
        pipelineInfo.subpass = 0;

        CheckVk(vkCreateGraphicsPipelines(vkDevice, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &raw_),
                ErrorKind::Pipeline, "vkCreateGraphicsPipelines");
    } catch (const RenderError&) {
        Destroy();
        throw;
    }

    TREKANTEN_LOG_DEBUG("Created graphics pipeline {} / {}", descriptor.vertex_shader.string(),
                        descriptor.fragment_shader.string());
}

GraphicsPipeline::~GraphicsPipeline() {
    Destroy();
}

void GraphicsPipeline::Destroy() {
    if (!device_) {
        return;
    }

    VkDevice vkDevice = device_->GetRaw();
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroyPipeline(vkDevice, raw_, nullptr);
        raw_ = VK_NULL_HANDLE;
    }
    if (layout_ != VK_NULL_HANDLE) {
        vkDestroyPipelineLayout(vkDevice, layout_, nullptr);
        layout_ = VK_NULL_HANDLE;
    }
    for (VkDescriptorSetLayout layout : set_layouts_) {
        vkDestroyDescriptorSetLayout(vkDevice, layout, nullptr);
    }
    set_layouts_.clear();
}

GraphicsPipeline::GraphicsPipeline(GraphicsPipeline&& other) noexcept
    : device_(std::move(other.device_)),
      raw_(std::exchange(other.raw_, VK_NULL_HANDLE)),
      layout_(std::exchange(other.layout_, VK_NULL_HANDLE)),
      set_layouts_(std::move(other.set_layouts_)),
      set_layout_data_(std::move(other.set_layout_data_)) {
    other.set_layouts_.clear();
}

GraphicsPipeline& GraphicsPipeline::operator=(GraphicsPipeline&& other) noexcept {
    if (this != &other) {
        Destroy();
        device_ = std::move(other.device_);
        raw_ = std::exchange(other.raw_, VK_NULL_HANDLE);
        layout_ = std::exchange(other.layout_, VK_NULL_HANDLE);
        set_layouts_ = std::move(other.set_layouts_);
        set_layout_data_ = std::move(other.set_layout_data_);
        other.set_layouts_.clear();
    }
    return *this;
}

} // namespace trekanten
