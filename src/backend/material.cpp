// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/material.h"
#include "trekanten/backend/error.h"

namespace trekanten {

MaterialDescriptor MaterialDescriptor::Builder::Build() const {
    if (!vertex_shader_) {
        throw RenderError(ErrorKind::Material, "Missing vertex shader");
    }
    if (!fragment_shader_) {
        throw RenderError(ErrorKind::Material, "Missing fragment shader");
    }

    MaterialDescriptor desc;
    desc.gfx_pipeline_descriptor.vertex_shader = *vertex_shader_;
    desc.gfx_pipeline_descriptor.fragment_shader = *fragment_shader_;
    desc.gfx_pipeline_descriptor.vertex_description = vertex_description_;
    return desc;
}

Material::Material(std::shared_ptr<Device> device, const RenderPass& renderPass, Extent2D viewportExtent,
                   MaterialDescriptor descriptor)
    : descriptor_(std::move(descriptor)),
      pipeline_(std::move(device), renderPass, viewportExtent, descriptor_.gfx_pipeline_descriptor) {}

void Material::Recreate(std::shared_ptr<Device> device, const RenderPass& renderPass, Extent2D viewportExtent) {
    pipeline_ = GraphicsPipeline(std::move(device), renderPass, viewportExtent, descriptor_.gfx_pipeline_descriptor);
}

} // namespace trekanten
