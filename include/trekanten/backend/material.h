// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/pipeline.h"
#include "trekanten/backend/vertex.h"
#include "trekanten/resource/storage.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace trekanten {

class Device;
class RenderPass;

struct MaterialDescriptor {
    GraphicsPipelineDescriptor gfx_pipeline_descriptor;

    class Builder {
    public:
        Builder& VertexShader(std::filesystem::path path) {
            vertex_shader_ = std::move(path);
            return *this;
        }

        Builder& FragmentShader(std::filesystem::path path) {
            fragment_shader_ = std::move(path);
            return *this;
        }

        template <typename V>
        Builder& VertexType() {
            vertex_description_ = VertexDescriptionOf<V>();
            return *this;
        }

        // Throws Material when either shader is missing
        MaterialDescriptor Build() const;

    private:
        std::optional<std::filesystem::path> vertex_shader_;
        std::optional<std::filesystem::path> fragment_shader_;
        VertexDescription vertex_description_;
    };
};

class Material {
public:
    Material(std::shared_ptr<Device> device, const RenderPass& renderPass, Extent2D viewportExtent,
             MaterialDescriptor descriptor);

    const GraphicsPipeline& GetPipeline() const { return pipeline_; }
    const MaterialDescriptor& GetDescriptor() const { return descriptor_; }

    // Rebuilds the pipeline for a new render pass or viewport
    void Recreate(std::shared_ptr<Device> device, const RenderPass& renderPass, Extent2D viewportExtent);

private:
    MaterialDescriptor descriptor_;
    GraphicsPipeline pipeline_;
};

using MaterialHandle = Handle<Material>;

} // namespace trekanten
