// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <trekanten/backend/error.h>
#include <trekanten/backend/material.h>
#include <trekanten/backend/mesh.h>
#include <trekanten/backend/uniform.h>
#include <trekanten/core/config.h>
#include <trekanten/core/log.h>
#include <trekanten/renderer/renderer.h>
#include <trekanten/window/window.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

using namespace trekanten;

namespace {

struct Vertex {
    glm::vec2 pos;
    glm::vec3 col;

    static VkVertexInputBindingDescription BindingDescription() {
        VkVertexInputBindingDescription desc{};
        desc.binding = 0;
        desc.stride = sizeof(Vertex);
        desc.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
        return desc;
    }

    static std::array<VkVertexInputAttributeDescription, 2> AttributeDescription() {
        std::array<VkVertexInputAttributeDescription, 2> attrs{};
        attrs[0].binding = 0;
        attrs[0].location = 0;
        attrs[0].format = VK_FORMAT_R32G32_SFLOAT;
        attrs[0].offset = offsetof(Vertex, pos);
        attrs[1].binding = 0;
        attrs[1].location = 1;
        attrs[1].format = VK_FORMAT_R32G32B32_SFLOAT;
        attrs[1].offset = offsetof(Vertex, col);
        return attrs;
    }
};

struct Transform {
    glm::mat4 model;
};

const std::vector<Vertex> kVertices = {
    {{-0.5f, -0.5f}, {1.0f, 0.0f, 0.0f}},
    {{0.5f, -0.5f}, {0.0f, 1.0f, 0.0f}},
    {{0.5f, 0.5f}, {0.0f, 0.0f, 1.0f}},
    {{-0.5f, 0.5f}, {1.0f, 1.0f, 1.0f}},
};

const std::vector<uint32_t> kIndices = {0, 1, 2, 2, 3, 0};

Transform RotationAt(float seconds) {
    return Transform{glm::rotate(glm::mat4(1.0f), seconds * glm::radians(90.0f), glm::vec3(0.0f, 0.0f, 1.0f))};
}

// Waits out a minimized window. Returns false if the window was closed meanwhile.
bool WaitUntilDrawable(const GlfwWindow& window) {
    while (window.Extents().IsEmpty()) {
        if (window.ShouldClose()) {
            return false;
        }
        window.WaitEvents();
    }
    return true;
}

bool ResizeToWindow(Renderer& renderer, const GlfwWindow& window) {
    if (!WaitUntilDrawable(window)) {
        return false;
    }
    renderer.Resize(window.Extents());
    return true;
}

// Retries once after recreating the swapchain
std::optional<Frame> AcquireFrame(Renderer& renderer, const GlfwWindow& window) {
    try {
        return renderer.NextFrame();
    } catch (const RenderError& e) {
        if (!e.IsNeedsResize()) {
            throw;
        }
        if (!ResizeToWindow(renderer, window)) {
            return std::nullopt;
        }
        return renderer.NextFrame();
    }
}

void Run(const config::AppConfig& config) {
    GlfwWindow window(config);
    Renderer renderer(window, config);

    const VertexBufferHandle vertexBuffer = renderer.CreateResource(VertexBufferDescriptor::FromSlice(kVertices));
    const IndexBufferHandle indexBuffer = renderer.CreateResource(IndexBufferDescriptor::FromSlice(kIndices));

    const MaterialDescriptor materialDesc = MaterialDescriptor::Builder()
                                                .VertexShader(config.shader_dir / "quad.vert.spv")
                                                .FragmentShader(config.shader_dir / "quad.frag.spv")
                                                .VertexType<Vertex>()
                                                .Build();
    const MaterialHandle material = renderer.CreateResource(materialDesc);

    const UniformBufferHandle transform =
        renderer.CreateResource(UniformBufferDescriptor::UninitializedFor<Transform>(1));
    const DescriptorSetHandle descriptorSet = renderer.CreateDescriptorSet(material, transform);

    const auto start = std::chrono::steady_clock::now();

    while (!window.ShouldClose()) {
        window.PollEvents();
        if (!WaitUntilDrawable(window)) {
            break;
        }

        std::optional<Frame> acquired = AcquireFrame(renderer, window);
        if (!acquired) {
            break;
        }
        Frame frame = std::move(*acquired);

        const float seconds = std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();
        renderer.UpdateUniformBuffer(frame, transform, RotationAt(seconds));

        const Material* mat = renderer.GetResource(material);
        const VertexBuffer* vbuf = renderer.GetResource(vertexBuffer);
        const IndexBuffer* ibuf = renderer.GetResource(indexBuffer);

        CommandBuffer cmd = frame.NewCommandBuffer();
        cmd.BeginSingleSubmit()
            .BeginRenderPass(renderer.GetRenderPass(), renderer.GetFramebuffer(frame), renderer.SwapchainExtent())
            .BindMaterial(*mat)
            .BindDescriptorSet(renderer.GetDescriptorSet(descriptorSet, frame.FrameIdx()), mat->GetPipeline())
            .BindIndexBuffer(*ibuf)
            .BindVertexBuffer(*vbuf)
            .DrawIndexed(ibuf->NumElements())
            .EndRenderPass()
            .End();
        frame.AddCommandBuffer(std::move(cmd));

        try {
            renderer.Submit(std::move(frame));
        } catch (const RenderError& e) {
            if (!e.IsNeedsResize()) {
                throw;
            }
            if (!ResizeToWindow(renderer, window)) {
                break;
            }
        }
    }
}

} // namespace

int main() {
    const config::AppConfig config = config::load_from_file("data/config/quad.json");
    log::init(config.log_level);

    try {
        Run(config);
    } catch (const std::exception& e) {
        TREKANTEN_LOG_CRITICAL("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
