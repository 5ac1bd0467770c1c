// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/util.h"
#include "trekanten/core/config.h"

#include <memory>
#include <string>
#include <vector>

struct GLFWwindow;

namespace trekanten {

class Instance;
class Surface;

// What the renderer needs from a window system
class Window {
public:
    virtual ~Window() = default;

    virtual std::vector<std::string> RequiredInstanceExtensions() const = 0;
    virtual Extent2D Extents() const = 0;
    virtual std::shared_ptr<Surface> CreateSurface(std::shared_ptr<Instance> instance) const = 0;

    // width / height, 0 for a zero-height window
    float AspectRatio() const;
};

class GlfwWindow : public Window {
public:
    explicit GlfwWindow(const config::AppConfig& config);
    ~GlfwWindow() override;

    GlfwWindow(const GlfwWindow&) = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;

    std::vector<std::string> RequiredInstanceExtensions() const override;
    Extent2D Extents() const override;
    std::shared_ptr<Surface> CreateSurface(std::shared_ptr<Instance> instance) const override;

    bool ShouldClose() const;
    void PollEvents() const;
    // Blocks until at least one event arrives, e.g. while minimized
    void WaitEvents() const;

    GLFWwindow* GetRaw() const { return window_; }

private:
    GLFWwindow* window_ = nullptr;
};

} // namespace trekanten
