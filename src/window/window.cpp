// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/window/window.h"
#include "trekanten/backend/error.h"
#include "trekanten/backend/surface.h"
#include "trekanten/core/log.h"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

namespace trekanten {
namespace {

void ErrorCallback(int code, const char* description) {
    TREKANTEN_LOG_ERROR("GLFW error {}: {}", code, description != nullptr ? description : "");
}

void KeyCallback(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/) {
    if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    }
}

} // namespace

float Window::AspectRatio() const {
    const Extent2D extent = Extents();
    if (extent.height == 0) {
        return 0.0f;
    }
    return static_cast<float>(extent.width) / static_cast<float>(extent.height);
}

GlfwWindow::GlfwWindow(const config::AppConfig& config) {
    glfwSetErrorCallback(ErrorCallback);

    if (glfwInit() != GLFW_TRUE) {
        throw RenderError(ErrorKind::Window, "Failed to initialize GLFW");
    }

    if (glfwVulkanSupported() != GLFW_TRUE) {
        glfwTerminate();
        throw RenderError(ErrorKind::Window, "GLFW reports no Vulkan support");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    window_ = glfwCreateWindow(config.window_width, config.window_height, config.window_title.c_str(), nullptr,
                               nullptr);
    if (window_ == nullptr) {
        glfwTerminate();
        throw RenderError(ErrorKind::Window, "Failed to create window");
    }

    glfwSetKeyCallback(window_, KeyCallback);
    TREKANTEN_LOG_INFO("Created window \"{}\" ({}x{})", config.window_title, config.window_width,
                       config.window_height);
}

GlfwWindow::~GlfwWindow() {
    if (window_ != nullptr) {
        glfwDestroyWindow(window_);
    }
    glfwTerminate();
}

std::vector<std::string> GlfwWindow::RequiredInstanceExtensions() const {
    uint32_t count = 0;
    const char** names = glfwGetRequiredInstanceExtensions(&count);
    if (names == nullptr) {
        throw RenderError(ErrorKind::Window, "GLFW could not list the required instance extensions");
    }
    return std::vector<std::string>(names, names + count);
}

Extent2D GlfwWindow::Extents() const {
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(window_, &width, &height);
    return Extent2D(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
}

std::shared_ptr<Surface> GlfwWindow::CreateSurface(std::shared_ptr<Instance> instance) const {
    return Surface::Create(std::move(instance), window_);
}

bool GlfwWindow::ShouldClose() const {
    return glfwWindowShouldClose(window_) == GLFW_TRUE;
}

void GlfwWindow::PollEvents() const {
    glfwPollEvents();
}

void GlfwWindow::WaitEvents() const {
    glfwWaitEvents();
}

} // namespace trekanten
