// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

namespace trekanten::config {

struct AppConfig {
    int window_width = 300;
    int window_height = 300;
    std::string window_title = "Trekanten";
    spdlog::level::level_enum log_level = spdlog::level::info;
    bool enable_validation = true;
    bool vsync = false;
    std::filesystem::path shader_dir = "shaders";
    std::filesystem::path config_path;
};

// Missing or unreadable files leave the defaults in place.
AppConfig load_from_file(const std::filesystem::path& path);

spdlog::level::level_enum parse_log_level(const std::string& value);

} // namespace trekanten::config
