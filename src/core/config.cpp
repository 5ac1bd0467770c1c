// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/core/config.h"

#include <cctype>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace trekanten::config {

spdlog::level::level_enum parse_log_level(const std::string& value) {
    const auto lowered = [&]() {
        std::string tmp = value;
        for (char& c : tmp) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return tmp;
    }();

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical" || lowered == "fatal") return spdlog::level::critical;
    return spdlog::level::info;
}

AppConfig load_from_file(const std::filesystem::path& path) {
    AppConfig config{};
    config.config_path = path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Failed to open config file: " << path << "\n";
            return config;
        }

        nlohmann::json json;
        file >> json;

        // Parse into a copy so a half-read file does not leak into the result
        AppConfig parsed = config;

        if (auto window = json.find("window"); window != json.end()) {
            if (window->contains("width")) {
                parsed.window_width = (*window)["width"].get<int>();
            }
            if (window->contains("height")) {
                parsed.window_height = (*window)["height"].get<int>();
            }
            if (window->contains("title")) {
                parsed.window_title = (*window)["title"].get<std::string>();
            }
        }

        if (auto logging = json.find("logging"); logging != json.end()) {
            if (logging->contains("level")) {
                parsed.log_level = parse_log_level((*logging)["level"].get<std::string>());
            }
        }

        if (auto renderer = json.find("renderer"); renderer != json.end()) {
            if (renderer->contains("validation")) {
                parsed.enable_validation = (*renderer)["validation"].get<bool>();
            }
            if (renderer->contains("vsync")) {
                parsed.vsync = (*renderer)["vsync"].get<bool>();
            }
        }

        if (auto assets = json.find("assets"); assets != json.end()) {
            if (assets->contains("shader_dir")) {
                parsed.shader_dir = (*assets)["shader_dir"].get<std::string>();
            }
        }

        config = std::move(parsed);
    } catch (const std::exception& err) {
        std::cerr << "Error parsing config file: " << path << " -> " << err.what() << "\n";
    }

    return config;
}

} // namespace trekanten::config
