// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace trekanten::log {

/**
 * @brief Initialize the logging system
 *
 * Safe to call more than once; later calls only change the level.
 *
 * @param level Log level (trace, debug, info, warn, error, critical)
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Get the default logger, initializing it on first use
 */
std::shared_ptr<spdlog::logger> get_logger();

} // namespace trekanten::log

#define TREKANTEN_LOG_TRACE(...) ::trekanten::log::get_logger()->trace(__VA_ARGS__)
#define TREKANTEN_LOG_DEBUG(...) ::trekanten::log::get_logger()->debug(__VA_ARGS__)
#define TREKANTEN_LOG_INFO(...)  ::trekanten::log::get_logger()->info(__VA_ARGS__)
#define TREKANTEN_LOG_WARN(...)  ::trekanten::log::get_logger()->warn(__VA_ARGS__)
#define TREKANTEN_LOG_ERROR(...) ::trekanten::log::get_logger()->error(__VA_ARGS__)
#define TREKANTEN_LOG_CRITICAL(...) ::trekanten::log::get_logger()->critical(__VA_ARGS__)
