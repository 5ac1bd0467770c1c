// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/core/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace trekanten::log
{

static std::shared_ptr<spdlog::logger> s_logger;

void init(spdlog::level::level_enum level)
{
    if (!s_logger)
    {
        s_logger = spdlog::get("trekanten");
    }

    if (!s_logger)
    {
        s_logger = spdlog::stdout_color_mt("trekanten");
        s_logger->set_pattern("[%T] [%^%l%$] %v");
    }

    s_logger->set_level(level);
    s_logger->debug("trekanten logging initialized at level {}", spdlog::level::to_string_view(level));
}

std::shared_ptr<spdlog::logger> get_logger()
{
    if (!s_logger)
    {
        init();
    }
    return s_logger;
}

} // namespace trekanten::log
