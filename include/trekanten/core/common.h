// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

// Platform detection
#if defined(_WIN32)
    #define TREKANTEN_PLATFORM_WINDOWS
#elif defined(__linux__)
    #define TREKANTEN_PLATFORM_LINUX
#elif defined(__APPLE__)
    #define TREKANTEN_PLATFORM_MACOS
#endif

namespace trekanten
{

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

using i32 = int32_t;
using i64 = int64_t;

using f32 = float;
using f64 = double;

using usize = size_t;

// Number of frames the CPU may record ahead of the GPU
constexpr u32 kMaxFramesInFlight = 2;

} // namespace trekanten

#define TREKANTEN_UNUSED(x) ((void)(x))
