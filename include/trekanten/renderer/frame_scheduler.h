// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/core/common.h"

#include <optional>
#include <vector>

namespace trekanten {

/**
 * @brief Bookkeeping for frames in flight
 *
 * Tracks the current frame slot and which slot last rendered to each
 * swapchain image, so the renderer knows whose fence to wait for before
 * reusing an image.
 */
class FrameScheduler {
public:
    explicit FrameScheduler(u32 numImages = 0) { Reset(numImages); }

    u32 FrameIdx() const { return frame_idx_; }

    // Throws a Frame error unless frameIdx is the current frame slot
    void CheckCurrent(u32 frameIdx) const;

    std::optional<u32> BoundFrame(u32 imageIdx) const;

    // Binds the image to the current frame and returns the frame it was bound to before
    std::optional<u32> BindImage(u32 imageIdx);

    void Advance() { frame_idx_ = (frame_idx_ + 1) % kMaxFramesInFlight; }

    // Forgets every image binding, e.g. after the swapchain was recreated
    void Reset(u32 numImages);

private:
    u32 frame_idx_ = 0;
    std::vector<std::optional<u32>> image_to_frame_;
};

} // namespace trekanten
