// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/renderer/frame_scheduler.h"
#include "trekanten/backend/error.h"

#include <fmt/format.h>

namespace trekanten {

void FrameScheduler::CheckCurrent(u32 frameIdx) const {
    if (frameIdx != frame_idx_) {
        throw RenderError(ErrorKind::Frame,
                          fmt::format("Submitted frame {} while frame {} is current", frameIdx, frame_idx_));
    }
}

std::optional<u32> FrameScheduler::BoundFrame(u32 imageIdx) const {
    if (imageIdx >= image_to_frame_.size()) {
        return std::nullopt;
    }
    return image_to_frame_[imageIdx];
}

std::optional<u32> FrameScheduler::BindImage(u32 imageIdx) {
    if (imageIdx >= image_to_frame_.size()) {
        image_to_frame_.resize(imageIdx + 1);
    }

    const std::optional<u32> previous = image_to_frame_[imageIdx];
    image_to_frame_[imageIdx] = frame_idx_;
    return previous;
}

void FrameScheduler::Reset(u32 numImages) {
    image_to_frame_.assign(numImages, std::nullopt);
}

} // namespace trekanten
