// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/resource/storage.h"

namespace trekanten {

// Creation failures are reported by throwing RenderError.
template<typename Descriptor, typename Resource>
class ResourceManager {
public:
    virtual ~ResourceManager() = default;

    virtual const Resource* GetResource(const Handle<Resource>& handle) const = 0;
    virtual Handle<Resource> CreateResource(const Descriptor& descriptor) = 0;
};

} // namespace trekanten
