// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <unordered_map>
#include <utility>

#include "trekanten/resource/storage.h"

namespace trekanten {

// Storage that hands out the same handle for equal descriptors.
template<typename Descriptor, typename T, typename Hash = std::hash<Descriptor>>
class CachedStorage {
public:
    template<typename Factory>
    Handle<T> CreateOrAdd(const Descriptor& descriptor, Factory&& factory) {
        if (auto it = cache_.find(descriptor); it != cache_.end()) {
            return it->second;
        }

        Handle<T> handle = storage_.Add(factory(descriptor));
        cache_.emplace(descriptor, handle);
        return handle;
    }

    bool Contains(const Descriptor& descriptor) const { return cache_.find(descriptor) != cache_.end(); }

    const T* Get(const Handle<T>& h) const { return storage_.Get(h); }
    T* GetMut(const Handle<T>& h) { return storage_.GetMut(h); }

    size_t Size() const { return storage_.Size(); }

private:
    Storage<T> storage_;
    std::unordered_map<Descriptor, Handle<T>, Hash> cache_;
};

} // namespace trekanten
