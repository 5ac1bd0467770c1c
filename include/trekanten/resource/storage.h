// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "trekanten/core/common.h"

namespace trekanten {

// Typed index into a Storage<T>. Only meaningful for the storage that issued it.
template<typename T>
class Handle {
public:
    Handle() = default;
    explicit Handle(uint64_t id) : id_(id) {}

    uint64_t id() const { return id_; }

    bool operator==(const Handle& other) const { return id_ == other.id_; }
    bool operator!=(const Handle& other) const { return id_ != other.id_; }
    bool operator<(const Handle& other) const { return id_ < other.id_; }

private:
    uint64_t id_ = 0;
};

template<typename T>
class Storage {
public:
    Storage() = default;

    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;
    Storage(Storage&&) = default;
    Storage& operator=(Storage&&) = default;

    Handle<T> Add(T value) {
        items_.push_back(std::move(value));
        return Handle<T>(items_.size() - 1);
    }

    const T* Get(const Handle<T>& h) const {
        if (h.id() >= items_.size()) {
            return nullptr;
        }
        return &items_[h.id()];
    }

    T* GetMut(const Handle<T>& h) {
        if (h.id() >= items_.size()) {
            return nullptr;
        }
        return &items_[h.id()];
    }

    size_t Size() const { return items_.size(); }
    bool Empty() const { return items_.empty(); }

    auto begin() { return items_.begin(); }
    auto end() { return items_.end(); }
    auto begin() const { return items_.begin(); }
    auto end() const { return items_.end(); }

private:
    std::vector<T> items_;
};

/**
 * @brief One Storage per frame in flight
 *
 * Resources the GPU may still read from the previous frame get one copy per
 * slot. A single handle addresses the same resource in every slot.
 */
template<typename T>
class BufferedStorage {
public:
    using Slots = std::array<T, kMaxFramesInFlight>;

    Handle<T> Add(Slots values) {
        Handle<T> handle;
        for (size_t i = 0; i < kMaxFramesInFlight; ++i) {
            handle = storage_[i].Add(std::move(values[i]));
        }
        return handle;
    }

    const T* Get(const Handle<T>& h, size_t frame_idx) const {
        if (frame_idx >= kMaxFramesInFlight) {
            return nullptr;
        }
        return storage_[frame_idx].Get(h);
    }

    T* GetMut(const Handle<T>& h, size_t frame_idx) {
        if (frame_idx >= kMaxFramesInFlight) {
            return nullptr;
        }
        return storage_[frame_idx].GetMut(h);
    }

    std::optional<std::array<const T*, kMaxFramesInFlight>> GetAll(const Handle<T>& h) const {
        std::array<const T*, kMaxFramesInFlight> all{};
        for (size_t i = 0; i < kMaxFramesInFlight; ++i) {
            all[i] = storage_[i].Get(h);
            if (!all[i]) {
                return std::nullopt;
            }
        }
        return all;
    }

    size_t Size() const { return storage_[0].Size(); }

private:
    std::array<Storage<T>, kMaxFramesInFlight> storage_;
};

} // namespace trekanten

namespace std {
template<typename T>
struct hash<trekanten::Handle<T>> {
    size_t operator()(const trekanten::Handle<T>& h) const { return std::hash<uint64_t>{}(h.id()); }
};
} // namespace std
