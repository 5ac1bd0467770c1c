// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "trekanten/backend/image.h"
#include "trekanten/backend/image_view.h"
#include "trekanten/backend/util.h"
#include "trekanten/resource/cached_storage.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <vulkan/vulkan.h>

namespace trekanten {

class CommandPool;
class Device;
class Queue;

struct TextureDescriptor {
    std::filesystem::path file_path;

    bool operator==(const TextureDescriptor& other) const { return file_path == other.file_path; }
};

struct TextureDescriptorHash {
    size_t operator()(const TextureDescriptor& desc) const { return std::filesystem::hash_value(desc.file_path); }
};

// RGBA8 pixels decoded from an image file
struct ImageData {
    std::vector<uint8_t> pixels;
    Extent2D extent;
};

// Throws Texture when the file cannot be decoded
ImageData LoadImageRgba8(const std::filesystem::path& path);

class Sampler {
public:
    Sampler(std::shared_ptr<Device> device, uint32_t mipLevels);
    ~Sampler();

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;
    Sampler(Sampler&& other) noexcept;
    Sampler& operator=(Sampler&& other) noexcept;

    VkSampler GetRaw() const { return raw_; }

private:
    void Destroy();

    std::shared_ptr<Device> device_;
    VkSampler raw_ = VK_NULL_HANDLE;
};

class Texture {
public:
    static constexpr Format kFormat{ComponentLayout::R8G8B8A8, ColorSpace::Srgb};

    static Texture Create(std::shared_ptr<Device> device, const Queue& queue, const CommandPool& pool,
                          const TextureDescriptor& descriptor);

    const DeviceImage& GetImage() const { return image_; }
    const ImageView& GetImageView() const { return view_; }
    const Sampler& GetSampler() const { return sampler_; }

private:
    Texture(DeviceImage image, ImageView view, Sampler sampler)
        : image_(std::move(image)), view_(std::move(view)), sampler_(std::move(sampler)) {}

    DeviceImage image_;
    ImageView view_;
    Sampler sampler_;
};

using TextureHandle = Handle<Texture>;
using Textures = CachedStorage<TextureDescriptor, Texture, TextureDescriptorHash>;

} // namespace trekanten
