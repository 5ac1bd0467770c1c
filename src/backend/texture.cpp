// trekanten - thin RAII wrapper over Vulkan
// Copyright (c) 2025 trekanten Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "trekanten/backend/texture.h"
#include "trekanten/backend/device.h"
#include "trekanten/backend/error.h"
#include "trekanten/core/log.h"

#include <cstring>
#include <fmt/format.h>
#include <utility>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace trekanten {

ImageData LoadImageRgba8(const std::filesystem::path& path) {
    int width = 0;
    int height = 0;
    int channels = 0;

    stbi_uc* pixels = stbi_load(path.string().c_str(), &width, &height, &channels, STBI_rgb_alpha);
    if (pixels == nullptr) {
        throw RenderError(ErrorKind::Texture,
                          fmt::format("Failed to load {} ({})", path.string(), stbi_failure_reason()));
    }

    ImageData data;
    data.extent = Extent2D(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    data.pixels.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 4);
    std::memcpy(data.pixels.data(), pixels, data.pixels.size());
    stbi_image_free(pixels);

    TREKANTEN_LOG_DEBUG("Loaded image {} ({}x{}, {} source channels)", path.string(), width, height, channels);
    return data;
}

Sampler::Sampler(std::shared_ptr<Device> device, uint32_t mipLevels) : device_(std::move(device)) {
    VkSamplerCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    info.magFilter = VK_FILTER_LINEAR;
    info.minFilter = VK_FILTER_LINEAR;
    info.addressModeU = VK_SAMPLER_ADDRESS_MODE_REPEAT;
    info.addressModeV = VK_SAMPLER_ADDRESS_MODE_REPEAT;
    info.addressModeW = VK_SAMPLER_ADDRESS_MODE_REPEAT;
    info.anisotropyEnable = device_->SupportsSamplerAnisotropy() ? VK_TRUE : VK_FALSE;
    info.maxAnisotropy = device_->SupportsSamplerAnisotropy() ? 16.0f : 1.0f;
    info.borderColor = VK_BORDER_COLOR_INT_OPAQUE_BLACK;
    info.unnormalizedCoordinates = VK_FALSE;
    info.compareEnable = VK_FALSE;
    info.compareOp = VK_COMPARE_OP_ALWAYS;
    info.mipmapMode = VK_SAMPLER_MIPMAP_MODE_LINEAR;
    info.mipLodBias = 0.0f;
    info.minLod = 0.0f;
    info.maxLod = static_cast<float>(mipLevels);

    CheckVk(vkCreateSampler(device_->GetRaw(), &info, nullptr, &raw_), ErrorKind::Texture, "vkCreateSampler");
}

Sampler::~Sampler() {
    Destroy();
}

void Sampler::Destroy() {
    if (raw_ != VK_NULL_HANDLE) {
        vkDestroySampler(device_->GetRaw(), raw_, nullptr);
        raw_ = VK_NULL_HANDLE;
    }
}

Sampler::Sampler(Sampler&& other) noexcept
    : device_(std::move(other.device_)), raw_(std::exchange(other.raw_, VK_NULL_HANDLE)) {}

Sampler& Sampler::operator=(Sampler&& other) noexcept {
    if (this != &other) {
        Destroy();
        device_ = std::move(other.device_);
        raw_ = std::exchange(other.raw_, VK_NULL_HANDLE);
    }
    return *this;
}

Texture Texture::Create(std::shared_ptr<Device> device, const Queue& queue, const CommandPool& pool,
                        const TextureDescriptor& descriptor) {
    const ImageData image = LoadImageRgba8(descriptor.file_path);
    const uint32_t mipLevels = MipLevelsFor(image.extent);

    try {
        DeviceImage deviceImage =
            DeviceImage::DeviceLocalMipmapped(device, queue, pool, image.extent, kFormat.ToVk(), mipLevels, image.pixels);
        ImageView view(device, deviceImage.GetRaw(), kFormat.ToVk(), VK_IMAGE_ASPECT_COLOR_BIT, mipLevels);
        Sampler sampler(std::move(device), mipLevels);
        return Texture(std::move(deviceImage), std::move(view), std::move(sampler));
    } catch (const RenderError& e) {
        throw RenderError::Wrap(ErrorKind::Texture, e);
    }
}

} // namespace trekanten
