#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/descriptor.h>
#include <trekanten/backend/error.h>

#include <vector>

using namespace trekanten;

namespace {

VkDescriptorSetLayoutBinding Binding(uint32_t binding, VkDescriptorType type) {
    VkDescriptorSetLayoutBinding b{};
    b.binding = binding;
    b.descriptorType = type;
    b.descriptorCount = 1;
    b.stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
    return b;
}

const VkDescriptorSetLayoutBinding kUbo = Binding(0, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);
const VkDescriptorSetLayoutBinding kSampler = Binding(1, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER);

ErrorKind KindOf(const std::vector<DescriptorSetLayoutData>& layouts, bool withTexture) {
    try {
        CheckDescriptorSetLayout(layouts, withTexture);
    } catch (const RenderError& e) {
        return e.GetKind();
    }
    return ErrorKind::Frame;
}

} // namespace

TEST_CASE("Descriptor set layout checks", "[backend][descriptor]") {
    SECTION("Uniform buffer only") {
        REQUIRE_NOTHROW(CheckDescriptorSetLayout({{0, {kUbo}}}, false));
    }

    SECTION("Uniform buffer and texture") {
        REQUIRE_NOTHROW(CheckDescriptorSetLayout({{0, {kUbo, kSampler}}}, true));
    }

    SECTION("Only a later set is declared") {
        REQUIRE(KindOf({{1, {kUbo}}}, false) == ErrorKind::DescriptorSet);
    }

    SECTION("No sets at all") {
        REQUIRE_THROWS_AS(CheckDescriptorSetLayout({}, false), RenderError);
    }

    SECTION("Binding 0 is not a uniform buffer") {
        REQUIRE(KindOf({{0, {Binding(0, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER)}}}, false) ==
                ErrorKind::DescriptorSet);
    }

    SECTION("Texture without a sampler binding") {
        REQUIRE(KindOf({{0, {kUbo}}}, true) == ErrorKind::DescriptorSet);
    }

    SECTION("Sampler binding without a texture") {
        REQUIRE(KindOf({{0, {kUbo, kSampler}}}, false) == ErrorKind::DescriptorSet);
    }

    SECTION("Binding 1 of the wrong type") {
        REQUIRE(KindOf({{0, {kUbo, Binding(1, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER)}}}, true) ==
                ErrorKind::DescriptorSet);
    }
}
