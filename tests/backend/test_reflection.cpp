#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/error.h>
#include <trekanten/backend/reflection.h>
#include <trekanten/backend/shader.h>

using namespace trekanten;

namespace {

VkDescriptorSetLayoutBinding Binding(uint32_t binding, VkDescriptorType type, VkShaderStageFlags stages) {
    VkDescriptorSetLayoutBinding b{};
    b.binding = binding;
    b.descriptorType = type;
    b.descriptorCount = 1;
    b.stageFlags = stages;
    return b;
}

} // namespace

TEST_CASE("Descriptor set reflection", "[backend][reflection]") {
    auto spirv = ReadSpirv(TREKANTEN_TEST_SHADER_DIR "/ubo.vert.spv");
    auto sets = ParseDescriptorSets(spirv);

    REQUIRE(sets.size() == 1);
    REQUIRE(sets[0].set_idx == 0);
    REQUIRE(sets[0].bindings.size() == 2);

    SECTION("Uniform buffer") {
        const auto& ubo = sets[0].bindings[0];
        REQUIRE(ubo.binding == 0);
        REQUIRE(ubo.descriptorType == VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);
        REQUIRE(ubo.descriptorCount == 1);
        REQUIRE(ubo.stageFlags == VK_SHADER_STAGE_VERTEX_BIT);
    }

    SECTION("Combined image sampler") {
        const auto& sampler = sets[0].bindings[1];
        REQUIRE(sampler.binding == 1);
        REQUIRE(sampler.descriptorType == VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER);
    }
}

TEST_CASE("Invalid SPIR-V is rejected", "[backend][reflection]") {
    REQUIRE_THROWS_AS(ParseDescriptorSets({0xdeadbeef, 0, 0, 0, 0}), RenderError);
}

TEST_CASE("Descriptor set merging", "[backend][reflection]") {
    const std::vector<DescriptorSetLayoutData> vertex = {
        {0, {Binding(0, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, VK_SHADER_STAGE_VERTEX_BIT)}}};

    SECTION("Shared binding gets both stages") {
        const std::vector<DescriptorSetLayoutData> fragment = {
            {0,
             {Binding(0, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, VK_SHADER_STAGE_FRAGMENT_BIT),
              Binding(1, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT)}}};

        auto merged = MergeDescriptorSetLayouts(vertex, fragment);

        REQUIRE(merged.size() == 1);
        REQUIRE(merged[0].bindings.size() == 2);
        REQUIRE(merged[0].bindings[0].stageFlags == (VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT));
        REQUIRE(merged[0].bindings[1].stageFlags == VK_SHADER_STAGE_FRAGMENT_BIT);
    }

    SECTION("Distinct sets are kept sorted") {
        const std::vector<DescriptorSetLayoutData> fragment = {
            {2, {Binding(0, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT)}}};

        auto merged = MergeDescriptorSetLayouts(fragment, vertex);

        REQUIRE(merged.size() == 2);
        REQUIRE(merged[0].set_idx == 0);
        REQUIRE(merged[1].set_idx == 2);
    }

    SECTION("Conflicting types throw") {
        const std::vector<DescriptorSetLayoutData> fragment = {
            {0, {Binding(0, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT)}}};

        REQUIRE_THROWS_AS(MergeDescriptorSetLayouts(vertex, fragment), RenderError);
    }
}
