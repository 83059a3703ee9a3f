// Scribble Rendering Tests
// texture_cache_test.cpp - Glyph and image cache tests

#include <gtest/gtest.h>
#include <scribble/graphics/software_device.hpp>
#include <scribble/rendering/texture_cache.hpp>

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace scribble::rendering::test {

class TextureCacheTest : public ::testing::Test {
protected:
    std::unique_ptr<graphics::SoftwareDevice> device_;
    std::unique_ptr<TextureCache> cache_;

    void SetUp() override {
        device_ = graphics::create_software_device();

        atlas::LayeredAtlasDesc desc;
        desc.width = 256;
        desc.height = 256;
        desc.tile_size = 64;
        cache_ = std::make_unique<TextureCache>(device_.get(), desc);
    }

    static std::vector<uint8_t> pixels(uint32_t width, uint32_t height, uint32_t bpp) {
        return std::vector<uint8_t>(static_cast<size_t>(width) * height * bpp, 0xAB);
    }
};

// ============================================================================
// Keys
// ============================================================================

TEST(GlyphCacheKeyTest, MakeStoresFontSizeBits) {
    auto a = GlyphCacheKey::make(1, 42, 16.0f);
    auto b = GlyphCacheKey::make(1, 42, 16.0f);
    auto c = GlyphCacheKey::make(1, 42, 16.5f);

    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
    EXPECT_EQ(std::hash<GlyphCacheKey>{}(a), std::hash<GlyphCacheKey>{}(b));
}

TEST(GlyphCacheKeyTest, HashSpreadsGlyphIds) {
    std::unordered_set<size_t> hashes;
    for (uint16_t id = 0; id < 256; id++) {
        hashes.insert(std::hash<GlyphCacheKey>{}(GlyphCacheKey::make(0, id, 12.0f)));
    }
    EXPECT_EQ(hashes.size(), 256u);
}

TEST(CacheKeyTest, GlyphAndImageKeysAreDistinct) {
    CacheKey glyph = GlyphCacheKey::make(0, 1, 12.0f);
    CacheKey image = ImageCacheKey{"logo"};
    CacheKey same_image = ImageCacheKey{"logo"};

    EXPECT_FALSE(glyph == image);
    EXPECT_EQ(image, same_image);
    EXPECT_EQ(std::hash<CacheKey>{}(image), std::hash<CacheKey>{}(same_image));
}

// ============================================================================
// Glyphs
// ============================================================================

TEST_F(TextureCacheTest, AtlasesUseMaskAndColorFormats) {
    EXPECT_EQ(cache_->get_mask_atlas().get_texture()->get_format(), graphics::TextureFormat::R8Unorm);
    EXPECT_EQ(cache_->get_color_atlas().get_texture()->get_format(), graphics::TextureFormat::RGBA8UnormSrgb);
    EXPECT_EQ(cache_->get_mask_atlas().get_storage().get_debug_name(), "MaskAtlas");
    EXPECT_EQ(cache_->get_color_atlas().get_storage().get_debug_name(), "ColorAtlas");
}

TEST_F(TextureCacheTest, RoutesGlyphsByContent) {
    auto key = GlyphCacheKey::make(0, 7, 14.0f);
    auto mask_pixels = pixels(8, 12, 1);
    auto color_pixels = pixels(8, 12, 4);

    auto mask = cache_->allocate_glyph(key, GlyphContent::Mask, {8, 12, 1, 10}, mask_pixels);
    EXPECT_EQ(cache_->get_mask_atlas().get_tracked_count(), 1u);
    EXPECT_EQ(cache_->get_color_atlas().get_tracked_count(), 0u);

    auto color = cache_->allocate_glyph(key, GlyphContent::Color, {8, 12, 1, 10}, color_pixels);
    EXPECT_EQ(cache_->get_color_atlas().get_tracked_count(), 1u);
    EXPECT_NE(mask, color);

    EXPECT_EQ(cache_->find_glyph(key, GlyphContent::Mask), mask);
    EXPECT_EQ(cache_->find_glyph(key, GlyphContent::Color), color);
    EXPECT_EQ(cache_->find_glyph(GlyphCacheKey::make(0, 8, 14.0f), GlyphContent::Mask), nullptr);
}

TEST_F(TextureCacheTest, GlyphKeepsPlacement) {
    auto key = GlyphCacheKey::make(2, 65, 20.0f);
    auto data = pixels(10, 14, 1);

    auto glyph = cache_->allocate_glyph(key, GlyphContent::Mask, {10, 14, -1, 12}, data);
    ASSERT_TRUE(glyph->get_data().has_value());
    EXPECT_EQ(*glyph->get_data(), (GlyphPlacement{10, 14, -1, 12}));

    // A repeat allocation is served from the cache
    EXPECT_EQ(cache_->allocate_glyph(key, GlyphContent::Mask, {10, 14, -1, 12}, data), glyph);
}

TEST_F(TextureCacheTest, GlyphMeshIsOffsetFromPen) {
    auto key = GlyphCacheKey::make(0, 3, 16.0f);
    auto data = pixels(10, 14, 1);
    auto glyph = cache_->allocate_glyph(key, GlyphContent::Mask, {10, 14, 2, 12}, data);

    auto mesh = cache_->glyph_to_mesh({100.0f, 50.0f}, glyph, GlyphContent::Mask);
    ASSERT_EQ(mesh.vertices.size(), 4u);
    ASSERT_EQ(mesh.indices.size(), 6u);

    EXPECT_FLOAT_EQ(mesh.vertices[0].position[0], 102.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[0].position[1], 38.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[2].position[0], 112.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[2].position[1], 52.0f);

    const auto& rect = glyph->get_tiles()[0].location.rect;
    EXPECT_FLOAT_EQ(mesh.vertices[0].texture_coords[0], static_cast<float>(rect.min.x) / 256.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[2].texture_coords[1], static_cast<float>(rect.max.y) / 256.0f);
}

TEST_F(TextureCacheTest, MissingGlyphGivesEmptyMesh) {
    EXPECT_TRUE(cache_->glyph_to_mesh({0.0f, 0.0f}, nullptr, GlyphContent::Mask).is_empty());
}

TEST_F(TextureCacheTest, EmptyGlyphHasNoQuads) {
    auto key = GlyphCacheKey::make(0, 32, 16.0f);
    auto space = cache_->allocate_glyph(key, GlyphContent::Mask, {0, 0, 0, 0}, {});
    ASSERT_NE(space, nullptr);
    EXPECT_TRUE(cache_->glyph_to_mesh({10.0f, 10.0f}, space, GlyphContent::Mask).is_empty());
}

// ============================================================================
// Images
// ============================================================================

TEST_F(TextureCacheTest, ImagesAreCachedByNameInColorAtlas) {
    auto data = pixels(100, 70, 4);

    auto image = cache_->allocate_image("logo", {data, 100, 70});
    EXPECT_EQ(image->get_tiles().size(), 4u);
    EXPECT_FALSE(image->get_data().has_value());
    EXPECT_EQ(cache_->get_color_atlas().get_tracked_count(), 1u);
    EXPECT_EQ(cache_->get_mask_atlas().get_tracked_count(), 0u);

    EXPECT_EQ(cache_->find_image("logo"), image);
    EXPECT_EQ(cache_->find_image("other"), nullptr);
    EXPECT_EQ(cache_->allocate_image("logo", {data, 100, 70}), image);
}

TEST_F(TextureCacheTest, ImageAndGlyphKeysDoNotCollide) {
    auto image_data = pixels(8, 8, 4);
    auto glyph_data = pixels(8, 8, 4);

    auto image = cache_->allocate_image("0", {image_data, 8, 8});
    auto glyph = cache_->allocate_glyph(GlyphCacheKey::make(0, 0, 0.0f), GlyphContent::Color, {8, 8, 0, 8},
                                        glyph_data);
    EXPECT_NE(image, glyph);
    EXPECT_EQ(cache_->get_color_atlas().get_tracked_count(), 2u);
}

// ============================================================================
// Atlas State
// ============================================================================

TEST_F(TextureCacheTest, RebindingFollowsEitherAtlas) {
    EXPECT_FALSE(cache_->needs_rebinding());

    // Twenty 64x64 tiles overflow one 256x256 layer
    std::vector<CachedTexture> held;
    for (int i = 0; i < 5; i++) {
        auto data = pixels(128, 128, 4);
        held.push_back(cache_->allocate_image("image" + std::to_string(i), {data, 128, 128}));
    }
    EXPECT_TRUE(cache_->get_color_atlas().needs_rebinding());
    EXPECT_FALSE(cache_->get_mask_atlas().needs_rebinding());
    EXPECT_TRUE(cache_->needs_rebinding());

    cache_->mark_bound();
    EXPECT_FALSE(cache_->needs_rebinding());
}

TEST_F(TextureCacheTest, CollectGarbageReclaimsDroppedEntries) {
    auto mask_data = pixels(6, 6, 1);
    auto image_data = pixels(6, 6, 4);

    auto kept = cache_->allocate_glyph(GlyphCacheKey::make(0, 1, 12.0f), GlyphContent::Mask, {6, 6, 0, 6}, mask_data);
    auto dropped =
        cache_->allocate_glyph(GlyphCacheKey::make(0, 2, 12.0f), GlyphContent::Mask, {6, 6, 0, 6}, mask_data);
    auto image = cache_->allocate_image("icon", {image_data, 6, 6});

    dropped.reset();
    image.reset();
    EXPECT_EQ(cache_->collect_garbage(), 2u);
    EXPECT_EQ(cache_->collect_garbage(), 0u);

    EXPECT_EQ(cache_->find_glyph(GlyphCacheKey::make(0, 1, 12.0f), GlyphContent::Mask), kept);
    EXPECT_EQ(cache_->find_glyph(GlyphCacheKey::make(0, 2, 12.0f), GlyphContent::Mask), nullptr);
    EXPECT_EQ(cache_->find_image("icon"), nullptr);
    EXPECT_EQ(cache_->get_mask_atlas().get_storage().get_allocated_area(), 36);
    EXPECT_EQ(cache_->get_color_atlas().get_storage().get_allocated_area(), 0);
}

}  // namespace scribble::rendering::test
