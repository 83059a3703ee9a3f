// Scribble Rendering System
// texture_cache.hpp - Glyph and image cache over a mask and a colour atlas

#pragma once

#include <scribble/atlas/layered_atlas.hpp>
#include <scribble/atlas/texture_mesh.hpp>

#include <glm/glm.hpp>

#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace scribble::rendering {

// ============================================================================
// Cache Keys
// ============================================================================

struct GlyphCacheKey {
    uint32_t font_index = 0;      // Index of the font in the font collection
    uint16_t glyph_id = 0;        // Glyph within that font
    uint32_t font_size_bits = 0;  // Bit pattern of the float font size

    static GlyphCacheKey make(uint32_t font_index, uint16_t glyph_id, float font_size) {
        GlyphCacheKey key;
        key.font_index = font_index;
        key.glyph_id = glyph_id;
        std::memcpy(&key.font_size_bits, &font_size, sizeof(float));
        return key;
    }

    bool operator==(const GlyphCacheKey& other) const {
        return font_index == other.font_index && glyph_id == other.glyph_id && font_size_bits == other.font_size_bits;
    }
};

struct ImageCacheKey {
    std::string name;

    bool operator==(const ImageCacheKey& other) const { return name == other.name; }
};

using CacheKey = std::variant<GlyphCacheKey, ImageCacheKey>;

// Offset of the glyph bitmap from the pen position, y up
struct GlyphPlacement {
    uint32_t width = 0;
    uint32_t height = 0;
    int32_t left = 0;
    int32_t top = 0;

    bool operator==(const GlyphPlacement& other) const {
        return width == other.width && height == other.height && left == other.left && top == other.top;
    }
};

// Set for glyphs, empty for images
using TextureData = std::optional<GlyphPlacement>;

enum class GlyphContent : uint8_t {
    Mask,   // Coverage only, tinted when drawn
    Color,  // Emoji and other colour glyphs
};

}  // namespace scribble::rendering

namespace std {

template<>
struct hash<scribble::rendering::GlyphCacheKey> {
    size_t operator()(const scribble::rendering::GlyphCacheKey& key) const noexcept {
        size_t result = std::hash<uint32_t>{}(key.font_index);
        result ^= std::hash<uint16_t>{}(key.glyph_id) * 0x9e3779b97f4a7c15ULL + (result << 6) + (result >> 2);
        result ^= std::hash<uint32_t>{}(key.font_size_bits) * 0x9e3779b97f4a7c15ULL + (result << 6) + (result >> 2);
        return result;
    }
};

template<>
struct hash<scribble::rendering::ImageCacheKey> {
    size_t operator()(const scribble::rendering::ImageCacheKey& key) const noexcept {
        return std::hash<std::string>{}(key.name);
    }
};

}  // namespace std

namespace scribble::rendering {

using MaskAtlas = atlas::LayeredAtlas<atlas::formats::Mask, CacheKey, TextureData>;
using ColorAtlas = atlas::LayeredAtlas<atlas::formats::Rgba8, CacheKey, TextureData>;

// Both atlases hand out the same handle type
using CachedTexture = MaskAtlas::AllocationPtr;

// Owns the atlases every text and image primitive samples from
class TextureCache {
public:
    explicit TextureCache(graphics::GraphicsDevice* device, const atlas::LayeredAtlasDesc& desc = {});
    ~TextureCache();

    // Non-copyable
    TextureCache(const TextureCache&) = delete;
    TextureCache& operator=(const TextureCache&) = delete;

    // ========================================================================
    // Glyphs
    // ========================================================================

    // pixels: placement.width x placement.height texels, 1 byte each for
    // Mask content and 4 (RGBA) for Color content
    CachedTexture allocate_glyph(const GlyphCacheKey& key, GlyphContent content, const GlyphPlacement& placement,
                                 std::span<const uint8_t> pixels);

    [[nodiscard]] CachedTexture find_glyph(const GlyphCacheKey& key, GlyphContent content) const;

    // Quad of the glyph for a pen position, origin + (left, -top) sized (width, height)
    [[nodiscard]] atlas::TextureMesh glyph_to_mesh(glm::vec2 origin, const CachedTexture& glyph,
                                                   GlyphContent content) const;

    // ========================================================================
    // Images
    // ========================================================================

    // RGBA8 texels, cached by name in the colour atlas
    CachedTexture allocate_image(std::string_view name, const atlas::UnallocatedTexture& texture);

    [[nodiscard]] CachedTexture find_image(std::string_view name) const;

    // ========================================================================
    // Atlas State
    // ========================================================================

    [[nodiscard]] bool needs_rebinding() const;
    void mark_bound();

    // Reclaim everything no longer referenced, returns the number reclaimed
    size_t collect_garbage();

    [[nodiscard]] MaskAtlas& get_mask_atlas() { return mask_atlas_; }
    [[nodiscard]] const MaskAtlas& get_mask_atlas() const { return mask_atlas_; }
    [[nodiscard]] ColorAtlas& get_color_atlas() { return color_atlas_; }
    [[nodiscard]] const ColorAtlas& get_color_atlas() const { return color_atlas_; }

private:
    MaskAtlas mask_atlas_;
    ColorAtlas color_atlas_;
};

}  // namespace scribble::rendering
