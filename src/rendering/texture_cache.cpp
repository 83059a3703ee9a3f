// Scribble Rendering System
// texture_cache.cpp - Glyph and image cache implementation

#include <scribble/core/logger.hpp>
#include <scribble/rendering/texture_cache.hpp>

namespace scribble::rendering {

namespace {

atlas::LayeredAtlasDesc named(const atlas::LayeredAtlasDesc& desc, const char* name) {
    atlas::LayeredAtlasDesc result = desc;
    result.debug_name = name;
    return result;
}

}  // namespace

TextureCache::TextureCache(graphics::GraphicsDevice* device, const atlas::LayeredAtlasDesc& desc)
    : mask_atlas_(device, named(desc, "MaskAtlas")), color_atlas_(device, named(desc, "ColorAtlas")) {
    SCRIBBLE_LOG_INFO(core::log_category::CACHE, "Texture cache ready ({}x{} atlases, tile size {})",
                      mask_atlas_.get_size().x, mask_atlas_.get_size().y, mask_atlas_.get_tile_size());
}

TextureCache::~TextureCache() = default;

// ============================================================================
// Glyphs
// ============================================================================

CachedTexture TextureCache::allocate_glyph(const GlyphCacheKey& key, GlyphContent content,
                                           const GlyphPlacement& placement, std::span<const uint8_t> pixels) {
    atlas::UnallocatedTexture texture{pixels, placement.width, placement.height};
    if (content == GlyphContent::Color) {
        return color_atlas_.allocate(texture, CacheKey{key}, placement);
    }
    return mask_atlas_.allocate(texture, CacheKey{key}, placement);
}

CachedTexture TextureCache::find_glyph(const GlyphCacheKey& key, GlyphContent content) const {
    if (content == GlyphContent::Color) {
        return color_atlas_.is_allocated(CacheKey{key});
    }
    return mask_atlas_.is_allocated(CacheKey{key});
}

atlas::TextureMesh TextureCache::glyph_to_mesh(glm::vec2 origin, const CachedTexture& glyph,
                                               GlyphContent content) const {
    if (!glyph) {
        return {};
    }

    GlyphPlacement placement{glyph->get_width(), glyph->get_height(), 0, 0};
    if (glyph->get_data()) {
        placement = *glyph->get_data();
    }

    const glm::vec2 top_left =
        origin + glm::vec2(static_cast<float>(placement.left), -static_cast<float>(placement.top));
    const auto area = atlas::Box2D::from_origin_size(
        top_left, glm::vec2(static_cast<float>(placement.width), static_cast<float>(placement.height)));

    if (content == GlyphContent::Color) {
        return glyph->to_mesh(area, color_atlas_);
    }
    return glyph->to_mesh(area, mask_atlas_);
}

// ============================================================================
// Images
// ============================================================================

CachedTexture TextureCache::allocate_image(std::string_view name, const atlas::UnallocatedTexture& texture) {
    auto image = color_atlas_.allocate(texture, CacheKey{ImageCacheKey{std::string(name)}}, std::nullopt);
    SCRIBBLE_LOG_DEBUG(core::log_category::CACHE, "Image '{}' ({}x{}) cached in {} tiles", name, texture.width,
                       texture.height, image->get_tiles().size());
    return image;
}

CachedTexture TextureCache::find_image(std::string_view name) const {
    return color_atlas_.is_allocated(CacheKey{ImageCacheKey{std::string(name)}});
}

// ============================================================================
// Atlas State
// ============================================================================

bool TextureCache::needs_rebinding() const {
    return mask_atlas_.needs_rebinding() || color_atlas_.needs_rebinding();
}

void TextureCache::mark_bound() {
    mask_atlas_.mark_bound();
    color_atlas_.mark_bound();
}

size_t TextureCache::collect_garbage() {
    size_t reclaimed = mask_atlas_.deallocate() + color_atlas_.deallocate();
    if (reclaimed > 0) {
        SCRIBBLE_LOG_DEBUG(core::log_category::CACHE, "Collected {} unused textures", reclaimed);
    }
    return reclaimed;
}

}  // namespace scribble::rendering
