// Scribble Texture Atlas
// atlas_storage.hpp - Layers, GPU texture and growth of a layered atlas

#pragma once

#include <scribble/atlas/guillotine_allocator.hpp>
#include <scribble/atlas/texture_tiles.hpp>
#include <scribble/graphics/device.hpp>
#include <scribble/graphics/texture.hpp>

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scribble::core {
class Config;
}

namespace scribble::atlas {

// Atlas configuration
struct LayeredAtlasDesc {
    uint32_t width = 2048;     // Requested layer size, clamped to the device limit
    uint32_t height = 2048;
    uint32_t tile_size = 128;  // Larger sources are split into tiles
    std::string debug_name = "LayeredAtlas";

    // atlas.width / atlas.height / atlas.tile_size
    [[nodiscard]] static LayeredAtlasDesc from_config(const core::Config& config);
};

// Format-independent part of LayeredAtlas: one sub-allocator per array layer
// of a single 2D array texture. When a tile fits nowhere the storage first
// adds a layer, then doubles the layer size, copying the old contents on the
// GPU and installing the new texture (needs_rebinding() turns true).
class AtlasStorage {
public:
    AtlasStorage(graphics::GraphicsDevice* device, graphics::TextureFormat format, const LayeredAtlasDesc& desc);
    ~AtlasStorage();

    // Non-copyable
    AtlasStorage(const AtlasStorage&) = delete;
    AtlasStorage& operator=(const AtlasStorage&) = delete;

    // ========================================================================
    // Tiles
    // ========================================================================

    // Pack the tile and upload its texels, growing the atlas when needed.
    // Throws AllocationExhausted when the device limits are reached.
    [[nodiscard]] AtlasLocation allocate_tile(const UnallocatedTile& tile);

    // Unknown or stale locations are logged and ignored
    void release_tile(const AtlasLocation& location);

    // ========================================================================
    // GPU Resources
    // ========================================================================

    [[nodiscard]] graphics::GraphicsDevice* get_device() const { return device_; }
    [[nodiscard]] graphics::Texture* get_texture() const { return texture_.get(); }

    // Set whenever the texture object was replaced
    [[nodiscard]] bool needs_rebinding() const { return needs_rebinding_; }
    void mark_bound() { needs_rebinding_ = false; }

    // ========================================================================
    // Info
    // ========================================================================

    [[nodiscard]] const std::string& get_debug_name() const { return debug_name_; }
    [[nodiscard]] graphics::TextureFormat get_format() const { return format_; }
    [[nodiscard]] uint32_t get_bytes_per_pixel() const { return bytes_per_pixel_; }
    [[nodiscard]] uint32_t get_tile_size() const { return tile_size_; }
    [[nodiscard]] glm::ivec2 get_size() const { return size_; }
    [[nodiscard]] glm::ivec2 get_max_size() const { return max_size_; }
    [[nodiscard]] uint32_t get_layer_count() const { return static_cast<uint32_t>(layers_.size()); }
    [[nodiscard]] uint32_t get_max_layers() const { return max_layers_; }
    [[nodiscard]] const GuillotineAllocator& get_layer(uint32_t layer) const { return layers_.at(layer); }

    [[nodiscard]] int64_t get_allocated_area() const;
    [[nodiscard]] size_t get_tile_count() const;

private:
    graphics::GraphicsDevice* device_;
    graphics::TextureFormat format_;
    uint32_t bytes_per_pixel_;
    uint32_t tile_size_;
    std::string debug_name_;

    glm::ivec2 size_;
    glm::ivec2 max_size_;
    uint32_t max_layers_;

    std::vector<GuillotineAllocator> layers_;
    std::unique_ptr<graphics::Texture> texture_;
    bool needs_rebinding_ = false;

    // First-fit by layer index
    std::optional<AtlasLocation> pack(glm::ivec2 size);
    void upload(const AtlasLocation& location, const UnallocatedTile& tile);

    bool add_layer();
    bool grow_size();

    [[nodiscard]] std::unique_ptr<graphics::Texture> create_texture(glm::ivec2 size, uint32_t layers) const;

    // GPU-copy `extent` of every current layer into `replacement` and install it
    void replace_texture(std::unique_ptr<graphics::Texture> replacement, glm::ivec2 extent);
};

}  // namespace scribble::atlas
