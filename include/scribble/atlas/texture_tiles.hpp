// Scribble Texture Atlas
// texture_tiles.hpp - Source images, tiles and their placement in the atlas

#pragma once

#include <scribble/atlas/guillotine_allocator.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace scribble::atlas {

// Tightly packed source texels, not owned
struct UnallocatedTexture {
    std::span<const uint8_t> data;
    uint32_t width = 0;
    uint32_t height = 0;
};

// One chunk of a source image at grid position (column, row)
struct UnallocatedTile {
    std::vector<uint8_t> data;
    uint32_t column = 0;
    uint32_t row = 0;
    uint32_t width = 0;
    uint32_t height = 0;
};

// Where a tile was packed
struct AtlasLocation {
    uint32_t layer = 0;
    AllocId id;
    AtlasRect rect;
};

struct AllocatedTile {
    uint32_t column = 0;
    uint32_t row = 0;
    AtlasLocation location;
};

// Split a texture into a row-major grid of at most tile_size x tile_size
// tiles. Right and bottom edge tiles are clipped, never padded.
// Throws InvalidTextureData when data holds fewer than width * height texels.
[[nodiscard]] std::vector<UnallocatedTile> tile_texture(const UnallocatedTexture& texture, uint32_t tile_size,
                                                        uint32_t bytes_per_pixel);

// Number of tiles along an edge of the given length
[[nodiscard]] constexpr uint32_t tile_count(uint32_t length, uint32_t tile_size) {
    return tile_size == 0 ? 0 : (length + tile_size - 1) / tile_size;
}

}  // namespace scribble::atlas
