// Scribble Texture Atlas
// texture_tiles.cpp - Tiling of source images

#include <scribble/atlas/atlas_error.hpp>
#include <scribble/atlas/texture_tiles.hpp>
#include <scribble/core/logger.hpp>

#include <algorithm>
#include <cstring>

namespace scribble::atlas {

std::vector<UnallocatedTile> tile_texture(const UnallocatedTexture& texture, uint32_t tile_size,
                                          uint32_t bytes_per_pixel) {
    if (tile_size == 0 || bytes_per_pixel == 0) {
        SCRIBBLE_LOG_ERROR(core::log_category::ATLAS, "Cannot tile with tile size {} and {} bytes per pixel",
                           tile_size, bytes_per_pixel);
        throw AtlasError("Tile size and bytes per pixel must be non-zero");
    }

    const size_t row_bytes = static_cast<size_t>(texture.width) * bytes_per_pixel;
    const size_t expected = row_bytes * texture.height;
    if (texture.data.size() < expected) {
        SCRIBBLE_LOG_ERROR(core::log_category::ATLAS, "Texture {}x{} needs {} bytes, got {}", texture.width,
                           texture.height, expected, texture.data.size());
        throw InvalidTextureData(fmt::format("Texture {}x{} needs {} bytes, got {}", texture.width, texture.height,
                                             expected, texture.data.size()));
    }

    const uint32_t columns = tile_count(texture.width, tile_size);
    const uint32_t rows = tile_count(texture.height, tile_size);

    std::vector<UnallocatedTile> tiles;
    tiles.reserve(static_cast<size_t>(columns) * rows);

    for (uint32_t row = 0; row < rows; row++) {
        for (uint32_t column = 0; column < columns; column++) {
            UnallocatedTile tile;
            tile.column = column;
            tile.row = row;
            tile.width = std::min(tile_size, texture.width - column * tile_size);
            tile.height = std::min(tile_size, texture.height - row * tile_size);

            const size_t tile_row_bytes = static_cast<size_t>(tile.width) * bytes_per_pixel;
            tile.data.resize(tile_row_bytes * tile.height);

            const size_t x_offset = static_cast<size_t>(column) * tile_size * bytes_per_pixel;
            for (uint32_t y = 0; y < tile.height; y++) {
                const size_t src_row = static_cast<size_t>(row) * tile_size + y;
                std::memcpy(tile.data.data() + y * tile_row_bytes, texture.data.data() + src_row * row_bytes + x_offset,
                            tile_row_bytes);
            }

            tiles.push_back(std::move(tile));
        }
    }

    return tiles;
}

}  // namespace scribble::atlas
