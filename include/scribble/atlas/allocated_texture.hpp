// Scribble Texture Atlas
// allocated_texture.hpp - Shared handle of a texture placed in an atlas

#pragma once

#include <scribble/atlas/texture_mesh.hpp>
#include <scribble/atlas/texture_tiles.hpp>

#include <glm/glm.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace scribble::atlas {

// Immutable result of LayeredAtlas::allocate. Holders share it through a
// std::shared_ptr; the atlas reclaims the tiles in its next deallocate()
// sweep once the last holder has released it.
template<typename Data>
class AllocatedTexture {
public:
    AllocatedTexture(std::vector<AllocatedTile> tiles, uint32_t tile_size, uint32_t width, uint32_t height, Data data)
        : tiles_(std::move(tiles)), tile_size_(tile_size), width_(width), height_(height), data_(std::move(data)) {}

    // Row-major, one per (row, column) chunk of the source
    [[nodiscard]] const std::vector<AllocatedTile>& get_tiles() const { return tiles_; }
    [[nodiscard]] uint32_t get_tile_size() const { return tile_size_; }
    [[nodiscard]] uint32_t get_width() const { return width_; }
    [[nodiscard]] uint32_t get_height() const { return height_; }
    [[nodiscard]] const Data& get_data() const { return data_; }

    // Quads covering `area`, sampling an atlas of atlas_size pixels per layer
    [[nodiscard]] TextureMesh to_mesh(const Box2D& area, glm::ivec2 atlas_size) const {
        return project_tiles(tiles_, tile_size_, glm::uvec2(width_, height_), area, atlas_size);
    }

    // Atlas is any type with get_size(), normally the LayeredAtlas that allocated us
    template<typename Atlas>
    [[nodiscard]] TextureMesh to_mesh(const Box2D& area, const Atlas& atlas) const {
        return to_mesh(area, atlas.get_size());
    }

private:
    std::vector<AllocatedTile> tiles_;
    uint32_t tile_size_;
    uint32_t width_;
    uint32_t height_;
    Data data_;
};

}  // namespace scribble::atlas
