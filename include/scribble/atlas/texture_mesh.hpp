// Scribble Texture Atlas
// texture_mesh.hpp - Textured quad meshes sampling the atlas

#pragma once

#include <scribble/atlas/texture_tiles.hpp>
#include <scribble/graphics/types.hpp>

#include <glm/glm.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace scribble::atlas {

// Axis-aligned float rectangle in screen space, y grows downwards
struct Box2D {
    glm::vec2 min{0.0f};
    glm::vec2 max{0.0f};

    static Box2D from_origin_size(glm::vec2 origin, glm::vec2 size) { return {origin, origin + size}; }

    [[nodiscard]] float width() const { return max.x - min.x; }
    [[nodiscard]] float height() const { return max.y - min.y; }
    [[nodiscard]] glm::vec2 size() const { return max - min; }

    // Also true for NaN extents
    [[nodiscard]] bool is_empty() const { return !(max.x > min.x && max.y > min.y); }
};

// Vertex of a quad sampling one atlas layer (20 bytes)
struct TextureVertex {
    float position[2];
    uint32_t texture_layer;
    float texture_coords[2];

    // Create vertex attribute descriptions for pipeline creation
    static std::vector<graphics::VertexAttribute> get_attributes() {
        return {
            // location 0: position (vec2)
            {0, 0, graphics::TextureFormat::RG32Float, 0},
            // location 1: array layer (uint)
            {1, 0, graphics::TextureFormat::R32Uint, 8},
            // location 2: uv (vec2)
            {2, 0, graphics::TextureFormat::RG32Float, 12},
        };
    }

    static graphics::VertexBinding get_binding() { return {0, sizeof(TextureVertex), false}; }
};

static_assert(sizeof(TextureVertex) == 20, "TextureVertex must be 20 bytes");

struct TextureMesh {
    std::vector<TextureVertex> vertices;
    std::vector<uint32_t> indices;

    // Append another mesh, offsetting its indices past our vertices
    void append(const TextureMesh& other);

    // Vertices in order top-left, top-right, bottom-right, bottom-left
    void append_quad(const Box2D& position, const Box2D& uv, uint32_t layer);

    void translate(glm::vec2 offset);

    void clear() {
        vertices.clear();
        indices.clear();
    }

    [[nodiscard]] bool is_empty() const { return indices.empty(); }
};

// One quad per tile. Tile (column, row) lands at
// area.min + (column, row) * tile_size * scale with scale = area.size / texture_size,
// UVs are the packed rectangle divided by atlas_size.
// An empty area, texture or atlas yields an empty mesh.
[[nodiscard]] TextureMesh project_tiles(std::span<const AllocatedTile> tiles, uint32_t tile_size,
                                        glm::uvec2 texture_size, const Box2D& area, glm::ivec2 atlas_size);

}  // namespace scribble::atlas
