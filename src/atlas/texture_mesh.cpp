// Scribble Texture Atlas
// texture_mesh.cpp - Quad generation for allocated textures

#include <scribble/atlas/texture_mesh.hpp>

namespace scribble::atlas {

namespace {
constexpr uint32_t QUAD_INDICES[6] = {0, 1, 2, 0, 2, 3};
}

void TextureMesh::append(const TextureMesh& other) {
    const auto base = static_cast<uint32_t>(vertices.size());
    vertices.insert(vertices.end(), other.vertices.begin(), other.vertices.end());
    indices.reserve(indices.size() + other.indices.size());
    for (uint32_t index : other.indices) {
        indices.push_back(base + index);
    }
}

void TextureMesh::append_quad(const Box2D& position, const Box2D& uv, uint32_t layer) {
    const auto base = static_cast<uint32_t>(vertices.size());

    vertices.push_back({{position.min.x, position.min.y}, layer, {uv.min.x, uv.min.y}});
    vertices.push_back({{position.max.x, position.min.y}, layer, {uv.max.x, uv.min.y}});
    vertices.push_back({{position.max.x, position.max.y}, layer, {uv.max.x, uv.max.y}});
    vertices.push_back({{position.min.x, position.max.y}, layer, {uv.min.x, uv.max.y}});

    for (uint32_t index : QUAD_INDICES) {
        indices.push_back(base + index);
    }
}

void TextureMesh::translate(glm::vec2 offset) {
    for (auto& vertex : vertices) {
        vertex.position[0] += offset.x;
        vertex.position[1] += offset.y;
    }
}

TextureMesh project_tiles(std::span<const AllocatedTile> tiles, uint32_t tile_size, glm::uvec2 texture_size,
                          const Box2D& area, glm::ivec2 atlas_size) {
    TextureMesh mesh;
    if (area.is_empty() || texture_size.x == 0 || texture_size.y == 0 || atlas_size.x <= 0 || atlas_size.y <= 0) {
        return mesh;
    }

    const glm::vec2 scale = area.size() / glm::vec2(texture_size);
    const glm::vec2 atlas_extent(atlas_size);

    mesh.vertices.reserve(tiles.size() * 4);
    mesh.indices.reserve(tiles.size() * 6);

    for (const auto& tile : tiles) {
        const AtlasRect& rect = tile.location.rect;
        const glm::vec2 grid(static_cast<float>(tile.column * tile_size), static_cast<float>(tile.row * tile_size));

        const Box2D position = Box2D::from_origin_size(area.min + grid * scale, glm::vec2(rect.size()) * scale);
        const Box2D uv{glm::vec2(rect.min) / atlas_extent, glm::vec2(rect.max) / atlas_extent};

        mesh.append_quad(position, uv, tile.location.layer);
    }

    return mesh;
}

}  // namespace scribble::atlas
