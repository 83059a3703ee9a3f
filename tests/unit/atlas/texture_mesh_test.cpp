// Scribble Atlas Tests
// texture_mesh_test.cpp - Atlas quad mesh unit tests

#include <gtest/gtest.h>
#include <scribble/atlas/texture_mesh.hpp>

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace scribble::atlas::test {

TEST(TextureVertexTest, Size) {
    EXPECT_EQ(sizeof(TextureVertex), 20u);
}

TEST(TextureVertexTest, Layout) {
    EXPECT_EQ(offsetof(TextureVertex, position), 0u);
    EXPECT_EQ(offsetof(TextureVertex, texture_layer), 8u);
    EXPECT_EQ(offsetof(TextureVertex, texture_coords), 12u);
}

TEST(TextureVertexTest, Attributes) {
    auto attrs = TextureVertex::get_attributes();
    ASSERT_EQ(attrs.size(), 3u);

    EXPECT_EQ(attrs[0].location, 0u);
    EXPECT_EQ(attrs[0].format, graphics::TextureFormat::RG32Float);
    EXPECT_EQ(attrs[0].offset, 0u);

    EXPECT_EQ(attrs[1].location, 1u);
    EXPECT_EQ(attrs[1].format, graphics::TextureFormat::R32Uint);
    EXPECT_EQ(attrs[1].offset, 8u);

    EXPECT_EQ(attrs[2].location, 2u);
    EXPECT_EQ(attrs[2].format, graphics::TextureFormat::RG32Float);
    EXPECT_EQ(attrs[2].offset, 12u);
}

TEST(TextureVertexTest, Binding) {
    auto binding = TextureVertex::get_binding();
    EXPECT_EQ(binding.binding, 0u);
    EXPECT_EQ(binding.stride, sizeof(TextureVertex));
    EXPECT_FALSE(binding.per_instance);
}

TEST(Box2DTest, Emptiness) {
    EXPECT_TRUE(Box2D{}.is_empty());
    EXPECT_TRUE((Box2D{{10.0f, 0.0f}, {5.0f, 10.0f}}.is_empty()));
    EXPECT_TRUE((Box2D{{0.0f, 0.0f}, {10.0f, 0.0f}}.is_empty()));
    const float nan = std::numeric_limits<float>::quiet_NaN();
    EXPECT_TRUE((Box2D{{0.0f, 0.0f}, {nan, 10.0f}}.is_empty()));
    EXPECT_FALSE((Box2D{{0.0f, 0.0f}, {1.0f, 1.0f}}.is_empty()));
}

TEST(TextureMeshTest, AppendQuadWinding) {
    TextureMesh mesh;
    mesh.append_quad(Box2D{{1.0f, 2.0f}, {3.0f, 4.0f}}, Box2D{{0.0f, 0.0f}, {0.5f, 0.25f}}, 7);

    ASSERT_EQ(mesh.vertices.size(), 4u);
    EXPECT_FLOAT_EQ(mesh.vertices[0].position[0], 1.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[0].position[1], 2.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[1].position[0], 3.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[1].position[1], 2.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[2].position[0], 3.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[2].position[1], 4.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[3].position[0], 1.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[3].position[1], 4.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[2].texture_coords[0], 0.5f);
    EXPECT_FLOAT_EQ(mesh.vertices[2].texture_coords[1], 0.25f);
    for (const auto& vertex : mesh.vertices) {
        EXPECT_EQ(vertex.texture_layer, 7u);
    }
    EXPECT_EQ(mesh.indices, (std::vector<uint32_t>{0, 1, 2, 0, 2, 3}));
}

TEST(TextureMeshTest, AppendOffsetsIndices) {
    TextureMesh a;
    a.append_quad(Box2D{{0.0f, 0.0f}, {1.0f, 1.0f}}, Box2D{}, 0);
    TextureMesh b;
    b.append_quad(Box2D{{2.0f, 0.0f}, {3.0f, 1.0f}}, Box2D{}, 1);

    a.append(b);
    ASSERT_EQ(a.vertices.size(), 8u);
    EXPECT_EQ(a.indices, (std::vector<uint32_t>{0, 1, 2, 0, 2, 3, 4, 5, 6, 4, 6, 7}));
    EXPECT_EQ(a.vertices[4].texture_layer, 1u);
}

TEST(TextureMeshTest, Translate) {
    TextureMesh mesh;
    mesh.append_quad(Box2D{{0.0f, 0.0f}, {1.0f, 1.0f}}, Box2D{}, 0);
    mesh.translate(glm::vec2(10.0f, -5.0f));
    EXPECT_FLOAT_EQ(mesh.vertices[0].position[0], 10.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[0].position[1], -5.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[2].position[0], 11.0f);
    EXPECT_FLOAT_EQ(mesh.vertices[2].position[1], -4.0f);
}

TEST(ProjectTilesTest, ScalesTilesIntoArea) {
    // 300x10 source split at 128: tiles of width 128, 128, 44
    std::vector<AllocatedTile> tiles = {
        {0, 0, {0, AllocId{1, 0}, AtlasRect{{0, 0}, {128, 10}}}},
        {1, 0, {0, AllocId{2, 0}, AtlasRect{{128, 0}, {256, 10}}}},
        {2, 0, {1, AllocId{3, 0}, AtlasRect{{0, 20}, {44, 30}}}},
    };

    // Drawn at half size
    auto mesh = project_tiles(tiles, 128, glm::uvec2(300, 10), Box2D{{100.0f, 50.0f}, {250.0f, 55.0f}},
                              glm::ivec2(512, 512));
    ASSERT_EQ(mesh.vertices.size(), 12u);
    ASSERT_EQ(mesh.indices.size(), 18u);

    // Third tile: origin 100 + 256 * 0.5, extent 44 * 0.5 by 10 * 0.5
    const auto& top_left = mesh.vertices[8];
    const auto& bottom_right = mesh.vertices[10];
    EXPECT_FLOAT_EQ(top_left.position[0], 228.0f);
    EXPECT_FLOAT_EQ(top_left.position[1], 50.0f);
    EXPECT_FLOAT_EQ(bottom_right.position[0], 250.0f);
    EXPECT_FLOAT_EQ(bottom_right.position[1], 55.0f);
    EXPECT_EQ(top_left.texture_layer, 1u);

    EXPECT_FLOAT_EQ(top_left.texture_coords[0], 0.0f);
    EXPECT_FLOAT_EQ(top_left.texture_coords[1], 20.0f / 512.0f);
    EXPECT_FLOAT_EQ(bottom_right.texture_coords[0], 44.0f / 512.0f);
    EXPECT_FLOAT_EQ(bottom_right.texture_coords[1], 30.0f / 512.0f);

    EXPECT_EQ(mesh.indices[12], 8u);
    EXPECT_EQ(mesh.indices[17], 11u);
}

TEST(ProjectTilesTest, EmptyAreaGivesEmptyMesh) {
    std::vector<AllocatedTile> tiles = {{0, 0, {0, AllocId{1, 0}, AtlasRect{{0, 0}, {8, 8}}}}};

    EXPECT_TRUE(project_tiles(tiles, 128, glm::uvec2(8, 8), Box2D{}, glm::ivec2(64, 64)).is_empty());
    EXPECT_TRUE(project_tiles(tiles, 128, glm::uvec2(8, 8), Box2D{{5.0f, 5.0f}, {1.0f, 9.0f}}, glm::ivec2(64, 64))
                    .is_empty());
    EXPECT_TRUE(project_tiles(tiles, 128, glm::uvec2(0, 0), Box2D{{0.0f, 0.0f}, {8.0f, 8.0f}}, glm::ivec2(64, 64))
                    .is_empty());
}

}  // namespace scribble::atlas::test
