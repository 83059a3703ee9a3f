// Scribble Texture Atlas
// guillotine_allocator.hpp - 2D rectangle packer for one atlas layer

#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace scribble::atlas {

// Axis-aligned integer rectangle, max is exclusive
struct AtlasRect {
    glm::ivec2 min{0, 0};
    glm::ivec2 max{0, 0};

    [[nodiscard]] int32_t width() const { return max.x - min.x; }
    [[nodiscard]] int32_t height() const { return max.y - min.y; }
    [[nodiscard]] glm::ivec2 size() const { return max - min; }
    [[nodiscard]] int64_t area() const { return static_cast<int64_t>(width()) * height(); }
    [[nodiscard]] bool is_empty() const { return max.x <= min.x || max.y <= min.y; }

    [[nodiscard]] bool contains(const AtlasRect& other) const {
        return other.min.x >= min.x && other.min.y >= min.y && other.max.x <= max.x && other.max.y <= max.y;
    }

    [[nodiscard]] bool intersects(const AtlasRect& other) const {
        return other.min.x < max.x && min.x < other.max.x && other.min.y < max.y && min.y < other.max.y;
    }

    bool operator==(const AtlasRect& other) const { return min == other.min && max == other.max; }
};

// Opaque handle of one allocation; stale handles are rejected on release
struct AllocId {
    uint32_t index = UINT32_MAX;
    uint32_t generation = 0;

    bool operator==(const AllocId& other) const {
        return index == other.index && generation == other.generation;
    }
};

struct Allocation {
    AllocId id;
    AtlasRect rectangle;
};

// Guillotine packer kept as a binary tree of rectangles. Every allocation
// cuts a free leaf in two (twice when neither edge fits exactly), released
// leaves merge back with a free sibling, and grow() extends the area while
// keeping every live allocation and its id.
class GuillotineAllocator {
public:
    explicit GuillotineAllocator(glm::ivec2 size);

    // Best-fit placement; nullopt when no free leaf can hold the size
    [[nodiscard]] std::optional<Allocation> allocate(glm::ivec2 size);

    // Returns false for unknown or already released ids
    bool deallocate(AllocId id);

    // Both dimensions of new_size must be >= the current size
    void grow(glm::ivec2 new_size);

    // Drop every allocation, invalidating all outstanding ids
    void clear();

    [[nodiscard]] std::optional<AtlasRect> get(AllocId id) const;

    [[nodiscard]] glm::ivec2 size() const { return size_; }
    [[nodiscard]] int64_t free_area() const;
    [[nodiscard]] int64_t allocated_area() const;
    [[nodiscard]] size_t allocation_count() const { return allocation_count_; }
    [[nodiscard]] bool is_empty() const { return allocation_count_ == 0; }

private:
    enum class NodeKind : uint8_t { Free, Allocated, Container, Unused };

    struct Node {
        AtlasRect rect;
        NodeKind kind = NodeKind::Unused;
        int32_t parent = -1;
        int32_t first = -1;
        int32_t second = -1;
        uint32_t generation = 0;
    };

    std::vector<Node> nodes_;
    std::vector<int32_t> unused_nodes_;
    int32_t root_ = -1;
    glm::ivec2 size_;
    size_t allocation_count_ = 0;

    int32_t new_node(const AtlasRect& rect, NodeKind kind, int32_t parent);
    void release_node(int32_t index);

    // Turn a leaf into a container of two children split at `at`
    // (an x coordinate when vertical, a y coordinate otherwise)
    void split(int32_t index, bool vertical, int32_t at);

    [[nodiscard]] int32_t find_best_fit(glm::ivec2 size) const;
    void merge_upwards(int32_t index);
};

}  // namespace scribble::atlas
