// Scribble Texture Atlas
// guillotine_allocator.cpp - Guillotine rectangle packer implementation

#include <scribble/atlas/guillotine_allocator.hpp>

#include <limits>
#include <stdexcept>

namespace scribble::atlas {

GuillotineAllocator::GuillotineAllocator(glm::ivec2 size) : size_(size) {
    if (size.x <= 0 || size.y <= 0) {
        throw std::invalid_argument("GuillotineAllocator size must be positive");
    }
    root_ = new_node(AtlasRect{{0, 0}, size}, NodeKind::Free, -1);
}

int32_t GuillotineAllocator::new_node(const AtlasRect& rect, NodeKind kind, int32_t parent) {
    int32_t index;
    if (!unused_nodes_.empty()) {
        index = unused_nodes_.back();
        unused_nodes_.pop_back();
    } else {
        index = static_cast<int32_t>(nodes_.size());
        nodes_.emplace_back();
    }

    Node& node = nodes_[index];
    node.rect = rect;
    node.kind = kind;
    node.parent = parent;
    node.first = -1;
    node.second = -1;
    return index;
}

void GuillotineAllocator::release_node(int32_t index) {
    Node& node = nodes_[index];
    node.kind = NodeKind::Unused;
    node.parent = -1;
    node.first = -1;
    node.second = -1;
    node.generation++;
    unused_nodes_.push_back(index);
}

void GuillotineAllocator::split(int32_t index, bool vertical, int32_t at) {
    AtlasRect first_rect = nodes_[index].rect;
    AtlasRect second_rect = first_rect;
    if (vertical) {
        first_rect.max.x = at;
        second_rect.min.x = at;
    } else {
        first_rect.max.y = at;
        second_rect.min.y = at;
    }

    // new_node may reallocate nodes_, so no references are held across it
    int32_t first = new_node(first_rect, NodeKind::Free, index);
    int32_t second = new_node(second_rect, NodeKind::Free, index);

    Node& node = nodes_[index];
    node.kind = NodeKind::Container;
    node.first = first;
    node.second = second;
}

int32_t GuillotineAllocator::find_best_fit(glm::ivec2 size) const {
    int32_t best = -1;
    int64_t best_waste = std::numeric_limits<int64_t>::max();
    int64_t requested = static_cast<int64_t>(size.x) * size.y;

    for (size_t i = 0; i < nodes_.size(); i++) {
        const Node& node = nodes_[i];
        if (node.kind != NodeKind::Free || node.rect.width() < size.x || node.rect.height() < size.y) {
            continue;
        }
        int64_t waste = node.rect.area() - requested;
        if (waste < best_waste) {
            best = static_cast<int32_t>(i);
            best_waste = waste;
            if (waste == 0) {
                break;
            }
        }
    }
    return best;
}

std::optional<Allocation> GuillotineAllocator::allocate(glm::ivec2 size) {
    if (size.x <= 0 || size.y <= 0) {
        return std::nullopt;
    }

    int32_t leaf = find_best_fit(size);
    if (leaf < 0) {
        return std::nullopt;
    }

    AtlasRect rect = nodes_[leaf].rect;
    int32_t leftover_w = rect.width() - size.x;
    int32_t leftover_h = rect.height() - size.y;
    int32_t target = leaf;

    if (leftover_w == 0 && leftover_h == 0) {
        target = leaf;
    } else if (leftover_w == 0) {
        split(leaf, false, rect.min.y + size.y);
        target = nodes_[leaf].first;
    } else if (leftover_h == 0) {
        split(leaf, true, rect.min.x + size.x);
        target = nodes_[leaf].first;
    } else if (static_cast<int64_t>(rect.width()) * leftover_h >=
               static_cast<int64_t>(leftover_w) * rect.height()) {
        // Full-width strip below is the larger leftover: cut horizontally first
        split(leaf, false, rect.min.y + size.y);
        int32_t strip = nodes_[leaf].first;
        split(strip, true, rect.min.x + size.x);
        target = nodes_[strip].first;
    } else {
        split(leaf, true, rect.min.x + size.x);
        int32_t column = nodes_[leaf].first;
        split(column, false, rect.min.y + size.y);
        target = nodes_[column].first;
    }

    Node& node = nodes_[target];
    node.kind = NodeKind::Allocated;
    allocation_count_++;

    return Allocation{AllocId{static_cast<uint32_t>(target), node.generation}, node.rect};
}

bool GuillotineAllocator::deallocate(AllocId id) {
    if (id.index >= nodes_.size()) {
        return false;
    }
    Node& node = nodes_[id.index];
    if (node.kind != NodeKind::Allocated || node.generation != id.generation) {
        return false;
    }

    node.kind = NodeKind::Free;
    // The leaf may be handed out again in place, the old id must not match it
    node.generation++;
    allocation_count_--;

    merge_upwards(static_cast<int32_t>(id.index));
    return true;
}

void GuillotineAllocator::merge_upwards(int32_t index) {
    int32_t parent = nodes_[index].parent;
    while (parent >= 0) {
        int32_t first = nodes_[parent].first;
        int32_t second = nodes_[parent].second;
        if (nodes_[first].kind != NodeKind::Free || nodes_[second].kind != NodeKind::Free) {
            break;
        }

        release_node(first);
        release_node(second);

        Node& merged = nodes_[parent];
        merged.kind = NodeKind::Free;
        merged.first = -1;
        merged.second = -1;
        parent = merged.parent;
    }
}

void GuillotineAllocator::grow(glm::ivec2 new_size) {
    if (new_size.x < size_.x || new_size.y < size_.y) {
        throw std::invalid_argument("GuillotineAllocator cannot shrink");
    }
    if (new_size == size_) {
        return;
    }

    if (nodes_[root_].kind == NodeKind::Free) {
        nodes_[root_].rect.max = new_size;
        size_ = new_size;
        return;
    }

    const bool grow_x = new_size.x > size_.x;
    const bool grow_y = new_size.y > size_.y;
    int32_t old_root = root_;
    int32_t new_root = new_node(AtlasRect{{0, 0}, new_size}, NodeKind::Container, -1);

    if (grow_x && grow_y) {
        // New root: [old area + strip below it | full-height strip on the right]
        int32_t column = new_node(AtlasRect{{0, 0}, {size_.x, new_size.y}}, NodeKind::Container, new_root);
        int32_t right = new_node(AtlasRect{{size_.x, 0}, new_size}, NodeKind::Free, new_root);
        int32_t bottom = new_node(AtlasRect{{0, size_.y}, {size_.x, new_size.y}}, NodeKind::Free, column);

        nodes_[column].first = old_root;
        nodes_[column].second = bottom;
        nodes_[old_root].parent = column;

        nodes_[new_root].first = column;
        nodes_[new_root].second = right;
    } else if (grow_x) {
        int32_t right = new_node(AtlasRect{{size_.x, 0}, new_size}, NodeKind::Free, new_root);
        nodes_[new_root].first = old_root;
        nodes_[new_root].second = right;
        nodes_[old_root].parent = new_root;
    } else {
        int32_t bottom = new_node(AtlasRect{{0, size_.y}, new_size}, NodeKind::Free, new_root);
        nodes_[new_root].first = old_root;
        nodes_[new_root].second = bottom;
        nodes_[old_root].parent = new_root;
    }

    root_ = new_root;
    size_ = new_size;
}

void GuillotineAllocator::clear() {
    for (size_t i = 0; i < nodes_.size(); i++) {
        if (nodes_[i].kind != NodeKind::Unused) {
            release_node(static_cast<int32_t>(i));
        }
    }
    allocation_count_ = 0;
    root_ = new_node(AtlasRect{{0, 0}, size_}, NodeKind::Free, -1);
}

std::optional<AtlasRect> GuillotineAllocator::get(AllocId id) const {
    if (id.index >= nodes_.size()) {
        return std::nullopt;
    }
    const Node& node = nodes_[id.index];
    if (node.kind != NodeKind::Allocated || node.generation != id.generation) {
        return std::nullopt;
    }
    return node.rect;
}

int64_t GuillotineAllocator::free_area() const {
    int64_t area = 0;
    for (const auto& node : nodes_) {
        if (node.kind == NodeKind::Free) {
            area += node.rect.area();
        }
    }
    return area;
}

int64_t GuillotineAllocator::allocated_area() const {
    int64_t area = 0;
    for (const auto& node : nodes_) {
        if (node.kind == NodeKind::Allocated) {
            area += node.rect.area();
        }
    }
    return area;
}

}  // namespace scribble::atlas
