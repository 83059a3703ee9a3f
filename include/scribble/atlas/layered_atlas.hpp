// Scribble Texture Atlas
// layered_atlas.hpp - Growable multi-layer texture atlas with shared allocations

#pragma once

#include <scribble/atlas/allocated_texture.hpp>
#include <scribble/atlas/atlas_format.hpp>
#include <scribble/atlas/atlas_storage.hpp>
#include <scribble/atlas/texture_tiles.hpp>
#include <scribble/core/logger.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace scribble::atlas {

// Texture atlas packing images into the layers of one 2D array texture.
//
// Allocations are shared: allocate() returns a std::shared_ptr and, when a key
// is given, hands the same pointer back for as long as someone holds it.
// Nothing is freed while it is held; deallocate() reclaims every allocation
// whose last holder is gone. Sources wider or taller than the tile size are
// split into tiles that may land on different layers.
//
// Growth (adding layers, doubling the layer size) replaces the GPU texture;
// check needs_rebinding() before drawing and call mark_bound() after
// rebinding get_texture().
//
// Defragmentation (moving live tiles to shrink the atlas) is not provided.
template<typename Format, typename Key, typename Data = std::monostate, typename Hash = std::hash<Key>>
class LayeredAtlas {
    static_assert(!graphics::is_multi_planar(Format::format), "LayeredAtlas does not support multi-planar formats");
    static_assert(format_bytes_per_pixel<Format> != 0, "LayeredAtlas format must have a texel size");

public:
    using Allocation = AllocatedTexture<Data>;
    using AllocationPtr = std::shared_ptr<const Allocation>;

    explicit LayeredAtlas(graphics::GraphicsDevice* device, const LayeredAtlasDesc& desc = {})
        : storage_(device, Format::format, desc) {}

    // Non-copyable
    LayeredAtlas(const LayeredAtlas&) = delete;
    LayeredAtlas& operator=(const LayeredAtlas&) = delete;

    // ========================================================================
    // Allocation
    // ========================================================================

    // Returns the live allocation for `key` without touching the GPU, or
    // tiles and uploads `texture`. Throws AllocationExhausted (nothing is
    // tracked and the tiles placed so far are released) or InvalidTextureData.
    AllocationPtr allocate(const UnallocatedTexture& texture, std::optional<Key> key, Data data = {}) {
        if (key) {
            if (auto existing = lookup(*key)) {
                return existing;
            }
        }
        auto tiles = tile_texture(texture, storage_.get_tile_size(), format_bytes_per_pixel<Format>);
        return track(std::move(key), place(tiles), texture.width, texture.height, std::move(data));
    }

    // Single tile at grid (0, 0) regardless of the tile size
    AllocationPtr allocate_raw(std::span<const uint8_t> contents, uint32_t width, uint32_t height,
                               std::optional<Key> key, Data data = {}) {
        if (key) {
            if (auto existing = lookup(*key)) {
                return existing;
            }
        }
        const uint32_t edge = std::max({width, height, 1u});
        auto tiles = tile_texture(UnallocatedTexture{contents, width, height}, edge, format_bytes_per_pixel<Format>);
        return track(std::move(key), place(tiles), width, height, std::move(data));
    }

    // Cache probe, nullptr when the key is unknown or nobody holds it anymore
    [[nodiscard]] AllocationPtr is_allocated(const Key& key) const {
        auto it = keyed_.find(key);
        if (it == keyed_.end()) {
            return nullptr;
        }
        return it->second.handle.lock();
    }

    // Release the tiles of every allocation that is no longer held.
    // Returns the number of allocations reclaimed.
    size_t deallocate() {
        size_t reclaimed = 0;

        for (auto it = keyed_.begin(); it != keyed_.end();) {
            if (it->second.handle.expired()) {
                release(it->second);
                it = keyed_.erase(it);
                reclaimed++;
            } else {
                ++it;
            }
        }

        size_t kept = 0;
        for (size_t i = 0; i < uncached_.size(); i++) {
            if (uncached_[i].handle.expired()) {
                release(uncached_[i]);
                reclaimed++;
            } else {
                if (kept != i) {
                    uncached_[kept] = std::move(uncached_[i]);
                }
                kept++;
            }
        }
        uncached_.resize(kept);

        if (reclaimed > 0) {
            SCRIBBLE_LOG_TRACE(core::log_category::ATLAS, "Reclaimed {} allocations, {} still tracked", reclaimed,
                               get_tracked_count());
        }
        return reclaimed;
    }

    // ========================================================================
    // GPU Resources
    // ========================================================================

    [[nodiscard]] graphics::Texture* get_texture() const { return storage_.get_texture(); }
    [[nodiscard]] bool needs_rebinding() const { return storage_.needs_rebinding(); }
    void mark_bound() { storage_.mark_bound(); }

    // ========================================================================
    // Info
    // ========================================================================

    [[nodiscard]] glm::ivec2 get_size() const { return storage_.get_size(); }
    [[nodiscard]] uint32_t get_layer_count() const { return storage_.get_layer_count(); }
    [[nodiscard]] uint32_t get_tile_size() const { return storage_.get_tile_size(); }
    [[nodiscard]] size_t get_tracked_count() const { return keyed_.size() + uncached_.size(); }
    [[nodiscard]] const AtlasStorage& get_storage() const { return storage_; }

private:
    struct TrackedAllocation {
        std::weak_ptr<const Allocation> handle;
        std::vector<AtlasLocation> locations;
    };

    AtlasStorage storage_;
    std::unordered_map<Key, TrackedAllocation, Hash> keyed_;
    std::vector<TrackedAllocation> uncached_;

    // A key whose allocation expired before the last sweep is reclaimed here
    AllocationPtr lookup(const Key& key) {
        auto it = keyed_.find(key);
        if (it == keyed_.end()) {
            return nullptr;
        }
        if (auto existing = it->second.handle.lock()) {
            return existing;
        }
        release(it->second);
        keyed_.erase(it);
        return nullptr;
    }

    std::vector<AllocatedTile> place(const std::vector<UnallocatedTile>& tiles) {
        std::vector<AllocatedTile> placed;
        placed.reserve(tiles.size());
        try {
            for (const auto& tile : tiles) {
                placed.push_back(AllocatedTile{tile.column, tile.row, storage_.allocate_tile(tile)});
            }
        } catch (...) {
            for (const auto& tile : placed) {
                storage_.release_tile(tile.location);
            }
            throw;
        }
        return placed;
    }

    AllocationPtr track(std::optional<Key> key, std::vector<AllocatedTile> tiles, uint32_t width, uint32_t height,
                        Data data) {
        TrackedAllocation entry;
        entry.locations.reserve(tiles.size());
        for (const auto& tile : tiles) {
            entry.locations.push_back(tile.location);
        }

        auto handle = std::make_shared<const Allocation>(std::move(tiles), storage_.get_tile_size(), width, height,
                                                         std::move(data));
        entry.handle = handle;

        if (key) {
            keyed_.insert_or_assign(std::move(*key), std::move(entry));
        } else {
            uncached_.push_back(std::move(entry));
        }
        return handle;
    }

    void release(const TrackedAllocation& entry) {
        for (const auto& location : entry.locations) {
            storage_.release_tile(location);
        }
    }
};

}  // namespace scribble::atlas
