// Scribble Texture Atlas
// atlas_storage.cpp - Layer packing and GPU copy-on-grow

#include <scribble/atlas/atlas_error.hpp>
#include <scribble/atlas/atlas_storage.hpp>
#include <scribble/core/config.hpp>
#include <scribble/core/logger.hpp>
#include <scribble/graphics/command_buffer.hpp>

#include <algorithm>

namespace scribble::atlas {

LayeredAtlasDesc LayeredAtlasDesc::from_config(const core::Config& config) {
    LayeredAtlasDesc desc;
    int width = config.get_int(core::config_section::ATLAS, core::config_key::WIDTH, static_cast<int>(desc.width));
    int height = config.get_int(core::config_section::ATLAS, core::config_key::HEIGHT, static_cast<int>(desc.height));
    int tile_size =
        config.get_int(core::config_section::ATLAS, core::config_key::TILE_SIZE, static_cast<int>(desc.tile_size));

    if (width > 0 && height > 0) {
        desc.width = static_cast<uint32_t>(width);
        desc.height = static_cast<uint32_t>(height);
    } else {
        SCRIBBLE_LOG_WARN(core::log_category::CONFIG, "Ignoring invalid atlas size {}x{}", width, height);
    }
    if (tile_size > 0) {
        desc.tile_size = static_cast<uint32_t>(tile_size);
    } else {
        SCRIBBLE_LOG_WARN(core::log_category::CONFIG, "Ignoring non-positive atlas.tile_size {}", tile_size);
    }
    return desc;
}

AtlasStorage::AtlasStorage(graphics::GraphicsDevice* device, graphics::TextureFormat format,
                           const LayeredAtlasDesc& desc)
    : device_(device),
      format_(format),
      bytes_per_pixel_(graphics::texture_format_bytes_per_pixel(format)),
      tile_size_(desc.tile_size),
      debug_name_(desc.debug_name) {
    if (device_ == nullptr) {
        SCRIBBLE_LOG_ERROR(core::log_category::ATLAS, "Atlas '{}' created without a device", debug_name_);
        throw AtlasError("Atlas requires a graphics device");
    }
    if (bytes_per_pixel_ == 0) {
        SCRIBBLE_LOG_ERROR(core::log_category::ATLAS, "Atlas '{}' has unsupported format {}", debug_name_,
                           static_cast<uint32_t>(format));
        throw AtlasError("Atlas format must be a single-plane format");
    }
    if (tile_size_ == 0 || desc.width == 0 || desc.height == 0) {
        SCRIBBLE_LOG_ERROR(core::log_category::ATLAS, "Atlas '{}' has invalid size {}x{} or tile size {}",
                           debug_name_, desc.width, desc.height, tile_size_);
        throw AtlasError("Atlas size and tile size must be non-zero");
    }

    const graphics::DeviceCapabilities caps = device_->get_capabilities();
    const uint32_t max_dimension = std::max(caps.max_texture_size_2d, 1u);
    max_size_ = glm::ivec2(static_cast<int32_t>(max_dimension));
    max_layers_ = std::max(caps.max_texture_array_layers, 1u);

    size_ = glm::ivec2(static_cast<int32_t>(std::min(desc.width, max_dimension)),
                       static_cast<int32_t>(std::min(desc.height, max_dimension)));

    texture_ = create_texture(size_, 1);
    layers_.emplace_back(size_);

    SCRIBBLE_LOG_DEBUG(core::log_category::ATLAS, "Atlas '{}' created at {}x{} (max {}x{}, {} layers)", debug_name_,
                       size_.x, size_.y, max_size_.x, max_size_.y, max_layers_);
}

AtlasStorage::~AtlasStorage() = default;

// ============================================================================
// Tiles
// ============================================================================

AtlasLocation AtlasStorage::allocate_tile(const UnallocatedTile& tile) {
    const glm::ivec2 requested(static_cast<int32_t>(tile.width), static_cast<int32_t>(tile.height));
    if (requested.x <= 0 || requested.y <= 0) {
        SCRIBBLE_LOG_ERROR(core::log_category::ATLAS, "Atlas '{}' cannot place an empty {}x{} tile", debug_name_,
                           tile.width, tile.height);
        throw AtlasError("Cannot allocate an empty tile");
    }

    // Larger than a layer can ever become: growing would not help
    const bool can_fit = requested.x <= max_size_.x && requested.y <= max_size_.y;

    while (can_fit) {
        if (auto location = pack(requested)) {
            upload(*location, tile);
            return *location;
        }

        // A new layer of the current size only helps if the tile fits in it
        const bool fits_layer = requested.x <= size_.x && requested.y <= size_.y;
        if (fits_layer && add_layer()) {
            continue;
        }
        if (grow_size()) {
            continue;
        }
        break;
    }

    SCRIBBLE_LOG_ERROR(core::log_category::ATLAS,
                       "Atlas '{}' exhausted placing {}x{} tile ({} layers of {}x{}, limits {} layers of {}x{})",
                       debug_name_, tile.width, tile.height, layers_.size(), size_.x, size_.y, max_layers_,
                       max_size_.x, max_size_.y);
    throw AllocationExhausted(tile.width, tile.height,
                              fmt::format("Atlas '{}' has no room for a {}x{} tile", debug_name_, tile.width,
                                          tile.height));
}

void AtlasStorage::release_tile(const AtlasLocation& location) {
    if (location.layer >= layers_.size()) {
        SCRIBBLE_LOG_WARN(core::log_category::ATLAS, "Atlas '{}' release on unknown layer {}", debug_name_,
                          location.layer);
        return;
    }
    if (!layers_[location.layer].deallocate(location.id)) {
        SCRIBBLE_LOG_WARN(core::log_category::ATLAS, "Atlas '{}' release of stale id {}:{} on layer {}", debug_name_,
                          location.id.index, location.id.generation, location.layer);
    }
}

std::optional<AtlasLocation> AtlasStorage::pack(glm::ivec2 size) {
    for (size_t layer = 0; layer < layers_.size(); layer++) {
        if (auto allocation = layers_[layer].allocate(size)) {
            return AtlasLocation{static_cast<uint32_t>(layer), allocation->id, allocation->rectangle};
        }
    }
    return std::nullopt;
}

void AtlasStorage::upload(const AtlasLocation& location, const UnallocatedTile& tile) {
    graphics::BufferImageCopy region;
    region.texture_offset_x = static_cast<uint32_t>(location.rect.min.x);
    region.texture_offset_y = static_cast<uint32_t>(location.rect.min.y);
    region.texture_width = tile.width;
    region.texture_height = tile.height;
    region.array_layer = location.layer;

    device_->write_texture(texture_.get(), region, tile.data);
}

// ============================================================================
// Growth
// ============================================================================

bool AtlasStorage::add_layer() {
    if (layers_.size() >= max_layers_) {
        return false;
    }

    const auto layer_count = static_cast<uint32_t>(layers_.size()) + 1;
    replace_texture(create_texture(size_, layer_count), size_);
    layers_.emplace_back(size_);

    SCRIBBLE_LOG_DEBUG(core::log_category::ATLAS, "Atlas '{}' grew to {} layers", debug_name_, layer_count);
    return true;
}

bool AtlasStorage::grow_size() {
    if (static_cast<int64_t>(size_.x) * size_.y >= static_cast<int64_t>(max_size_.x) * max_size_.y) {
        return false;
    }

    const glm::ivec2 new_size = glm::min(size_ * 2, max_size_);
    replace_texture(create_texture(new_size, static_cast<uint32_t>(layers_.size())), size_);
    for (auto& layer : layers_) {
        layer.grow(new_size);
    }

    SCRIBBLE_LOG_DEBUG(core::log_category::ATLAS, "Atlas '{}' grew from {}x{} to {}x{}", debug_name_, size_.x,
                       size_.y, new_size.x, new_size.y);
    size_ = new_size;
    return true;
}

std::unique_ptr<graphics::Texture> AtlasStorage::create_texture(glm::ivec2 size, uint32_t layers) const {
    graphics::TextureDesc desc;
    desc.type = graphics::TextureType::Texture2DArray;
    desc.format = format_;
    desc.width = static_cast<uint32_t>(size.x);
    desc.height = static_cast<uint32_t>(size.y);
    desc.array_layers = layers;
    desc.usage = graphics::TextureUsage::Sampled | graphics::TextureUsage::TransferSrc |
                 graphics::TextureUsage::TransferDst;
    desc.debug_name = debug_name_;

    auto texture = device_->create_texture(desc);
    if (!texture) {
        SCRIBBLE_LOG_ERROR(core::log_category::ATLAS, "Failed to create {}x{}x{} texture for atlas '{}'", size.x,
                           size.y, layers, debug_name_);
        throw AtlasError(fmt::format("Failed to create texture for atlas '{}'", debug_name_));
    }
    return texture;
}

void AtlasStorage::replace_texture(std::unique_ptr<graphics::Texture> replacement, glm::ivec2 extent) {
    auto cmd = device_->create_command_buffer();
    cmd->begin();

    graphics::TextureCopy copy;
    copy.width = static_cast<uint32_t>(extent.x);
    copy.height = static_cast<uint32_t>(extent.y);
    copy.layer_count = static_cast<uint32_t>(layers_.size());
    cmd->copy_texture(texture_.get(), replacement.get(), copy);

    cmd->end();
    device_->submit(cmd.get(), false);

    // The device keeps the old storage alive until the copy has executed
    texture_ = std::move(replacement);
    needs_rebinding_ = true;
}

// ============================================================================
// Info
// ============================================================================

int64_t AtlasStorage::get_allocated_area() const {
    int64_t area = 0;
    for (const auto& layer : layers_) {
        area += layer.allocated_area();
    }
    return area;
}

size_t AtlasStorage::get_tile_count() const {
    size_t count = 0;
    for (const auto& layer : layers_) {
        count += layer.allocation_count();
    }
    return count;
}

}  // namespace scribble::atlas
