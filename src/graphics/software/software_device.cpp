// Scribble Graphics Abstraction Layer
// software_device.cpp - Host-memory backend implementation

#include <scribble/core/config.hpp>
#include <scribble/core/logger.hpp>
#include <scribble/graphics/buffer.hpp>
#include <scribble/graphics/command_buffer.hpp>
#include <scribble/graphics/software_device.hpp>
#include <scribble/graphics/texture.hpp>

#include <algorithm>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <vector>

namespace scribble::graphics {

namespace {

// ============================================================================
// SoftwareBuffer
// ============================================================================

class SoftwareBuffer final : public Buffer {
public:
    explicit SoftwareBuffer(const BufferDesc& desc) : desc_(desc), bytes_(desc.size, 0) {
        if (desc.initial_data != nullptr) {
            std::memcpy(bytes_.data(), desc.initial_data, desc.size);
        }
        desc_.initial_data = nullptr;
    }

    size_t get_size() const override { return bytes_.size(); }
    BufferUsage get_usage() const override { return desc_.usage; }
    bool is_host_visible() const override { return desc_.host_visible; }

    void* map() override { return desc_.host_visible ? bytes_.data() : nullptr; }
    void unmap() override {}

    void write(const void* data, size_t size, size_t offset = 0) override {
        check_range(size, offset, "write");
        std::memcpy(bytes_.data() + offset, data, size);
    }

    void read(void* data, size_t size, size_t offset = 0) const override {
        check_range(size, offset, "read");
        std::memcpy(data, bytes_.data() + offset, size);
    }

    uint8_t* bytes() { return bytes_.data(); }
    const uint8_t* bytes() const { return bytes_.data(); }

private:
    BufferDesc desc_;
    std::vector<uint8_t> bytes_;

    void check_range(size_t size, size_t offset, const char* what) const {
        if (offset > bytes_.size() || size > bytes_.size() - offset) {
            throw std::out_of_range(fmt::format("SoftwareBuffer '{}': {} of {} bytes at offset {} exceeds size {}",
                                                desc_.debug_name, what, size, offset, bytes_.size()));
        }
    }
};

// ============================================================================
// SoftwareTexture
// ============================================================================

class SoftwareTexture final : public Texture {
public:
    explicit SoftwareTexture(const TextureDesc& desc)
        : desc_(desc),
          bytes_per_pixel_(texture_format_bytes_per_pixel(desc.format)),
          texels_(static_cast<size_t>(desc.width) * desc.height * desc.array_layers * bytes_per_pixel_, 0) {}

    TextureType get_type() const override { return desc_.type; }
    TextureFormat get_format() const override { return desc_.format; }
    uint32_t get_width() const override { return desc_.width; }
    uint32_t get_height() const override { return desc_.height; }
    uint32_t get_mip_levels() const override { return desc_.mip_levels; }
    uint32_t get_array_layers() const override { return desc_.array_layers; }
    TextureUsage get_usage() const override { return desc_.usage; }
    void* get_native_handle() const override { return const_cast<uint8_t*>(texels_.data()); }

    uint32_t bytes_per_pixel() const { return bytes_per_pixel_; }
    const std::string& debug_name() const { return desc_.debug_name; }

    size_t texel_offset(uint32_t layer, uint32_t x, uint32_t y) const {
        return ((static_cast<size_t>(layer) * desc_.height + y) * desc_.width + x) * bytes_per_pixel_;
    }

    uint8_t* texel(uint32_t layer, uint32_t x, uint32_t y) { return texels_.data() + texel_offset(layer, x, y); }
    const uint8_t* texel(uint32_t layer, uint32_t x, uint32_t y) const {
        return texels_.data() + texel_offset(layer, x, y);
    }

    void check_region(uint32_t x, uint32_t y, uint32_t layer, uint32_t width, uint32_t height,
                      uint32_t layer_count, uint32_t mip_level) const {
        if (mip_level != 0) {
            throw std::runtime_error("SoftwareTexture: only mip level 0 is supported");
        }
        if (x > desc_.width || width > desc_.width - x || y > desc_.height || height > desc_.height - y ||
            layer > desc_.array_layers || layer_count > desc_.array_layers - layer) {
            throw std::out_of_range(fmt::format(
                "SoftwareTexture '{}': region {}x{}+{}+{} layers [{}, {}) outside {}x{}x{}", desc_.debug_name,
                width, height, x, y, layer, layer + layer_count, desc_.width, desc_.height, desc_.array_layers));
        }
    }

private:
    TextureDesc desc_;
    uint32_t bytes_per_pixel_;
    std::vector<uint8_t> texels_;
};

SoftwareTexture* as_software(Texture* texture) {
    auto* sw = dynamic_cast<SoftwareTexture*>(texture);
    if (sw == nullptr) {
        throw std::invalid_argument("Texture was not created by the software device");
    }
    return sw;
}

const SoftwareTexture* as_software(const Texture* texture) {
    return as_software(const_cast<Texture*>(texture));
}

SoftwareBuffer* as_software(Buffer* buffer) {
    auto* sw = dynamic_cast<SoftwareBuffer*>(buffer);
    if (sw == nullptr) {
        throw std::invalid_argument("Buffer was not created by the software device");
    }
    return sw;
}

const SoftwareBuffer* as_software(const Buffer* buffer) {
    return as_software(const_cast<Buffer*>(buffer));
}

// Rows of texels between a linear buffer and one texture layer
void check_buffer_region(const SoftwareBuffer& buffer, const SoftwareTexture& texture,
                         const BufferImageCopy& region) {
    texture.check_region(region.texture_offset_x, region.texture_offset_y, region.array_layer,
                         region.texture_width, region.texture_height, 1, region.mip_level);
    uint32_t row_length = region.buffer_row_length == 0 ? region.texture_width : region.buffer_row_length;
    if (region.texture_height == 0 || region.texture_width == 0) {
        return;
    }
    size_t bpp = texture.bytes_per_pixel();
    size_t last = region.buffer_offset +
                  (static_cast<size_t>(region.texture_height - 1) * row_length + region.texture_width) * bpp;
    if (last > buffer.get_size()) {
        throw std::out_of_range("Buffer region of a buffer/texture copy exceeds the buffer size");
    }
}

void upload_rows(SoftwareTexture& dst, const uint8_t* src, const BufferImageCopy& region) {
    uint32_t row_length = region.buffer_row_length == 0 ? region.texture_width : region.buffer_row_length;
    size_t bpp = dst.bytes_per_pixel();
    for (uint32_t row = 0; row < region.texture_height; row++) {
        std::memcpy(dst.texel(region.array_layer, region.texture_offset_x, region.texture_offset_y + row),
                    src + static_cast<size_t>(row) * row_length * bpp, static_cast<size_t>(region.texture_width) * bpp);
    }
}

// ============================================================================
// SoftwareCommandBuffer
// ============================================================================

class SoftwareCommandBuffer final : public CommandBuffer {
public:
    SoftwareCommandBuffer() = default;

    void begin() override {
        commands_.clear();
        texture_copies_ = 0;
        recording_ = true;
    }

    void end() override { recording_ = false; }

    void copy_buffer(const Buffer* src, Buffer* dst, size_t src_offset, size_t dst_offset, size_t size) override {
        require_recording();
        const auto* from = as_software(src);
        auto* to = as_software(dst);
        if (src_offset > from->get_size() || size > from->get_size() - src_offset || dst_offset > to->get_size() ||
            size > to->get_size() - dst_offset) {
            throw std::out_of_range("copy_buffer region exceeds a buffer");
        }
        commands_.emplace_back(
            [=]() { std::memmove(to->bytes() + dst_offset, from->bytes() + src_offset, size); });
    }

    void copy_buffer_to_texture(const Buffer* src, Texture* dst, const BufferImageCopy& region) override {
        require_recording();
        const auto* from = as_software(src);
        auto* to = as_software(dst);
        check_buffer_region(*from, *to, region);
        commands_.emplace_back(
            [=]() { upload_rows(*to, from->bytes() + region.buffer_offset, region); });
    }

    void copy_texture_to_buffer(const Texture* src, Buffer* dst, const BufferImageCopy& region) override {
        require_recording();
        const auto* from = as_software(src);
        auto* to = as_software(dst);
        check_buffer_region(*to, *from, region);
        commands_.emplace_back([=]() {
            uint32_t row_length = region.buffer_row_length == 0 ? region.texture_width : region.buffer_row_length;
            size_t bpp = from->bytes_per_pixel();
            for (uint32_t row = 0; row < region.texture_height; row++) {
                std::memcpy(to->bytes() + region.buffer_offset + static_cast<size_t>(row) * row_length * bpp,
                            from->texel(region.array_layer, region.texture_offset_x, region.texture_offset_y + row),
                            static_cast<size_t>(region.texture_width) * bpp);
            }
        });
    }

    void copy_texture(const Texture* src, Texture* dst, const TextureCopy& region) override {
        require_recording();
        const auto* from = as_software(src);
        auto* to = as_software(dst);
        if (from->get_format() != to->get_format()) {
            throw std::invalid_argument("copy_texture requires matching formats");
        }
        from->check_region(region.src_x, region.src_y, region.src_layer, region.width, region.height,
                           region.layer_count, 0);
        to->check_region(region.dst_x, region.dst_y, region.dst_layer, region.width, region.height,
                         region.layer_count, 0);
        texture_copies_++;
        commands_.emplace_back([=]() {
            size_t row_bytes = static_cast<size_t>(region.width) * from->bytes_per_pixel();
            for (uint32_t layer = 0; layer < region.layer_count; layer++) {
                for (uint32_t row = 0; row < region.height; row++) {
                    std::memmove(to->texel(region.dst_layer + layer, region.dst_x, region.dst_y + row),
                                 from->texel(region.src_layer + layer, region.src_x, region.src_y + row), row_bytes);
                }
            }
        });
    }

    bool is_recording() const { return recording_; }
    uint64_t texture_copies() const { return texture_copies_; }

    void execute() const {
        for (const auto& command : commands_) {
            command();
        }
    }

private:
    std::vector<std::function<void()>> commands_;
    uint64_t texture_copies_ = 0;
    bool recording_ = false;

    void require_recording() const {
        if (!recording_) {
            throw std::runtime_error("CommandBuffer is not recording, call begin() first");
        }
    }
};

}  // namespace

// ============================================================================
// SoftwareDevice
// ============================================================================

SoftwareDeviceDesc SoftwareDeviceDesc::from_config(const core::Config& config) {
    SoftwareDeviceDesc desc;
    int max_size = config.get_int(core::config_section::DEVICE, core::config_key::MAX_TEXTURE_SIZE,
                                  static_cast<int>(desc.max_texture_size_2d));
    int max_layers = config.get_int(core::config_section::DEVICE, core::config_key::MAX_ARRAY_LAYERS,
                                    static_cast<int>(desc.max_texture_array_layers));
    if (max_size > 0) {
        desc.max_texture_size_2d = static_cast<uint32_t>(max_size);
    } else {
        SCRIBBLE_LOG_WARN(core::log_category::CONFIG, "Ignoring non-positive device.max_texture_size {}", max_size);
    }
    if (max_layers > 0) {
        desc.max_texture_array_layers = static_cast<uint32_t>(max_layers);
    } else {
        SCRIBBLE_LOG_WARN(core::log_category::CONFIG, "Ignoring non-positive device.max_array_layers {}",
                          max_layers);
    }
    return desc;
}

SoftwareDevice::SoftwareDevice(const SoftwareDeviceDesc& desc) : desc_(desc) {}

SoftwareDevice::~SoftwareDevice() = default;

std::unique_ptr<Buffer> SoftwareDevice::create_buffer(const BufferDesc& desc) {
    if (desc.size == 0 || desc.size > desc_.max_buffer_size) {
        SCRIBBLE_LOG_ERROR(core::log_category::GRAPHICS, "Invalid buffer size {} for '{}'", desc.size,
                           desc.debug_name);
        return nullptr;
    }
    stats_.buffers_created++;
    return std::make_unique<SoftwareBuffer>(desc);
}

std::unique_ptr<Texture> SoftwareDevice::create_texture(const TextureDesc& desc) {
    if (texture_format_bytes_per_pixel(desc.format) == 0) {
        SCRIBBLE_LOG_ERROR(core::log_category::GRAPHICS, "Unsupported texture format {} for '{}'",
                           static_cast<uint32_t>(desc.format), desc.debug_name);
        return nullptr;
    }
    if (desc.width == 0 || desc.height == 0 || desc.array_layers == 0 ||
        desc.width > desc_.max_texture_size_2d || desc.height > desc_.max_texture_size_2d ||
        desc.array_layers > desc_.max_texture_array_layers) {
        SCRIBBLE_LOG_ERROR(core::log_category::GRAPHICS, "Texture '{}' of {}x{}x{} exceeds device limits",
                           desc.debug_name, desc.width, desc.height, desc.array_layers);
        return nullptr;
    }
    stats_.textures_created++;
    return std::make_unique<SoftwareTexture>(desc);
}

std::unique_ptr<CommandBuffer> SoftwareDevice::create_command_buffer() {
    return std::make_unique<SoftwareCommandBuffer>();
}

void SoftwareDevice::submit(CommandBuffer* cmd, bool /*wait_for_completion*/) {
    auto* sw = dynamic_cast<SoftwareCommandBuffer*>(cmd);
    if (sw == nullptr) {
        throw std::invalid_argument("CommandBuffer was not created by the software device");
    }
    if (sw->is_recording()) {
        throw std::runtime_error("CommandBuffer submitted before end()");
    }
    // Work executes on submission, so every submit is already complete
    sw->execute();
    stats_.texture_copies += sw->texture_copies();
    stats_.submits++;
}

void SoftwareDevice::write_texture(Texture* dst, const BufferImageCopy& region, std::span<const uint8_t> data) {
    auto* to = as_software(dst);
    to->check_region(region.texture_offset_x, region.texture_offset_y, region.array_layer, region.texture_width,
                     region.texture_height, 1, region.mip_level);
    uint32_t row_length = region.buffer_row_length == 0 ? region.texture_width : region.buffer_row_length;
    if (region.texture_width != 0 && region.texture_height != 0) {
        size_t needed = region.buffer_offset +
                        (static_cast<size_t>(region.texture_height - 1) * row_length + region.texture_width) *
                            to->bytes_per_pixel();
        if (needed > data.size()) {
            throw std::out_of_range(fmt::format("write_texture needs {} bytes, got {}", needed, data.size()));
        }
        upload_rows(*to, data.data() + region.buffer_offset, region);
    }
    stats_.texture_writes++;
}

DeviceCapabilities SoftwareDevice::get_capabilities() const {
    DeviceCapabilities caps;
    caps.device_name = "Software Rasterizer";
    caps.api_name = "Software";
    caps.max_buffer_size = desc_.max_buffer_size;
    caps.max_texture_size_2d = desc_.max_texture_size_2d;
    caps.max_texture_array_layers = desc_.max_texture_array_layers;
    return caps;
}

std::unique_ptr<SoftwareDevice> create_software_device(const SoftwareDeviceDesc& desc) {
    SCRIBBLE_LOG_INFO(core::log_category::GRAPHICS, "Creating software graphics device ({} max 2D, {} max layers)",
                      desc.max_texture_size_2d, desc.max_texture_array_layers);
    return std::make_unique<SoftwareDevice>(desc);
}

}  // namespace scribble::graphics
