// Scribble Graphics Abstraction Layer
// types.hpp - Common types, enums, and descriptors

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace scribble::graphics {

// ============================================================================
// Texture Formats
// ============================================================================

enum class TextureFormat : uint32_t {
    Unknown = 0,

    // 8-bit formats
    R8Unorm,
    RG8Unorm,
    RGBA8Unorm,
    RGBA8UnormSrgb,
    BGRA8Unorm,
    BGRA8UnormSrgb,

    // 16-bit formats
    R16Float,
    RG16Float,
    RGBA16Float,
    RGBA16Uint,

    // 32-bit formats
    R32Float,
    R32Uint,
    RG32Float,
    RGBA32Float,

    // Multi-planar video formats (luma plane + interleaved chroma plane)
    NV12,
    P010,
};

// True for formats whose texels are split across several planes
constexpr bool is_multi_planar(TextureFormat format) {
    return format == TextureFormat::NV12 || format == TextureFormat::P010;
}

// Bytes of one texel; 0 for Unknown and multi-planar formats
constexpr uint32_t texture_format_bytes_per_pixel(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8Unorm:
            return 1;
        case TextureFormat::RG8Unorm:
        case TextureFormat::R16Float:
            return 2;
        case TextureFormat::RGBA8Unorm:
        case TextureFormat::RGBA8UnormSrgb:
        case TextureFormat::BGRA8Unorm:
        case TextureFormat::BGRA8UnormSrgb:
        case TextureFormat::RG16Float:
        case TextureFormat::R32Float:
        case TextureFormat::R32Uint:
            return 4;
        case TextureFormat::RGBA16Float:
        case TextureFormat::RGBA16Uint:
        case TextureFormat::RG32Float:
            return 8;
        case TextureFormat::RGBA32Float:
            return 16;
        case TextureFormat::NV12:
        case TextureFormat::P010:
        case TextureFormat::Unknown:
        default:
            return 0;
    }
}

// ============================================================================
// Buffer Usage Flags
// ============================================================================

enum class BufferUsage : uint32_t {
    None = 0,
    Vertex = 1 << 0,
    Index = 1 << 1,
    Uniform = 1 << 2,
    Storage = 1 << 3,
    TransferSrc = 1 << 4,
    TransferDst = 1 << 5,
};

inline BufferUsage operator|(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline BufferUsage operator&(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline bool has_flag(BufferUsage flags, BufferUsage flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

// ============================================================================
// Texture Usage Flags
// ============================================================================

enum class TextureUsage : uint32_t {
    None = 0,
    Sampled = 1 << 0,
    Storage = 1 << 1,
    RenderTarget = 1 << 2,
    TransferSrc = 1 << 3,
    TransferDst = 1 << 4,
};

inline TextureUsage operator|(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline TextureUsage operator&(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline bool has_flag(TextureUsage flags, TextureUsage flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

enum class TextureType : uint8_t {
    Texture2D,
    Texture2DArray,
};

// ============================================================================
// Descriptors
// ============================================================================

struct BufferDesc {
    size_t size = 0;
    BufferUsage usage = BufferUsage::None;
    bool host_visible = false;
    const void* initial_data = nullptr;
    std::string debug_name;
};

struct TextureDesc {
    TextureType type = TextureType::Texture2D;
    TextureFormat format = TextureFormat::RGBA8Unorm;
    uint32_t width = 1;
    uint32_t height = 1;
    uint32_t mip_levels = 1;
    uint32_t array_layers = 1;
    TextureUsage usage = TextureUsage::Sampled;
    std::string debug_name;
};

// ============================================================================
// Vertex Input
// ============================================================================

struct VertexAttribute {
    uint32_t location = 0;
    uint32_t binding = 0;
    TextureFormat format = TextureFormat::Unknown;  // Reuse format enum
    uint32_t offset = 0;
};

struct VertexBinding {
    uint32_t binding = 0;
    uint32_t stride = 0;
    bool per_instance = false;
};

// ============================================================================
// Copy / Transfer Types
// ============================================================================

// Buffer <-> texture region, also the layout of GraphicsDevice::write_texture
struct BufferImageCopy {
    size_t buffer_offset = 0;
    uint32_t buffer_row_length = 0;  // In texels, 0 = tightly packed
    uint32_t texture_offset_x = 0;
    uint32_t texture_offset_y = 0;
    uint32_t texture_width = 0;
    uint32_t texture_height = 0;
    uint32_t mip_level = 0;
    uint32_t array_layer = 0;
};

// Texture -> texture region, applied to layer_count consecutive layers
struct TextureCopy {
    uint32_t src_x = 0;
    uint32_t src_y = 0;
    uint32_t src_layer = 0;
    uint32_t dst_x = 0;
    uint32_t dst_y = 0;
    uint32_t dst_layer = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t layer_count = 1;
};

// ============================================================================
// Device Capabilities
// ============================================================================

struct DeviceCapabilities {
    std::string device_name;
    std::string api_name;
    uint64_t max_buffer_size = 0;
    uint32_t max_texture_size_2d = 0;
    uint32_t max_texture_array_layers = 0;
};

}  // namespace scribble::graphics
