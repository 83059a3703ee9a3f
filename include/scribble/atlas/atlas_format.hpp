// Scribble Texture Atlas
// atlas_format.hpp - Compile-time pixel formats of an atlas

#pragma once

#include <scribble/graphics/types.hpp>

#include <cstdint>

namespace scribble::atlas {

// An atlas format is a type with a static `format` member naming the texture
// format of every layer. Multi-planar formats are rejected by LayeredAtlas.
namespace formats {

// Single channel coverage, used for glyph masks
struct Mask {
    static constexpr graphics::TextureFormat format = graphics::TextureFormat::R8Unorm;
};

// Premultiplied sRGB colour, used for colour glyphs and images
struct Rgba8 {
    static constexpr graphics::TextureFormat format = graphics::TextureFormat::RGBA8UnormSrgb;
};

}  // namespace formats

template<typename Format>
inline constexpr uint32_t format_bytes_per_pixel = graphics::texture_format_bytes_per_pixel(Format::format);

}  // namespace scribble::atlas
