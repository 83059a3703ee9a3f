// Scribble Texture Atlas
// atlas_error.hpp - Exceptions thrown by the atlas

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace scribble::atlas {

// Base of every atlas failure
class AtlasError : public std::runtime_error {
public:
    explicit AtlasError(const std::string& message) : std::runtime_error(message) {}
};

// No layer can hold the tile, even after adding layers and doubling the size
class AllocationExhausted : public AtlasError {
public:
    AllocationExhausted(uint32_t width, uint32_t height, const std::string& message)
        : AtlasError(message), width_(width), height_(height) {}

    [[nodiscard]] uint32_t width() const { return width_; }
    [[nodiscard]] uint32_t height() const { return height_; }

private:
    uint32_t width_;
    uint32_t height_;
};

// Source bytes do not cover width * height texels
class InvalidTextureData : public AtlasError {
public:
    explicit InvalidTextureData(const std::string& message) : AtlasError(message) {}
};

}  // namespace scribble::atlas
