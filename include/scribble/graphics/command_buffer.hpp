// Scribble Graphics Abstraction Layer
// command_buffer.hpp - Command buffer interface

#pragma once

#include "types.hpp"

#include <cstddef>

namespace scribble::graphics {

class Buffer;
class Texture;

// Abstract command buffer class
// Records GPU commands for later submission through GraphicsDevice::submit
// Implementations: SoftwareCommandBuffer
class CommandBuffer {
public:
    virtual ~CommandBuffer() = default;

    // Non-copyable
    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;

    // ========================================================================
    // Recording Lifecycle
    // ========================================================================

    virtual void begin() = 0;
    virtual void end() = 0;

    // ========================================================================
    // Transfer Commands
    // ========================================================================

    virtual void copy_buffer(const Buffer* src, Buffer* dst, size_t src_offset, size_t dst_offset, size_t size) = 0;

    virtual void copy_buffer_to_texture(const Buffer* src, Texture* dst, const BufferImageCopy& region) = 0;

    virtual void copy_texture_to_buffer(const Texture* src, Buffer* dst, const BufferImageCopy& region) = 0;

    // Both textures must share a format; regions must lie inside both
    virtual void copy_texture(const Texture* src, Texture* dst, const TextureCopy& region) = 0;

protected:
    CommandBuffer() = default;
};

}  // namespace scribble::graphics
