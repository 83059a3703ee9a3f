// Scribble Graphics Abstraction Layer
// device.hpp - Graphics device interface

#pragma once

#include "types.hpp"

#include <cstdint>
#include <memory>
#include <span>

namespace scribble::graphics {

class Buffer;
class CommandBuffer;
class Texture;

// Abstract graphics device class
// Work submitted through submit() and write_texture() executes in call order.
// Destroying a resource after submitting work that references it is allowed;
// backends keep the storage alive until that work has completed.
// Implementations: SoftwareDevice
class GraphicsDevice {
public:
    virtual ~GraphicsDevice() = default;

    // Non-copyable, non-movable
    GraphicsDevice(const GraphicsDevice&) = delete;
    GraphicsDevice& operator=(const GraphicsDevice&) = delete;
    GraphicsDevice(GraphicsDevice&&) = delete;
    GraphicsDevice& operator=(GraphicsDevice&&) = delete;

    // ========================================================================
    // Resource Creation
    // ========================================================================

    // Return nullptr when the resource cannot be created
    [[nodiscard]] virtual std::unique_ptr<Buffer> create_buffer(const BufferDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<Texture> create_texture(const TextureDesc& desc) = 0;

    // ========================================================================
    // Command Submission
    // ========================================================================

    [[nodiscard]] virtual std::unique_ptr<CommandBuffer> create_command_buffer() = 0;
    virtual void submit(CommandBuffer* cmd, bool wait_for_completion = false) = 0;
    virtual void wait_idle() = 0;

    // Queue an upload of tightly packed texels into one layer of a texture.
    // The bytes are copied before returning, the caller may release them.
    virtual void write_texture(Texture* dst, const BufferImageCopy& region, std::span<const uint8_t> data) = 0;

    // ========================================================================
    // Device Info
    // ========================================================================

    [[nodiscard]] virtual DeviceCapabilities get_capabilities() const = 0;
    [[nodiscard]] virtual const char* get_backend_name() const = 0;

protected:
    GraphicsDevice() = default;
};

}  // namespace scribble::graphics
