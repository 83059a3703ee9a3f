// Scribble Graphics Abstraction Layer
// software_device.hpp - Headless host-memory graphics backend

#pragma once

#include "device.hpp"

#include <cstdint>
#include <memory>
#include <span>

namespace scribble::core {
class Config;
}

namespace scribble::graphics {

struct SoftwareDeviceDesc {
    uint32_t max_texture_size_2d = 8192;
    uint32_t max_texture_array_layers = 256;
    uint64_t max_buffer_size = 1ull << 30;

    // device.max_texture_size / device.max_array_layers
    [[nodiscard]] static SoftwareDeviceDesc from_config(const core::Config& config);
};

// Counters of the work the device has executed
struct SoftwareDeviceStats {
    uint64_t textures_created = 0;
    uint64_t buffers_created = 0;
    uint64_t texture_writes = 0;
    uint64_t texture_copies = 0;
    uint64_t submits = 0;
};

// Keeps textures and buffers in host memory and executes recorded transfer
// commands when they are submitted. Used headless and by the tests, where
// texture contents can be read back through copy_texture_to_buffer.
class SoftwareDevice final : public GraphicsDevice {
public:
    explicit SoftwareDevice(const SoftwareDeviceDesc& desc = {});
    ~SoftwareDevice() override;

    [[nodiscard]] std::unique_ptr<Buffer> create_buffer(const BufferDesc& desc) override;
    [[nodiscard]] std::unique_ptr<Texture> create_texture(const TextureDesc& desc) override;

    [[nodiscard]] std::unique_ptr<CommandBuffer> create_command_buffer() override;
    void submit(CommandBuffer* cmd, bool wait_for_completion = false) override;
    void wait_idle() override {}

    void write_texture(Texture* dst, const BufferImageCopy& region, std::span<const uint8_t> data) override;

    [[nodiscard]] DeviceCapabilities get_capabilities() const override;
    [[nodiscard]] const char* get_backend_name() const override { return "Software"; }

    [[nodiscard]] const SoftwareDeviceStats& get_stats() const { return stats_; }

private:
    SoftwareDeviceDesc desc_;
    SoftwareDeviceStats stats_;
};

[[nodiscard]] std::unique_ptr<SoftwareDevice> create_software_device(const SoftwareDeviceDesc& desc = {});

}  // namespace scribble::graphics
