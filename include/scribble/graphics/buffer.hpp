// Scribble Graphics Abstraction Layer
// buffer.hpp - GPU buffer interface

#pragma once

#include "types.hpp"

#include <cstddef>

namespace scribble::graphics {

// Abstract GPU buffer class
// Implementations: SoftwareBuffer
class Buffer {
public:
    virtual ~Buffer() = default;

    // Non-copyable
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    [[nodiscard]] virtual size_t get_size() const = 0;
    [[nodiscard]] virtual BufferUsage get_usage() const = 0;
    [[nodiscard]] virtual bool is_host_visible() const = 0;

    // map() returns nullptr if buffer is not host-visible
    [[nodiscard]] virtual void* map() = 0;
    virtual void unmap() = 0;

    virtual void write(const void* data, size_t size, size_t offset = 0) = 0;
    virtual void read(void* data, size_t size, size_t offset = 0) const = 0;

protected:
    Buffer() = default;
};

}  // namespace scribble::graphics
