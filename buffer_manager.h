// Display buffers in DMA memory, and the kernel framebuffers that let
// display planes scan them out.

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "display_device.h"
#include "dma_heap.h"
#include "pixel_format.h"
#include "xy.h"

namespace planeflip {

// Owning guard for a kernel framebuffer id; removes it (RMFB) exactly once.
class FramebufferId {
  public:
    FramebufferId(std::shared_ptr<FileDescriptor> fd, uint32_t id);
    ~FramebufferId() { remove(); }

    uint32_t id() const { return fb_id; }  // 0 once removed

    // Removes the framebuffer; returns false if it was already removed.
    bool remove();

    FramebufferId(FramebufferId const&) = delete;
    FramebufferId& operator=(FramebufferId const&) = delete;

  private:
    std::shared_ptr<FileDescriptor> fd;
    uint32_t fb_id = 0;
};

// A pixel buffer in DMA memory, created by BufferManager::allocate_buffer().
// Ownership passes explicitly from producer to flip engine to recycle list
// and back to the producer; only one party uses it at a time. The
// framebuffer methods are *internally synchronized*, since an engine's
// cleanup() may remove the framebuffer of a buffer a producer holds.
class SharedBuffer {
  public:
    SharedBuffer(
        std::unique_ptr<DmaMemory>, XY<int> size, uint32_t fourcc, BufferLayout
    );
    ~SharedBuffer() { release(); }

    int64_t serial() const { return serial_number; }  // For logging
    XY<int> size() const { return pixel_size; }
    uint32_t fourcc() const { return format; }
    BufferLayout const& layout() const { return plane_layout; }
    ptrdiff_t stride() const { return plane_layout.stride; }
    DmaMemory* memory() { return mem.get(); }

    // The kernel framebuffer id, 0 until realized or after removal.
    uint32_t fb_id() const;
    void attach_framebuffer(std::unique_ptr<FramebufferId>);
    bool remove_framebuffer();  // False if there was none to remove

    // Removes any framebuffer and releases the memory. Safe to repeat.
    void release();
    bool released() const { return !mem; }

    SharedBuffer(SharedBuffer const&) = delete;
    SharedBuffer& operator=(SharedBuffer const&) = delete;

  private:
    int64_t serial_number = 0;
    XY<int> pixel_size;
    uint32_t format = 0;
    BufferLayout plane_layout;
    std::unique_ptr<DmaMemory> mem;

    std::mutex mutable fb_mutex;
    std::unique_ptr<FramebufferId> fb;  // Guarded by fb_mutex
};

// Allocates display buffers and registers them with the kernel.
// Returned by make_buffer_manager().
// *Internally synchronized* for multithreaded access.
class BufferManager {
  public:
    virtual ~BufferManager() = default;

    // Allocates DMA memory sized for the format. Throws on failure.
    virtual std::shared_ptr<SharedBuffer> allocate_buffer(
        XY<int> size, uint32_t fourcc
    ) = 0;

    // Wraps memory from elsewhere (a decoder, for example) as a buffer.
    virtual std::shared_ptr<SharedBuffer> adopt_buffer(
        std::unique_ptr<DmaMemory>, XY<int> size, uint32_t fourcc
    ) = 0;

    // Registers a kernel framebuffer for the buffer (if not yet done) and
    // returns its id, or returns 0 if the kernel rejects the buffer.
    virtual uint32_t create_framebuffer(SharedBuffer*) = 0;

    // Number of live buffers made by this manager.
    virtual size_t buffer_count() const = 0;

    // Releases every live buffer from this manager and its framebuffer.
    // Safe to repeat; later allocations fail.
    virtual void dispose() = 0;
};

std::shared_ptr<BufferManager> make_buffer_manager(
    std::shared_ptr<DisplayDevice>, std::shared_ptr<DmaAllocator>
);

std::string debug(SharedBuffer const&);

}  // namespace planeflip
