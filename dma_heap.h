// DMA-BUF memory for display buffers, allocated from Linux DMA heaps
// (see kernel.org/doc/html/latest/userspace-api/dma-buf-heaps.html).

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "unix_system.h"

namespace planeflip {

// A DMA-BUF file descriptor with its memory mapping.
// *Not* internally synchronized; owned by one buffer at a time.
class DmaMemory {
  public:
    virtual ~DmaMemory() = default;
    virtual int dma_fd() const = 0;  // -1 once released
    virtual size_t size() const = 0;
    virtual uint8_t* data() = 0;     // Maps on first use; null once released

    // Brackets CPU writes for cache coherency (DMA_BUF_IOCTL_SYNC).
    virtual void begin_cpu_access() = 0;
    virtual void end_cpu_access() = 0;

    // Unmaps the memory and closes the descriptor. Safe to repeat.
    virtual void release() = 0;
};

// Source of DMA memory for BufferManager; may be replaced for testing.
class DmaAllocator {
  public:
    virtual ~DmaAllocator() = default;

    // Allocates at least size bytes. Throws std::runtime_error on failure.
    virtual std::unique_ptr<DmaMemory> allocate(size_t size) = 0;
};

// Wraps an existing DMA-BUF descriptor (from a decoder, for example).
std::unique_ptr<DmaMemory> adopt_dma_memory(
    std::unique_ptr<FileDescriptor> fd, size_t size
);

// DMA heaps to try, in order of preference.
std::vector<std::string> const& default_dma_heaps();

// Opens the first usable heap in the list.
// Throws std::runtime_error if none can be opened.
std::shared_ptr<DmaAllocator> open_dma_heap_allocator(
    std::shared_ptr<UnixSystem> sys,
    std::vector<std::string> const& heaps = default_dma_heaps()
);

}  // namespace planeflip
