#include "dma_heap.h"

#include <linux/dma-buf.h>
#include <linux/dma-heap.h>
#include <string.h>
#include <sys/mman.h>

#include <fmt/core.h>

#include "logging_policy.h"
#include "pixel_format.h"

namespace planeflip {

namespace {

auto const& dma_logger() {
    static const auto logger = make_logger("dma");
    return logger;
}

class DmaMemoryDef : public DmaMemory {
  public:
    DmaMemoryDef(std::unique_ptr<FileDescriptor> fd, size_t size)
        : fd(std::move(fd)), bytes(size) {}

    virtual int dma_fd() const final { return fd ? fd->raw_fd() : -1; }
    virtual size_t size() const final { return bytes; }

    virtual uint8_t* data() final {
        if (!fd) return nullptr;
        if (!mem) {
            mem = fd->mmap(
                bytes, PROT_READ | PROT_WRITE, MAP_SHARED, 0
            ).ex("Memory map DMA buffer");
        }
        return (uint8_t*) mem.get();
    }

    virtual void begin_cpu_access() final {
        CHECK_RUNTIME(fd, "CPU access to released DMA buffer");
        dma_buf_sync const sync = {DMA_BUF_SYNC_START | DMA_BUF_SYNC_RW};
        fd->ioc<DMA_BUF_IOCTL_SYNC>(sync).ex("DMA buffer sync start");
    }

    virtual void end_cpu_access() final {
        CHECK_RUNTIME(fd, "CPU access to released DMA buffer");
        dma_buf_sync const sync = {DMA_BUF_SYNC_END | DMA_BUF_SYNC_RW};
        fd->ioc<DMA_BUF_IOCTL_SYNC>(sync).ex("DMA buffer sync end");
    }

    virtual void release() final {
        mem.reset();
        fd.reset();
    }

  private:
    std::unique_ptr<FileDescriptor> fd;
    size_t bytes = 0;
    std::shared_ptr<void> mem;
};

class DmaHeapAllocatorDef : public DmaAllocator {
  public:
    virtual std::unique_ptr<DmaMemory> allocate(size_t size) final {
        CHECK_ARG(size > 0, "Empty DMA allocation");
        dma_heap_allocation_data adat = {};
        adat.len = size;
        adat.fd_flags = O_RDWR | O_CLOEXEC;
        heap->ioc<DMA_HEAP_IOCTL_ALLOC>(&adat).ex(
            fmt::format("Allocate {} from {}", debug_size(size), heap_path)
        );

        TRACE(logger, "Allocated {} (f{})", debug_size(size), adat.fd);
        return adopt_dma_memory(sys->adopt(adat.fd), size);
    }

    void open(
        std::shared_ptr<UnixSystem> sys, std::vector<std::string> const& heaps
    ) {
        this->sys = std::move(sys);
        for (auto const& path : heaps) {
            auto opened = this->sys->open(path, O_RDWR | O_CLOEXEC);
            if (opened.err) {
                DEBUG(logger, "No DMA heap \"{}\": {}", path, strerror(opened.err));
                continue;
            }

            heap = std::move(opened.value);
            heap_path = path;
            logger->info("Using DMA heap \"{}\"", path);
            return;
        }

        CHECK_RUNTIME(false, "No usable DMA heap ({} tried)", heaps.size());
    }

  private:
    std::shared_ptr<log::logger> const logger = dma_logger();
    std::shared_ptr<UnixSystem> sys;
    std::unique_ptr<FileDescriptor> heap;
    std::string heap_path;
};

}  // anonymous namespace

std::unique_ptr<DmaMemory> adopt_dma_memory(
    std::unique_ptr<FileDescriptor> fd, size_t size
) {
    CHECK_ARG(fd, "No DMA descriptor");
    return std::make_unique<DmaMemoryDef>(std::move(fd), size);
}

std::vector<std::string> const& default_dma_heaps() {
    static const std::vector<std::string> heaps = {
        "/dev/dma_heap/vidbuf_cached",
        "/dev/dma_heap/linux,cma",
        "/dev/dma_heap/system",
    };
    return heaps;
}

std::shared_ptr<DmaAllocator> open_dma_heap_allocator(
    std::shared_ptr<UnixSystem> sys, std::vector<std::string> const& heaps
) {
    auto allocator = std::make_shared<DmaHeapAllocatorDef>();
    allocator->open(std::move(sys), heaps);
    return allocator;
}

}  // namespace planeflip
