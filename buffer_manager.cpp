#include "buffer_manager.h"

#include <drm/drm.h>
#include <string.h>

#include <atomic>
#include <mutex>
#include <type_traits>
#include <vector>

#include <fmt/core.h>

#include "logging_policy.h"

namespace planeflip {

namespace {

auto const& buffer_logger() {
    static const auto logger = make_logger("buffer");
    return logger;
}

// GEM handle for an imported DMA-BUF, closed when the guard goes away.
// A framebuffer keeps its own reference once ADDFB2 succeeds.
class ImportedHandle {
  public:
    ImportedHandle(std::shared_ptr<FileDescriptor> fd, uint32_t handle)
        : fd(std::move(fd)), handle(handle) {}

    ~ImportedHandle() {
        if (!handle) return;
        drm_gem_close cdat = {.handle = handle, .pad = 0};
        auto const ret = fd->ioc<DRM_IOCTL_GEM_CLOSE>(cdat);
        if (ret.err)
            buffer_logger()->warn("GEM close h{}: {}", handle, strerror(ret.err));
    }

    ImportedHandle(ImportedHandle const&) = delete;
    ImportedHandle& operator=(ImportedHandle const&) = delete;

  private:
    std::shared_ptr<FileDescriptor> fd;
    uint32_t handle = 0;
};

class BufferManagerDef : public BufferManager {
  public:
    virtual std::shared_ptr<SharedBuffer> allocate_buffer(
        XY<int> size, uint32_t fourcc
    ) final {
        auto const layout = buffer_layout(size, fourcc);
        {
            std::scoped_lock const lock{mutex};
            CHECK_RUNTIME(!disposed, "Buffer allocation after dispose");
        }

        auto mem = allocator->allocate(layout.full_size);
        CHECK_RUNTIME(
            mem && mem->size() >= layout.full_size,
            "DMA allocation too small for {} {}",
            debug(size), debug_fourcc(fourcc)
        );
        return track(std::make_shared<SharedBuffer>(
            std::move(mem), size, fourcc, layout
        ));
    }

    virtual std::shared_ptr<SharedBuffer> adopt_buffer(
        std::unique_ptr<DmaMemory> mem, XY<int> size, uint32_t fourcc
    ) final {
        auto const layout = buffer_layout(size, fourcc);
        CHECK_ARG(
            mem && mem->size() >= layout.full_size,
            "Adopted memory too small for {} {}",
            debug(size), debug_fourcc(fourcc)
        );

        {
            std::scoped_lock const lock{mutex};
            CHECK_RUNTIME(!disposed, "Buffer adoption after dispose");
        }
        return track(std::make_shared<SharedBuffer>(
            std::move(mem), size, fourcc, layout
        ));
    }

    virtual uint32_t create_framebuffer(SharedBuffer* buf) final {
        CHECK_ARG(buf, "Null buffer for framebuffer");
        if (auto const existing = buf->fb_id()) return existing;
        if (buf->released()) {
            logger->warn("{} released, no framebuffer", debug(*buf));
            return 0;
        }

        auto const& fd = device->fd();
        drm_prime_handle hdat = {};
        hdat.fd = buf->memory()->dma_fd();
        auto const import = fd->ioc<DRM_IOCTL_PRIME_FD_TO_HANDLE>(&hdat);
        if (import.err) {
            logger->warn("{} DMA import: {}", debug(*buf), strerror(import.err));
            return 0;
        }

        // Keep the DMA-to-DRM import until the ADDFB2 call which will ref it.
        ImportedHandle const imported{fd, hdat.handle};

        drm_mode_fb_cmd2 fdat = {};
        fdat.width = buf->size().x;
        fdat.height = buf->size().y;
        fdat.pixel_format = buf->fourcc();

        // The planes share one allocation, so they share one handle.
        auto const& layout = buf->layout();
        static_assert(std::extent_v<decltype(fdat.handles)> >= 4);
        for (size_t p = 0; p < layout.plane_offsets.size() && p < 4; ++p) {
            fdat.handles[p] = hdat.handle;
            fdat.pitches[p] = layout.stride;
            fdat.offsets[p] = layout.plane_offsets[p];
        }

        auto const added = fd->ioc<DRM_IOCTL_MODE_ADDFB2>(&fdat);
        if (added.err) {
            logger->warn("{} ADDFB2: {}", debug(*buf), strerror(added.err));
            return 0;
        }

        buf->attach_framebuffer(std::make_unique<FramebufferId>(fd, fdat.fb_id));
        DEBUG(logger, "Created fb{} for {}", fdat.fb_id, debug(*buf));
        return fdat.fb_id;
    }

    virtual size_t buffer_count() const final {
        std::scoped_lock const lock{mutex};
        size_t count = 0;
        for (auto const& weak : buffers) {
            auto const buf = weak.lock();
            if (buf && !buf->released()) ++count;
        }
        return count;
    }

    virtual void dispose() final {
        std::vector<std::weak_ptr<SharedBuffer>> to_release;
        {
            std::scoped_lock const lock{mutex};
            if (disposed) return;
            disposed = true;
            to_release.swap(buffers);
        }

        int released = 0;
        for (auto const& weak : to_release) {
            if (auto const buf = weak.lock()) {
                if (!buf->released()) ++released;
                buf->release();
            }
        }
        DEBUG(logger, "Disposed {} buffers", released);
    }

    BufferManagerDef(
        std::shared_ptr<DisplayDevice> device,
        std::shared_ptr<DmaAllocator> allocator
    ) : device(std::move(device)), allocator(std::move(allocator)) {}

  private:
    // Constant from construction to ~
    std::shared_ptr<log::logger> const logger = buffer_logger();
    std::shared_ptr<DisplayDevice> const device;
    std::shared_ptr<DmaAllocator> const allocator;

    // Guarded by mutex
    std::mutex mutable mutex;
    bool disposed = false;
    std::vector<std::weak_ptr<SharedBuffer>> buffers;

    std::shared_ptr<SharedBuffer> track(std::shared_ptr<SharedBuffer> buf) {
        std::scoped_lock const lock{mutex};
        std::erase_if(buffers, [](auto const& w) { return w.expired(); });
        buffers.push_back(buf);
        TRACE(logger, "Allocated {}", debug(*buf));
        return buf;
    }
};

}  // anonymous namespace

FramebufferId::FramebufferId(std::shared_ptr<FileDescriptor> fd, uint32_t id)
    : fd(std::move(fd)), fb_id(id) {}

bool FramebufferId::remove() {
    if (!fb_id) return false;
    uint32_t id = fb_id;
    fb_id = 0;
    auto const ret = fd->ioc<DRM_IOCTL_MODE_RMFB>(&id);
    if (ret.err) {
        buffer_logger()->warn("Remove fb{}: {}", id, strerror(ret.err));
    } else {
        TRACE(buffer_logger(), "Removed fb{}", id);
    }
    return true;
}

SharedBuffer::SharedBuffer(
    std::unique_ptr<DmaMemory> memory,
    XY<int> size,
    uint32_t fourcc,
    BufferLayout layout
) : pixel_size(size), format(fourcc), plane_layout(std::move(layout)),
    mem(std::move(memory)) {
    static std::atomic<int64_t> next_serial = 1;
    serial_number = next_serial++;
}

uint32_t SharedBuffer::fb_id() const {
    std::scoped_lock const lock{fb_mutex};
    return fb ? fb->id() : 0;
}

void SharedBuffer::attach_framebuffer(std::unique_ptr<FramebufferId> id) {
    CHECK_ARG(id, "b{} null framebuffer", serial_number);
    std::scoped_lock const lock{fb_mutex};
    CHECK_ARG(!fb, "b{} already has fb{}", serial_number, fb->id());
    fb = std::move(id);
}

bool SharedBuffer::remove_framebuffer() {
    std::unique_ptr<FramebufferId> taken;
    {
        std::scoped_lock const lock{fb_mutex};
        taken = std::move(fb);
    }
    return taken && taken->remove();
}

void SharedBuffer::release() {
    remove_framebuffer();
    if (mem) {
        mem->release();
        mem.reset();
    }
}

std::shared_ptr<BufferManager> make_buffer_manager(
    std::shared_ptr<DisplayDevice> device,
    std::shared_ptr<DmaAllocator> allocator
) {
    CHECK_ARG(device && allocator, "Buffer manager needs device & allocator");
    return std::make_shared<BufferManagerDef>(
        std::move(device), std::move(allocator)
    );
}

std::string debug(SharedBuffer const& buf) {
    std::string out = fmt::format(
        "b{} {} {}", buf.serial(), debug(buf.size()), debug_fourcc(buf.fourcc())
    );
    if (buf.fb_id()) out += fmt::format(" fb{}", buf.fb_id());
    if (buf.released()) out += " [released]";
    return out;
}

}  // namespace planeflip
