// Thin wrappers for the Unix calls used to drive display devices, so tests
// can substitute fake devices (see fake_drm.h).

#pragma once

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace planeflip {

// Result of a system call: an errno value, or (if err is zero) a result.
// Kernel rejections are ordinary outcomes for callers like the flip engine,
// so these are returned rather than thrown; use ex() to throw instead.
template <typename T>
struct [[nodiscard]] ErrnoOr {
    int err = 0;
    T value = {};

    // Returns the value, or throws std::system_error naming the operation.
    T ex(std::string_view what) const& { check(what); return value; }
    T ex(std::string_view what) && { check(what); return std::move(value); }

    void check(std::string_view what) const {
        if (err) throw std::system_error(err, std::system_category(), std::string{what});
    }
};

// An open file, usually a DRM device node or a dma-buf.
// Calls are retried on EINTR. Returned by UnixSystem::open() and adopt().
class FileDescriptor {
  public:
    virtual ~FileDescriptor() = default;
    virtual int raw_fd() const = 0;
    virtual ErrnoOr<int> read(void* buf, size_t len) = 0;
    virtual ErrnoOr<int> ioctl(uint32_t nr, void* data) = 0;

    // Maps the file; the memory is unmapped when the last pointer goes.
    virtual ErrnoOr<std::shared_ptr<void>> mmap(
        size_t len, int prot, int flags, off_t offset
    ) = 0;

    // Waits up to timeout seconds for poll() events (POLLIN, etc).
    // Returns the revents bits, zero on timeout.
    virtual ErrnoOr<int> poll(short events, double timeout) = 0;

    // ioctl() with no argument.
    template <uint32_t nr>
    ErrnoOr<int> ioc() {
        static_assert(_IOC_DIR(nr) == _IOC_NONE && _IOC_SIZE(nr) == 0);
        return this->ioctl(nr, nullptr);
    }

    // ioctl() that only passes data in, with the size checked at compile time.
    template <uint32_t nr, typename T>
    ErrnoOr<int> ioc(T const& in) {
        static_assert(std::is_standard_layout<T>::value);
        static_assert(_IOC_DIR(nr) == _IOC_WRITE && _IOC_SIZE(nr) == sizeof(T));
        return this->ioctl(nr, (void*) &in);
    }

    // ioctl() that passes data in and back out.
    template <uint32_t nr, typename T>
    ErrnoOr<int> ioc(T* inout) {
        static_assert(std::is_standard_layout<T>::value);
        static_assert(_IOC_DIR(nr) == (_IOC_READ | _IOC_WRITE));
        static_assert(_IOC_SIZE(nr) == sizeof(T));
        return this->ioctl(nr, inout);
    }
};

// One-shot wakeup flag for pacing loops against a clock.
class SyncFlag {
  public:
    virtual ~SyncFlag() = default;

    // Wakes the sleeper (or the next one to sleep).
    virtual void set() = 0;

    // Waits for set() or the deadline (in the flag's clock). Returns true
    // (and clears the flag) if set() was called.
    virtual bool sleep_until(double deadline) = 0;
};

// Access to clocks, files and device nodes. Usually global_system().
// *Internally synchronized* (by the OS, mainly) for multithreaded access.
class UnixSystem {
  public:
    virtual ~UnixSystem() = default;

    virtual double clock(clockid_t = CLOCK_REALTIME) const = 0;
    virtual std::unique_ptr<SyncFlag> make_flag(
        clockid_t = CLOCK_REALTIME
    ) const = 0;

    // Used to find device nodes (see list_display_devices()).
    virtual ErrnoOr<struct stat> stat(std::string const&) const = 0;
    virtual ErrnoOr<std::string> realpath(std::string const&) const = 0;
    virtual ErrnoOr<std::vector<std::string>> ls(std::string const&) const = 0;

    virtual ErrnoOr<std::unique_ptr<FileDescriptor>> open(
        std::string const&, int flags, mode_t mode = 0
    ) = 0;

    // Takes ownership of an fd from elsewhere (like a dma-heap allocation).
    virtual std::unique_ptr<FileDescriptor> adopt(int raw_fd) = 0;
};

std::shared_ptr<UnixSystem> global_system();

}  // namespace planeflip
