#include "unix_system.h"

#include <dirent.h>
#include <limits.h>
#include <pthread.h>
#include <stdlib.h>
#include <sys/mman.h>
#include <unistd.h>

#include <algorithm>
#include <cmath>

namespace planeflip {

namespace {

// Calls f() until it returns something other than EINTR.
template <typename F>
ErrnoOr<int> retry_eintr(F const& f) {
    for (;;) {
        auto const ret = f();
        if (ret >= 0) return {0, int(ret)};
        if (errno != EINTR) return {errno, int(ret)};
    }
}

timespec to_timespec(double t) {
    double const whole = std::floor(t);
    return {time_t(whole), long((t - whole) * 1e9)};
}

class FileDescriptorDef : public FileDescriptor {
  public:
    FileDescriptorDef(int fd) : fd(fd) {}
    virtual ~FileDescriptorDef() final { ::close(fd); }
    virtual int raw_fd() const final { return fd; }

    virtual ErrnoOr<int> read(void* buf, size_t len) final {
        return retry_eintr([&] { return ::read(fd, buf, len); });
    }

    virtual ErrnoOr<int> ioctl(uint32_t nr, void* data) final {
        return retry_eintr([&] { return ::ioctl(fd, nr, data); });
    }

    virtual ErrnoOr<std::shared_ptr<void>> mmap(
        size_t len, int prot, int flags, off_t offset
    ) final {
        void* const mem = ::mmap(nullptr, len, prot, flags, fd, offset);
        if (mem == MAP_FAILED) return {errno, {}};
        return {0, {mem, [len](void* m) { ::munmap(m, len); }}};
    }

    virtual ErrnoOr<int> poll(short events, double timeout) final {
        pollfd pfd = {fd, events, 0};
        int const ms = std::max(0, int(std::ceil(timeout * 1000)));
        auto const ret = retry_eintr([&] { return ::poll(&pfd, 1, ms); });
        if (ret.err) return ret;
        return {0, ret.value > 0 ? int(pfd.revents) : 0};
    }

  private:
    int const fd;
};

// Uses pthreads directly, since std::condition_variable can't pick a clock.
class SyncFlagDef : public SyncFlag {
  public:
    SyncFlagDef(clockid_t clockid) {
        pthread_condattr_t attr;
        pthread_condattr_init(&attr);
        pthread_condattr_setclock(&attr, clockid);
        pthread_cond_init(&cond, &attr);
        pthread_condattr_destroy(&attr);
    }

    virtual ~SyncFlagDef() final {
        pthread_cond_destroy(&cond);
        pthread_mutex_destroy(&mutex);
    }

    virtual void set() final {
        pthread_mutex_lock(&mutex);
        woken = true;
        pthread_cond_signal(&cond);
        pthread_mutex_unlock(&mutex);
    }

    virtual bool sleep_until(double deadline) final {
        timespec const ts = to_timespec(deadline);
        pthread_mutex_lock(&mutex);
        int ret = 0;
        while (!woken && ret != ETIMEDOUT)
            ret = pthread_cond_timedwait(&cond, &mutex, &ts);
        bool const was_woken = woken;
        woken = false;
        pthread_mutex_unlock(&mutex);
        return was_woken;
    }

  private:
    pthread_mutex_t mutex = PTHREAD_MUTEX_INITIALIZER;
    pthread_cond_t cond;
    bool woken = false;  // Guarded by mutex
};

class UnixSystemDef : public UnixSystem {
  public:
    virtual double clock(clockid_t clockid) const final {
        timespec ts = {};
        clock_gettime(clockid, &ts);
        return ts.tv_sec + 1e-9 * ts.tv_nsec;
    }

    virtual std::unique_ptr<SyncFlag> make_flag(clockid_t clockid) const final {
        return std::make_unique<SyncFlagDef>(clockid);
    }

    virtual ErrnoOr<struct stat> stat(std::string const& path) const final {
        ErrnoOr<struct stat> ret;
        ret.err = retry_eintr([&] { return ::stat(path.c_str(), &ret.value); }).err;
        return ret;
    }

    virtual ErrnoOr<std::string> realpath(std::string const& path) const final {
        char buf[PATH_MAX];
        if (!::realpath(path.c_str(), buf)) return {errno, {}};
        return {0, buf};
    }

    // Sorted, so device numbering is stable.
    virtual ErrnoOr<std::vector<std::string>> ls(
        std::string const& dir
    ) const final {
        std::unique_ptr<DIR, int (*)(DIR*)> dp(opendir(dir.c_str()), closedir);
        if (!dp) return {errno, {}};

        std::vector<std::string> names;
        while (dirent const* ent = readdir(dp.get())) {
            std::string_view const name = ent->d_name;
            if (name != "." && name != "..") names.emplace_back(name);
        }
        std::sort(names.begin(), names.end());
        return {0, std::move(names)};
    }

    virtual ErrnoOr<std::unique_ptr<FileDescriptor>> open(
        std::string const& path, int flags, mode_t mode
    ) final {
        auto const r = retry_eintr([&] { return ::open(path.c_str(), flags, mode); });
        if (r.err) return {r.err, {}};
        return {0, adopt(r.value)};
    }

    virtual std::unique_ptr<FileDescriptor> adopt(int raw_fd) final {
        return std::make_unique<FileDescriptorDef>(raw_fd);
    }
};

}  // anonymous namespace

std::shared_ptr<UnixSystem> global_system() {
    static const auto system = std::make_shared<UnixSystemDef>();
    return system;
}

}  // namespace planeflip
