// In-memory DRM device and system for tests: answers the KMS ioctls used
// here, records commits, and queues flip events for dispatch.

#pragma once

#include <drm/drm.h>

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "buffer_manager.h"
#include "display_device.h"
#include "dma_heap.h"
#include "unix_system.h"

namespace planeflip {

// One recorded DRM_IOCTL_MODE_ATOMIC call that was accepted.
struct FakeCommit {
    uint32_t flags = 0;
    uint64_t user_data = 0;
    std::map<uint32_t, std::map<std::string, uint64_t>> values;  // By object

    bool has(uint32_t obj, std::string const& name) const;
    uint64_t value(uint32_t obj, std::string const& name) const;  // Or throws
};

struct FakeConnector {
    uint32_t id = 0;
    uint32_t type = DRM_MODE_CONNECTOR_HDMIA;
    uint32_t type_id = 1;
    bool connected = true;
    uint32_t encoder_id = 0;
    std::vector<uint32_t> encoder_ids;
    std::vector<drm_mode_modeinfo> modes;
};

// A recorded DRM_IOCTL_MODE_SETCRTC call.
struct FakeModeSet {
    uint32_t crtc_id = 0;
    uint32_t fb_id = 0;
    std::vector<uint32_t> connector_ids;
    drm_mode_modeinfo mode = {};
};

// The state of a fake GPU. Use FakeSystem to open it as a device node.
// *Internally synchronized* for multithreaded access.
class FakeDrm : public FileDescriptor {
  public:
    virtual int raw_fd() const final { return 99; }
    virtual ErrnoOr<int> read(void* buf, size_t len) final;
    virtual ErrnoOr<int> ioctl(uint32_t nr, void* data) final;
    virtual ErrnoOr<std::shared_ptr<void>> mmap(size_t, int, int, off_t) final {
        return {ENODEV, {}};
    }
    virtual ErrnoOr<int> poll(short mask, double timeout) final;

    // Setup
    uint32_t prop_id(std::string const& name);
    void set_property(uint32_t obj, std::string const& name, uint64_t value);
    void remove_property(uint32_t obj, std::string const& name);
    void add_crtc(uint32_t id);
    void add_encoder(uint32_t id, uint32_t crtc_id, uint32_t possible_crtcs);
    void add_connector(FakeConnector const&);
    void add_plane(
        uint32_t id, uint64_t type, uint32_t possible_crtcs,
        std::vector<uint32_t> const& formats, bool blend_props = false
    );

    // Behavior
    void set_atomic(bool);
    void set_async_cap(bool);
    void set_auto_flip(bool);           // Flip events queue as commits land
    void set_reject_async(bool);        // ASYNC commits fail with EINVAL
    void fail_commits(int count, int err = EINVAL);
    void set_fail_import(bool);
    void set_fail_addfb(bool);
    void fail_polls(int count, int err = EIO);
    void set_poll_stall(bool);          // poll() ignores its timeout while set
    bool wait_for_stalled_polls(int count, double timeout);

    // Queues the event for the oldest pending flip; false if none pending.
    bool complete_flip();
    int complete_all_flips();
    void queue_flip_event(uint64_t user_data, uint32_t crtc_id = 0);

    // Queues a zero-filled event of another type and size (at least 8).
    void queue_raw_event(uint32_t type, uint32_t length);

    // Inspection
    std::vector<FakeCommit> commits() const;
    std::vector<drm_mode_set_plane> set_planes() const;
    std::vector<FakeModeSet> mode_sets() const;
    uint64_t property(uint32_t obj, std::string const& name) const;
    int pending_flips() const;
    int max_pending_flips() const;      // Most ever pending for one cookie
    size_t framebuffer_count() const;   // Live (not removed)
    size_t framebuffers_removed() const;
    size_t handle_count() const;        // Open GEM handles
    size_t queued_events() const;

  private:
    struct Plane {
        uint32_t possible_crtcs = 0;
        std::vector<uint32_t> formats;
    };

    struct Encoder {
        uint32_t crtc_id = 0;
        uint32_t possible_crtcs = 0;
    };

    std::mutex mutable mutex;
    std::condition_variable wakeup;

    std::map<std::string, uint32_t> prop_ids;
    std::map<uint32_t, std::string> prop_names;
    std::map<uint32_t, std::map<uint32_t, uint64_t>> objects;
    std::vector<uint32_t> crtcs;
    std::map<uint32_t, Encoder> encoders;
    std::vector<FakeConnector> connectors;
    std::map<uint32_t, Plane> planes;

    bool atomic = true;
    bool async_cap = true;
    bool auto_flip = false;
    bool reject_async = false;
    int fail_count = 0;
    int fail_err = EINVAL;
    bool fail_import = false;
    bool fail_addfb = false;
    int poll_fail_count = 0;
    int poll_fail_err = EIO;
    bool poll_stall = false;
    int stalled_polls = 0;

    std::set<uint32_t> handles;
    uint32_t next_handle = 1;
    std::map<uint32_t, uint32_t> fbs;  // fb id -> format
    uint32_t next_fb = 200;
    size_t fbs_removed = 0;

    std::vector<FakeCommit> commit_log;
    std::vector<drm_mode_set_plane> set_plane_log;
    std::vector<FakeModeSet> mode_set_log;
    std::deque<std::pair<uint64_t, uint32_t>> pending;  // user data, crtc
    int max_pending = 0;
    std::deque<std::vector<uint8_t>> events;  // Raw event bytes
    uint32_t sequence = 0;

    uint32_t prop_id_locked(std::string const& name);
    void queue_event_locked(uint64_t user_data, uint32_t crtc_id);
    ErrnoOr<int> atomic_commit(drm_mode_atomic const&);
    ErrnoOr<int> get_connector(drm_mode_get_connector*);
    ErrnoOr<int> set_crtc(drm_mode_crtc const&);
};

// A UnixSystem whose device nodes are FakeDrm instances ("/dev/dri/cardN").
// Other paths do not exist. Clocks and flags are real.
class FakeSystem : public UnixSystem {
  public:
    void add_device(std::string const& path, std::shared_ptr<FakeDrm>);

    virtual double clock(clockid_t = CLOCK_REALTIME) const final;
    virtual std::unique_ptr<SyncFlag> make_flag(
        clockid_t = CLOCK_REALTIME
    ) const final;
    virtual ErrnoOr<struct stat> stat(std::string const&) const final;
    virtual ErrnoOr<std::string> realpath(std::string const&) const final;
    virtual ErrnoOr<std::vector<std::string>> ls(std::string const&) const final;
    virtual ErrnoOr<std::unique_ptr<FileDescriptor>> open(
        std::string const&, int flags, mode_t = 0
    ) final;
    virtual std::unique_ptr<FileDescriptor> adopt(int raw_fd) final;

  private:
    std::map<std::string, std::shared_ptr<FakeDrm>> devices;
};

// Memory for FakeAllocator, with a made-up descriptor number.
class FakeMemory : public DmaMemory {
  public:
    FakeMemory(int fd, size_t size) : fd(fd), bytes(size, 0) {}
    virtual int dma_fd() const final { return fd; }
    virtual size_t size() const final { return bytes.size(); }
    virtual uint8_t* data() final { return fd < 0 ? nullptr : bytes.data(); }
    virtual void begin_cpu_access() final { ++cpu_begins; }
    virtual void end_cpu_access() final { ++cpu_ends; }
    virtual void release() final { fd = -1; }

    int cpu_begins = 0;
    int cpu_ends = 0;

  private:
    int fd;
    std::vector<uint8_t> bytes;
};

class FakeAllocator : public DmaAllocator {
  public:
    virtual std::unique_ptr<DmaMemory> allocate(size_t size) final;
    int allocations = 0;
    bool fail = false;

  private:
    int next_fd = 500;
};

// Object ids used by setup_basic_display().
namespace basic_display {
constexpr uint32_t connector = 31;
constexpr uint32_t encoder = 35;
constexpr uint32_t crtc = 41;
constexpr uint32_t primary = 50;
constexpr uint32_t overlay = 51;
constexpr uint32_t cursor = 52;
}  // namespace basic_display

// A mode with plausible timings; preferred if marked so.
drm_mode_modeinfo fake_mode(int width, int height, int hz, bool preferred);

// One CRTC driving a connected HDMI-1 (1920x1080 preferred, 1280x720),
// with primary (XRGB/ARGB), overlay (NV12/ARGB/XRGB, blend properties)
// and cursor (ARGB) planes.
void setup_basic_display(FakeDrm*);

// A basic display opened as "/dev/dri/card0", with a buffer manager.
struct FakeRig {
    std::shared_ptr<FakeDrm> drm = std::make_shared<FakeDrm>();
    std::shared_ptr<FakeSystem> sys = std::make_shared<FakeSystem>();
    std::shared_ptr<FakeAllocator> allocator = std::make_shared<FakeAllocator>();
    std::shared_ptr<DisplayDevice> device;
    std::shared_ptr<BufferManager> buffers;

    FakeRig();
};

}  // namespace planeflip
