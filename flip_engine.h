// Presentation state machine for one display plane: submits buffers with
// atomic commits, tracks what is on screen, and recycles retired buffers.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "buffer_manager.h"
#include "display_device.h"
#include "logging_policy.h"
#include "plane_properties.h"
#include "unix_system.h"
#include "xy.h"

namespace planeflip {

// How commits reach the kernel; fixed when the engine starts.
enum class FlipMode {
    kAtomicAsync,   // Atomic, flips without waiting for vblank when allowed
    kAtomicVblank,  // Atomic, non-blocking, flips at vblank
    kLegacy,        // DRM_IOCTL_MODE_SETPLANE, for planes without atomic
};

// What the caller would like; see choose_flip_mode().
enum class FlipPreference { kAuto, kAsync, kVblank, kLegacy };

enum class FlipState {
    kIdle,            // Nothing shown yet
    kDisplayed,       // A buffer is on screen, no commit pending
    kCommitInFlight,  // A commit was accepted and its flip is pending
};

// Values of the "pixel blend mode" plane property.
enum class BlendMode : uint64_t { kNone = 0, kPremultiplied = 1, kCoverage = 2 };

// Composition settings, applied where the plane supports them.
struct PlaneBlend {
    BlendMode mode = BlendMode::kPremultiplied;
    int alpha = 255;              // 0-255, scaled to the kernel's 0-65535
    std::optional<uint64_t> zpos;
};

struct FlipEngineConfig {
    std::string name = "plane";   // For logs, like "primary" or "overlay"
    uint32_t crtc_id = 0;
    XY<int> screen_size = {};     // Destination size (0x0: buffer size)
    FlipMode mode = FlipMode::kAtomicVblank;
    std::optional<PlaneBlend> blend;
    bool event_thread = true;     // If false, the owner must pump events
    double poll_timeout = 0.1;    // Event thread poll timeout (seconds)
    double stop_grace = 2.0;      // Event thread shutdown limit (seconds)
    std::shared_ptr<log::logger> logger;  // Defaults to "flip"
};

struct FlipStats {
    int64_t commits = 0;   // Accepted by the kernel
    int64_t flips = 0;     // Completed
    int64_t dropped = 0;   // Replaced in the queue before being committed
    int64_t failed = 0;    // Rejected by the kernel (or framebuffer setup)
    double last_flip = 0;  // CLOCK_MONOTONIC time of the last flip
};

// Shows buffers on one plane. Returned by start_flip_engine().
//
// Only the newest submitted buffer is ever queued: submitting while a
// commit is pending replaces (and recycles) any queued buffer. Buffers
// come back through get_recycled_buffers() once off screen or dropped.
// Kernel rejections are logged and the buffer recycled; nothing throws.
//
// *Internally synchronized*; flip events arrive on the event thread.
class FlipEngine {
  public:
    // Runs cleanup() if needed.
    virtual ~FlipEngine() = default;

    // Queues a buffer for display, taking ownership. Returns false if the
    // buffer was rejected (it is then recycled right away).
    virtual bool submit(std::shared_ptr<SharedBuffer>) = 0;

    // Takes all buffers that are free for the producer to reuse.
    virtual std::vector<std::shared_ptr<SharedBuffer>> get_recycled_buffers() = 0;

    // Adopts a buffer that is already on screen (from a legacy modeset).
    virtual void show_initial(std::shared_ptr<SharedBuffer>) = 0;

    // Stops the event thread, disables the plane, recycles all held buffers
    // and removes every framebuffer this engine used. Later calls do nothing.
    // If the event thread can't be stopped it is abandoned, the rest of the
    // cleanup still runs, and then std::runtime_error is thrown.
    virtual void cleanup() = 0;

    virtual uint32_t plane_id() const = 0;
    virtual FlipState state() const = 0;
    virtual FlipMode mode() const = 0;
    virtual FlipStats stats() const = 0;
};

// Picks the best supported mode for a preference.
FlipMode choose_flip_mode(
    DisplayCaps const&, PlaneProperties const&, FlipPreference
);

// Starts an engine for a plane. Atomic modes need DRM atomic support and
// valid plane properties, or std::runtime_error is thrown.
std::unique_ptr<FlipEngine> start_flip_engine(
    std::shared_ptr<DisplayDevice>,
    std::shared_ptr<BufferManager>,
    PlaneProperties const&,
    FlipEngineConfig const&,
    std::shared_ptr<UnixSystem> = global_system()
);

std::string debug(FlipMode);
std::string debug(FlipState);
std::string debug(FlipStats const&);

}  // namespace planeflip
