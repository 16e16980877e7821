// Presentation on a primary plane plus an optional overlay plane, sharing
// one CRTC and display mode.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "buffer_manager.h"
#include "display_device.h"
#include "display_layout.h"
#include "flip_engine.h"
#include "logging_policy.h"
#include "unix_system.h"

namespace planeflip {

struct PresenterPlaneConfig {
    uint32_t fourcc = 0;
    FlipPreference flip = FlipPreference::kAuto;
    std::optional<PlaneBlend> blend;
};

struct DualPlaneConfig {
    PresenterPlaneConfig primary;
    std::optional<PresenterPlaneConfig> overlay;
    bool event_thread = true;
    double poll_timeout = 0.1;
    double stop_grace = 2.0;
    std::shared_ptr<log::logger> logger;  // Defaults to "presenter"
};

// Owns the flip engines for a display. Returned by open_dual_plane_presenter().
// *Internally synchronized* (each engine is).
class DualPlanePresenter {
  public:
    // Runs cleanup() if needed.
    virtual ~DualPlanePresenter() = default;

    virtual DisplayLayout const& layout() const = 0;
    virtual bool has_overlay() const = 0;

    // See FlipEngine::submit(). Submitting to a missing overlay throws
    // std::invalid_argument.
    virtual bool submit_primary(std::shared_ptr<SharedBuffer>) = 0;
    virtual bool submit_overlay(std::shared_ptr<SharedBuffer>) = 0;

    virtual std::vector<std::shared_ptr<SharedBuffer>> recycled_primary() = 0;
    virtual std::vector<std::shared_ptr<SharedBuffer>> recycled_overlay() = 0;

    virtual FlipEngine* primary() const = 0;
    virtual FlipEngine* overlay() const = 0;  // Null without an overlay

    // Cleans up the overlay engine, then the primary engine, even if the
    // first throws (see FlipEngine::cleanup()). Later calls do nothing.
    virtual void cleanup() = 0;
};

// Sets the layout's mode with a blank primary buffer (legacy SETCRTC),
// then starts an engine for each plane. The layout must include an overlay
// plane if the config has an overlay. Throws on setup failure.
std::unique_ptr<DualPlanePresenter> open_dual_plane_presenter(
    std::shared_ptr<DisplayDevice>,
    std::shared_ptr<BufferManager>,
    DisplayLayout const&,
    DualPlaneConfig const&,
    std::shared_ptr<UnixSystem> = global_system()
);

}  // namespace planeflip
