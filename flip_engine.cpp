#include "flip_engine.h"

#include <drm/drm.h>
#include <string.h>

#include <exception>
#include <mutex>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "atomic_request.h"
#include "event_listener.h"

namespace planeflip {

namespace {

auto const& flip_logger() {
    static const auto logger = make_logger("flip");
    return logger;
}

using BufferPtr = std::shared_ptr<SharedBuffer>;

class FlipEngineDef : public FlipEngine {
  public:
    virtual ~FlipEngineDef() final { cleanup(); }

    virtual bool submit(BufferPtr buf) final {
        CHECK_ARG(buf, "{} null buffer submitted", config.name);
        {
            std::scoped_lock const lock{mutex};
            check_not_held(*buf);
            if (closing) return reject(std::move(buf), "after cleanup");
        }

        // Framebuffer registration is a kernel call; do it unlocked.
        bool const fresh = !buf->fb_id();
        if (fresh && !buffers->create_framebuffer(buf.get())) {
            std::scoped_lock const lock{mutex};
            ++counts.failed;
            return reject(std::move(buf), "without framebuffer");
        }

        if (legacy) return submit_legacy(std::move(buf), fresh);

        std::scoped_lock const lock{mutex};
        if (closing) {
            if (fresh) buf->remove_framebuffer();
            return reject(std::move(buf), "after cleanup");
        }

        if (fresh) remember_framebuffer(buf);
        if (flip_state == FlipState::kCommitInFlight) {
            if (queued) {
                DEBUG(
                    logger, "{} drop {} for {}",
                    config.name, debug(*queued), debug(*buf)
                );
                ++counts.dropped;
                recycled.push_back(std::move(queued));
            }
            TRACE(logger, "{} queue {}", config.name, debug(*buf));
            queued = std::move(buf);
            return true;
        }

        return commit(std::move(buf));
    }

    virtual std::vector<BufferPtr> get_recycled_buffers() final {
        std::vector<BufferPtr> out;
        std::scoped_lock const lock{mutex};
        out.swap(recycled);
        return out;
    }

    virtual void show_initial(BufferPtr buf) final {
        CHECK_ARG(buf && buf->fb_id(), "{} initial buffer unrealized", config.name);
        std::scoped_lock const lock{mutex};
        CHECK_ARG(
            flip_state == FlipState::kIdle && !closing,
            "{} initial buffer while {}", config.name, debug(flip_state)
        );

        DEBUG(logger, "{} adopt {} on screen", config.name, debug(*buf));
        remember_framebuffer(buf);
        displayed = std::move(buf);
        flip_state = FlipState::kDisplayed;
        shown_any = true;
    }

    virtual void cleanup() final {
        {
            std::scoped_lock const lock{mutex};
            if (closing) return;
            closing = true;
        }

        DEBUG(logger, "{} cleaning up...", config.name);

        // A stuck listener is reported only after the teardown below.
        std::exception_ptr stop_error;
        if (listener) {
            try {
                listener->stop(config.stop_grace);
            } catch (std::runtime_error const&) {
                stop_error = std::current_exception();
            }
            listener.reset();
        }

        // Waits for a running callback; none may run once this returns.
        if (cookie) {
            device->remove_flip_handler(cookie);
            cookie = 0;
        }

        bool was_shown;
        {
            std::scoped_lock const lock{mutex};
            was_shown = shown_any;
        }
        if (was_shown) disable_plane();

        std::vector<BufferPtr> fb_owners;
        {
            std::scoped_lock const lock{mutex};
            for (auto* held : {&displayed, &in_flight, &queued}) {
                if (*held) recycled.push_back(std::move(*held));
            }
            flip_state = FlipState::kIdle;
            for (auto const& weak : framebuffers) {
                if (auto buf = weak.lock()) fb_owners.push_back(std::move(buf));
            }
            framebuffers.clear();
        }

        int removed = 0;
        for (auto const& buf : fb_owners) {
            if (buf->remove_framebuffer()) ++removed;
        }

        logger->info(
            "{} cleaned up, {} framebuffers removed ({})",
            config.name, removed, debug(stats())
        );
        if (stop_error) std::rethrow_exception(stop_error);
    }

    virtual uint32_t plane_id() const final { return props.plane_id; }

    virtual FlipState state() const final {
        std::scoped_lock const lock{mutex};
        return flip_state;
    }

    virtual FlipMode mode() const final {
        std::scoped_lock const lock{mutex};
        return flip_mode;
    }

    virtual FlipStats stats() const final {
        std::scoped_lock const lock{mutex};
        return counts;
    }

    void start(
        std::shared_ptr<DisplayDevice> device,
        std::shared_ptr<BufferManager> buffers,
        PlaneProperties const& props,
        FlipEngineConfig const& config,
        std::shared_ptr<UnixSystem> sys
    ) {
        this->device = std::move(device);
        this->buffers = std::move(buffers);
        this->props = props;
        this->config = config;
        this->sys = std::move(sys);
        if (config.logger) logger = config.logger;
        flip_mode = config.mode;
        legacy = (flip_mode == FlipMode::kLegacy);

        logger->info(
            "{} starting pl{} crtc{} {}",
            config.name, props.plane_id, config.crtc_id, debug(flip_mode)
        );

        if (legacy) return;  // SETPLANE completes synchronously.
        cookie = this->device->add_flip_handler(
            [this](FlipEvent const& ev) { on_flip_complete(ev); }
        );

        if (config.event_thread) {
            EventListenerConfig listener_config;
            listener_config.name = config.name;
            listener_config.poll_timeout = config.poll_timeout;
            listener_config.logger = config.logger;
            listener = start_event_listener(
                this->device, listener_config, this->sys
            );
        }
    }

  private:
    // Constant from start to ~
    std::shared_ptr<log::logger> logger = flip_logger();
    std::shared_ptr<DisplayDevice> device;
    std::shared_ptr<BufferManager> buffers;
    std::shared_ptr<UnixSystem> sys;
    PlaneProperties props;
    FlipEngineConfig config;
    bool legacy = false;

    // Set up in start(), torn down in cleanup()
    uint64_t cookie = 0;
    std::unique_ptr<EventListener> listener;

    // Guarded by mutex
    std::mutex mutable mutex;
    bool closing = false;
    bool shown_any = false;
    bool geometry_committed = false;
    FlipMode flip_mode = FlipMode::kAtomicVblank;
    FlipState flip_state = FlipState::kIdle;
    BufferPtr displayed, in_flight, queued;
    std::vector<BufferPtr> recycled;
    std::vector<std::weak_ptr<SharedBuffer>> framebuffers;
    FlipStats counts = {};

    void on_flip_complete(FlipEvent const& ev) {
        std::scoped_lock const lock{mutex};
        if (flip_state != FlipState::kCommitInFlight || !in_flight) {
            logger->warn(
                "{} unexpected flip seq={} while {}",
                config.name, ev.sequence, debug(flip_state)
            );
            return;
        }

        ++counts.flips;
        counts.last_flip = ev.time;
        auto done = std::move(in_flight);
        flip_state = FlipState::kDisplayed;
        DEBUG(
            logger, "{} flip {} seq={} (m{:.3f})",
            config.name, debug(*done), ev.sequence, ev.time
        );

        if (displayed) recycled.push_back(std::move(displayed));

        if (queued && !closing) {
            if (commit(std::move(queued))) {
                // Superseded already; it leaves the screen at the next flip.
                recycled.push_back(std::move(done));
                return;
            }
        }

        displayed = std::move(done);
    }

    // Called with mutex held; the commit is non-blocking.
    bool commit(BufferPtr buf) {
        uint32_t const flags = DRM_MODE_ATOMIC_NONBLOCK | DRM_MODE_PAGE_FLIP_EVENT;
        bool const fast =
            flip_mode == FlipMode::kAtomicAsync && geometry_committed;

        AtomicRequest request;
        if (!build_request(&request, *buf, fast)) {
            logger->error("{} incomplete atomic request", config.name);
            ++counts.failed;
            recycled.push_back(std::move(buf));
            return false;
        }

        auto const fd = device->fd().get();
        auto ret = request.commit(
            fd, fast ? flags | DRM_MODE_PAGE_FLIP_ASYNC : flags, cookie
        );

        if (ret.err && fast) {
            logger->warn(
                "{} async flip rejected ({}), using vblank flips",
                config.name, strerror(ret.err)
            );
            flip_mode = FlipMode::kAtomicVblank;
            AtomicRequest full;
            if (build_request(&full, *buf, false))
                ret = full.commit(fd, flags, cookie);
        }

        if (ret.err) {
            logger->warn(
                "{} commit {}: {}", config.name, debug(*buf), strerror(ret.err)
            );
            ++counts.failed;
            recycled.push_back(std::move(buf));
            return false;
        }

        // Only an accepted commit makes the buffer pending.
        TRACE(logger, "{} committed {}", config.name, debug(*buf));
        ++counts.commits;
        geometry_committed = shown_any = true;
        in_flight = std::move(buf);
        flip_state = FlipState::kCommitInFlight;
        return true;
    }

    bool build_request(AtomicRequest* req, SharedBuffer const& buf, bool fb_only) {
        auto const id = props.plane_id;
        if (!req->add(id, props.FB_ID, buf.fb_id())) return false;
        if (fb_only) return true;

        auto const src = buf.size();
        auto const dst = config.screen_size ? config.screen_size : src;
        bool ok =
            req->add(id, props.CRTC_ID, config.crtc_id) &&
            req->add(id, props.CRTC_X, 0) &&
            req->add(id, props.CRTC_Y, 0) &&
            req->add(id, props.CRTC_W, dst.x) &&
            req->add(id, props.CRTC_H, dst.y) &&
            req->add(id, props.SRC_X, 0) &&
            req->add(id, props.SRC_Y, 0) &&
            req->add(id, props.SRC_W, uint64_t(src.x) << 16) &&
            req->add(id, props.SRC_H, uint64_t(src.y) << 16);

        if (ok && config.blend) {
            auto const& blend = *config.blend;
            if (props.pixel_blend_mode)
                ok = req->add(id, props.pixel_blend_mode, uint64_t(blend.mode));
            if (ok && props.alpha)
                ok = req->add(id, props.alpha, uint64_t(blend.alpha) * 257);
            if (ok && props.zpos && blend.zpos)
                ok = req->add(id, props.zpos, *blend.zpos);
        }
        return ok;
    }

    bool submit_legacy(BufferPtr buf, bool fresh) {
        {
            std::scoped_lock const lock{mutex};
            if (closing) {
                if (fresh) buf->remove_framebuffer();
                return reject(std::move(buf), "after cleanup");
            }
            if (fresh) remember_framebuffer(buf);
        }

        auto const src = buf->size();
        auto const dst = config.screen_size ? config.screen_size : src;
        drm_mode_set_plane sp = {};
        sp.plane_id = props.plane_id;
        sp.crtc_id = config.crtc_id;
        sp.fb_id = buf->fb_id();
        sp.crtc_w = dst.x;
        sp.crtc_h = dst.y;
        sp.src_w = uint32_t(src.x) << 16;
        sp.src_h = uint32_t(src.y) << 16;
        auto const ret = device->fd()->ioc<DRM_IOCTL_MODE_SETPLANE>(&sp);

        std::scoped_lock const lock{mutex};
        if (ret.err) {
            logger->warn(
                "{} set plane {}: {}", config.name, debug(*buf), strerror(ret.err)
            );
            ++counts.failed;
            recycled.push_back(std::move(buf));
            return false;
        }

        TRACE(logger, "{} set plane {}", config.name, debug(*buf));
        ++counts.commits;
        ++counts.flips;
        counts.last_flip = sys->clock(CLOCK_MONOTONIC);
        if (displayed) recycled.push_back(std::move(displayed));
        displayed = std::move(buf);
        flip_state = FlipState::kDisplayed;
        shown_any = true;
        return true;
    }

    void disable_plane() {
        ErrnoOr<int> ret;
        if (legacy) {
            drm_mode_set_plane sp = {};
            sp.plane_id = props.plane_id;
            ret = device->fd()->ioc<DRM_IOCTL_MODE_SETPLANE>(&sp);
        } else {
            AtomicRequest request;
            if (
                !request.add(props.plane_id, props.FB_ID, 0) ||
                !request.add(props.plane_id, props.CRTC_ID, 0)
            ) {
                logger->error("{} can't build plane disable", config.name);
                return;
            }
            ret = request.commit(device->fd().get(), 0);
        }

        if (ret.err) {
            logger->warn("{} disable plane: {}", config.name, strerror(ret.err));
        } else {
            DEBUG(logger, "{} plane disabled", config.name);
        }
    }

    // Called with mutex held.
    bool reject(BufferPtr buf, char const* why) {
        logger->warn("{} rejected {} {}", config.name, debug(*buf), why);
        recycled.push_back(std::move(buf));
        return false;
    }

    // Called with mutex held.
    void check_not_held(SharedBuffer const& buf) const {
        for (auto const* held : {&displayed, &in_flight, &queued}) {
            CHECK_ARG(
                held->get() != &buf,
                "{} resubmitted {} while still held", config.name, debug(buf)
            );
        }
    }

    // Called with mutex held.
    void remember_framebuffer(BufferPtr const& buf) {
        std::erase_if(framebuffers, [](auto const& w) { return w.expired(); });
        framebuffers.push_back(buf);
    }
};

}  // anonymous namespace

FlipMode choose_flip_mode(
    DisplayCaps const& caps, PlaneProperties const& props, FlipPreference pref
) {
    if (pref == FlipPreference::kLegacy) return FlipMode::kLegacy;
    if (!caps.atomic || !props.is_valid()) {
        flip_logger()->warn(
            "pl{} falls back to legacy flips ({})",
            props.plane_id, caps.atomic ? "missing properties" : "no atomic"
        );
        return FlipMode::kLegacy;
    }

    if (pref == FlipPreference::kAsync && caps.async_page_flip)
        return FlipMode::kAtomicAsync;
    return FlipMode::kAtomicVblank;
}

std::unique_ptr<FlipEngine> start_flip_engine(
    std::shared_ptr<DisplayDevice> device,
    std::shared_ptr<BufferManager> buffers,
    PlaneProperties const& props,
    FlipEngineConfig const& config,
    std::shared_ptr<UnixSystem> sys
) {
    CHECK_ARG(device && buffers, "{} needs device & buffers", config.name);
    CHECK_ARG(props.plane_id, "{} has no plane", config.name);
    CHECK_ARG(
        !config.blend || (config.blend->alpha >= 0 && config.blend->alpha <= 255),
        "{} bad alpha {}", config.name, config.blend ? config.blend->alpha : 0
    );
    if (config.mode != FlipMode::kLegacy) {
        CHECK_RUNTIME(
            device->caps().atomic,
            "{} atomic flips unsupported by {}", config.name, device->dev_file()
        );
        CHECK_RUNTIME(
            props.is_valid(),
            "{} pl{} can't flip atomically, missing {}",
            config.name, props.plane_id, fmt::join(props.missing(), ", ")
        );
    }

    auto engine = std::make_unique<FlipEngineDef>();
    engine->start(
        std::move(device), std::move(buffers), props, config, std::move(sys)
    );
    return engine;
}

std::string debug(FlipMode mode) {
    switch (mode) {
        case FlipMode::kAtomicAsync: return "atomic-async";
        case FlipMode::kAtomicVblank: return "atomic-vblank";
        case FlipMode::kLegacy: return "legacy";
    }
    return "?";
}

std::string debug(FlipState state) {
    switch (state) {
        case FlipState::kIdle: return "idle";
        case FlipState::kDisplayed: return "displayed";
        case FlipState::kCommitInFlight: return "in-flight";
    }
    return "?";
}

std::string debug(FlipStats const& s) {
    return fmt::format(
        "{} commits, {} flips, {} dropped, {} failed",
        s.commits, s.flips, s.dropped, s.failed
    );
}

}  // namespace planeflip
