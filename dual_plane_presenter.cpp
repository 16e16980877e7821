#include "dual_plane_presenter.h"

#include <string.h>

#include <atomic>
#include <exception>

#include "pixel_format.h"
#include "plane_properties.h"

namespace planeflip {

namespace {

auto const& presenter_logger() {
    static const auto logger = make_logger("presenter");
    return logger;
}

using BufferPtr = std::shared_ptr<SharedBuffer>;

class DualPlanePresenterDef : public DualPlanePresenter {
  public:
    virtual ~DualPlanePresenterDef() final { cleanup(); }

    virtual DisplayLayout const& layout() const final { return display; }
    virtual bool has_overlay() const final { return bool(overlay_engine); }

    virtual bool submit_primary(BufferPtr buf) final {
        return primary_engine->submit(std::move(buf));
    }

    virtual bool submit_overlay(BufferPtr buf) final {
        CHECK_ARG(overlay_engine, "No overlay plane on {}", display.connector_name);
        return overlay_engine->submit(std::move(buf));
    }

    virtual std::vector<BufferPtr> recycled_primary() final {
        return primary_engine->get_recycled_buffers();
    }

    virtual std::vector<BufferPtr> recycled_overlay() final {
        if (!overlay_engine) return {};
        return overlay_engine->get_recycled_buffers();
    }

    virtual FlipEngine* primary() const final { return primary_engine.get(); }
    virtual FlipEngine* overlay() const final { return overlay_engine.get(); }

    virtual void cleanup() final {
        if (closed.exchange(true)) return;

        // Overlay first; the primary plane keeps the CRTC running.
        // The first stuck event thread is reported after both are done.
        std::exception_ptr error;
        for (auto* engine : {overlay_engine.get(), primary_engine.get()}) {
            if (!engine) continue;
            try {
                engine->cleanup();
            } catch (std::runtime_error const&) {
                if (!error) error = std::current_exception();
            }
        }
        logger->info("{} presenter closed", display.connector_name);
        if (error) std::rethrow_exception(error);
    }

    void open(
        std::shared_ptr<DisplayDevice> device,
        std::shared_ptr<BufferManager> buffers,
        DisplayLayout const& layout,
        DualPlaneConfig const& config,
        std::shared_ptr<UnixSystem> sys
    ) {
        display = layout;
        if (config.logger) logger = config.logger;
        auto const size = layout.size();

        logger->info(
            "Opening presenter: {} {}{}",
            debug(layout), debug_fourcc(config.primary.fourcc),
            config.overlay ? " + " + debug_fourcc(config.overlay->fourcc) : ""
        );

        // The first mode set is a legacy call with a blank primary buffer.
        auto blank = buffers->allocate_buffer(size, config.primary.fourcc);
        auto* mem = blank->memory();
        mem->begin_cpu_access();
        memset(mem->data(), 0, mem->size());
        mem->end_cpu_access();
        CHECK_RUNTIME(
            buffers->create_framebuffer(blank.get()),
            "Framebuffer for {} rejected", debug(*blank)
        );
        set_crtc_mode(device.get(), layout, blank->fb_id());

        auto const caps = device->caps();
        auto start = [&](
            char const* name, uint32_t plane_id, PresenterPlaneConfig const& pc
        ) {
            auto const props = resolve_plane_properties(device.get(), plane_id);
            FlipEngineConfig ec;
            ec.name = name;
            ec.crtc_id = layout.crtc_id;
            ec.screen_size = size;
            ec.mode = choose_flip_mode(caps, props, pc.flip);
            ec.blend = pc.blend;
            ec.event_thread = config.event_thread;
            ec.poll_timeout = config.poll_timeout;
            ec.stop_grace = config.stop_grace;
            ec.logger = config.logger;
            return start_flip_engine(device, buffers, props, ec, sys);
        };

        primary_engine = start("primary", layout.primary_plane_id, config.primary);
        primary_engine->show_initial(std::move(blank));

        if (config.overlay) {
            overlay_engine = start(
                "overlay", layout.overlay_plane_id, *config.overlay
            );
        }
    }

  private:
    std::shared_ptr<log::logger> logger = presenter_logger();
    DisplayLayout display;
    std::unique_ptr<FlipEngine> primary_engine;
    std::unique_ptr<FlipEngine> overlay_engine;
    std::atomic<bool> closed = false;
};

}  // anonymous namespace

std::unique_ptr<DualPlanePresenter> open_dual_plane_presenter(
    std::shared_ptr<DisplayDevice> device,
    std::shared_ptr<BufferManager> buffers,
    DisplayLayout const& layout,
    DualPlaneConfig const& config,
    std::shared_ptr<UnixSystem> sys
) {
    CHECK_ARG(device && buffers, "Presenter needs device & buffers");
    CHECK_ARG(layout.crtc_id && layout.primary_plane_id, "Incomplete layout");
    CHECK_ARG(
        !config.overlay || layout.overlay_plane_id,
        "No overlay plane in layout for {}", layout.connector_name
    );
    auto presenter = std::make_unique<DualPlanePresenterDef>();
    presenter->open(
        std::move(device), std::move(buffers), layout, config, std::move(sys)
    );
    return presenter;
}

}  // namespace planeflip
