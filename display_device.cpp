#include "display_device.h"

#include <drm/drm.h>
#include <string.h>
#include <sys/sysmacros.h>

#include <cctype>
#include <mutex>

#include <fmt/core.h>

#include "logging_policy.h"

namespace planeflip {

namespace {

auto const& device_logger() {
    static const auto logger = make_logger("device");
    return logger;
}

class DisplayDeviceDef : public DisplayDevice {
  public:
    virtual std::string const& dev_file() const final { return dev; }
    virtual std::shared_ptr<FileDescriptor> const& fd() const final {
        return drm_fd;
    }
    virtual DisplayCaps caps() const final { return device_caps; }

    virtual std::map<std::string, ObjectProperty> object_properties(
        uint32_t obj_id
    ) final {
        std::vector<uint32_t> prop_ids;
        std::vector<uint64_t> values;
        drm_mode_obj_get_properties odat = {};
        odat.obj_id = obj_id;
        do {
            drm_fd->ioc<DRM_IOCTL_MODE_OBJ_GETPROPERTIES>(&odat).ex(
                fmt::format("DRM object #{} properties", obj_id)
            );
        } while (
            size_vec(&odat.props_ptr, &odat.count_props, &prop_ids) +
            size_vec(&odat.prop_values_ptr, &odat.count_props, &values)
        );

        CHECK_RUNTIME(
            prop_ids.size() == values.size(),
            "Property list length mismatch (#{})", obj_id
        );

        std::map<std::string, ObjectProperty> out;
        std::scoped_lock const lock{names_mutex};
        for (size_t i = 0; i < prop_ids.size(); ++i) {
            auto const prop_id = prop_ids[i];
            auto id_name_iter = prop_names.find(prop_id);
            if (id_name_iter == prop_names.end()) {
                drm_mode_get_property pdat = {};
                pdat.prop_id = prop_id;
                drm_fd->ioc<DRM_IOCTL_MODE_GETPROPERTY>(&pdat).ex("Property");
                pdat.name[sizeof(pdat.name) - 1] = '\0';
                id_name_iter = prop_names.insert({prop_id, pdat.name}).first;
            }
            out[id_name_iter->second] = {prop_id, values[i]};
        }
        return out;
    }

    virtual uint64_t add_flip_handler(FlipHandler handler) final {
        CHECK_ARG(handler, "Empty flip handler");
        std::scoped_lock const lock{dispatch_mutex};
        auto const cookie = next_cookie++;
        handlers[cookie] = std::move(handler);
        TRACE(logger, "Added flip handler u{}", cookie);
        return cookie;
    }

    virtual void remove_flip_handler(uint64_t cookie) final {
        std::scoped_lock const lock{dispatch_mutex};
        handlers.erase(cookie);
        TRACE(logger, "Removed flip handler u{}", cookie);
    }

    virtual int dispatch_events() final {
        std::scoped_lock const lock{dispatch_mutex};
        int handled = 0;
        for (;;) {
            auto const ret = drm_fd->read(event_buf, sizeof(event_buf));
            if (ret.err == EAGAIN) break;

            size_t const len = ret.ex("Read DRM events");
            if (len == 0) break;

            // A read returns whole events, each led by a drm_event header.
            size_t pos = 0;
            while (pos + sizeof(drm_event) <= len) {
                drm_event header;
                memcpy(&header, event_buf + pos, sizeof(header));
                CHECK_RUNTIME(
                    header.length >= sizeof(drm_event) &&
                        pos + header.length <= len,
                    "Bad DRM event length {} at {}/{}", header.length, pos, len
                );

                if (
                    header.type == DRM_EVENT_FLIP_COMPLETE &&
                    header.length >= sizeof(drm_event_vblank)
                ) {
                    drm_event_vblank ev;
                    memcpy(&ev, event_buf + pos, sizeof(ev));
                    if (dispatch_flip(ev)) ++handled;
                } else {
                    TRACE(
                        logger, "Skipped DRM event type {} ({}b)",
                        header.type, header.length
                    );
                }
                pos += header.length;
            }
        }
        return handled;
    }

    void open(std::shared_ptr<UnixSystem> sys, std::string const& dev_file) {
        logger->info("Opening display \"{}\"...", dev_file);
        dev = dev_file;
        drm_fd = sys->open(dev, O_RDWR | O_NONBLOCK | O_CLOEXEC).ex(dev);
        try {
            drm_fd->ioc<DRM_IOCTL_SET_MASTER>().ex("DRM master mode");
        } catch (std::system_error const& e) {
            logger->error("{}", e.what());
            // Continue, though modesetting will probably fail later
        }

        drm_fd->ioc<DRM_IOCTL_SET_CLIENT_CAP>(
            drm_set_client_cap{DRM_CLIENT_CAP_UNIVERSAL_PLANES, 1}
        ).ex("Enable DRM universal planes");

        auto const atomic = drm_fd->ioc<DRM_IOCTL_SET_CLIENT_CAP>(
            drm_set_client_cap{DRM_CLIENT_CAP_ATOMIC, 1}
        );
        device_caps.atomic = !atomic.err;
        if (atomic.err) {
            logger->warn(
                "No DRM atomic modesetting ({}), legacy only",
                strerror(atomic.err)
            );
        }

        drm_get_cap cap = {DRM_CAP_ASYNC_PAGE_FLIP, 0};
        auto const async = drm_fd->ioc<DRM_IOCTL_GET_CAP>(&cap);
        device_caps.async_page_flip = !async.err && cap.value;
        DEBUG(logger, "  opened fd={}: {}", drm_fd->raw_fd(), debug(device_caps));
    }

  private:
    // Constant from open() to ~
    std::shared_ptr<log::logger> const logger = device_logger();
    std::string dev;
    std::shared_ptr<FileDescriptor> drm_fd;
    DisplayCaps device_caps = {};

    std::mutex names_mutex;  // Guards prop_names
    std::map<uint32_t, std::string> prop_names;

    std::mutex dispatch_mutex;  // Guards handlers and event reading
    std::map<uint64_t, FlipHandler> handlers;
    uint64_t next_cookie = 1;
    alignas(drm_event_vblank) uint8_t event_buf[4096];

    // Called with dispatch_mutex held.
    bool dispatch_flip(drm_event_vblank const& ev) {
        FlipEvent const flip = {
            .user_data = ev.user_data,
            .crtc_id = ev.crtc_id,
            .sequence = ev.sequence,
            .time = ev.tv_sec + 1e-6 * ev.tv_usec,
        };

        auto const iter = handlers.find(flip.user_data);
        if (iter == handlers.end()) {
            DEBUG(logger, "Unclaimed flip u{}", flip.user_data);
            return false;
        }

        TRACE(
            logger, "Flip u{} crtc{} seq={} (m{:.3f})",
            flip.user_data, flip.crtc_id, flip.sequence, flip.time
        );
        iter->second(flip);
        return true;
    }
};

}  // anonymous namespace

std::vector<DisplayDeviceListing> list_display_devices(
    std::shared_ptr<UnixSystem> const& sys
) {
    std::vector<DisplayDeviceListing> out;
    std::string const dri_dir = "/dev/dri";
    for (auto const& fname : sys->ls(dri_dir).ex(dri_dir)) {
        if (fname.substr(0, 4) != "card" || !isdigit(fname[4])) continue;

        DisplayDeviceListing listing;
        listing.dev_file = fmt::format("{}/{}", dri_dir, fname);

        struct stat fstat = sys->stat(listing.dev_file).ex(listing.dev_file);
        CHECK_RUNTIME(
            (fstat.st_mode & S_IFMT) == S_IFCHR,
            "Not a character device node: {}", listing.dev_file
        );

        std::unique_ptr<FileDescriptor> fd;
        try {
            fd = sys->open(listing.dev_file, O_RDWR).ex(listing.dev_file);
        } catch (std::runtime_error const& e) {  // Skip but log on open error
            device_logger()->error("{}", e.what());
            continue;
        }

        drm_mode_card_res res = {};
        auto const res_ret = fd->ioc<DRM_IOCTL_MODE_GETRESOURCES>(&res);
        if (res_ret.err == ENOTSUP || res_ret.err == EOPNOTSUPP) continue;
        res_ret.ex("DRM resources");

        auto const maj = major(fstat.st_rdev), min = minor(fstat.st_rdev);
        auto const dev_link = fmt::format("/sys/dev/char/{}:{}", maj, min);
        auto const sys_path = sys->realpath(dev_link);
        if (!sys_path.err) {
            listing.system_path = (sys_path.value.substr(0, 13) == "/sys/devices/")
                ? sys_path.value.substr(13) : sys_path.value;
        }

        std::vector<char> name, date, desc;
        drm_version ver = {};
        do {
            fd->ioc<DRM_IOCTL_VERSION>(&ver).ex("Get version");
        } while (
            size_vec(&ver.name, &ver.name_len, &name) +
            size_vec(&ver.date, &ver.date_len, &date) +
            size_vec(&ver.desc, &ver.desc_len, &desc)
        );
        listing.driver.assign(name.begin(), name.end());
        listing.driver_desc.assign(desc.begin(), desc.end());

        std::vector<char> bus_id;
        drm_unique uniq = {};
        do {
            fd->ioc<DRM_IOCTL_GET_UNIQUE>(&uniq).ex("Get unique");
        } while (size_vec(&uniq.unique, &uniq.unique_len, &bus_id));
        listing.driver_bus_id.assign(bus_id.begin(), bus_id.end());
        out.push_back(std::move(listing));
    }

    return out;
}

std::shared_ptr<DisplayDevice> open_display_device(
    std::shared_ptr<UnixSystem> sys, std::string const& dev_file
) {
    auto device = std::make_shared<DisplayDeviceDef>();
    device->open(std::move(sys), dev_file);
    return device;
}

std::string debug(DisplayDeviceListing const& d) {
    return fmt::format(
        "{} ({}): {}{}",
        d.dev_file, d.driver, d.system_path,
        d.driver_bus_id.empty() ? "" : fmt::format(" ({})", d.driver_bus_id)
    );
}

std::string debug(DisplayCaps const& caps) {
    return fmt::format(
        "{} {}",
        caps.atomic ? "atomic" : "legacy-only",
        caps.async_page_flip ? "async-flip" : "vblank-flip"
    );
}

}  // namespace planeflip
