// Access to a DRM/KMS display device, shared by the plane flip engines.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "unix_system.h"

namespace planeflip {

// Optional kernel features, checked when the device is opened.
struct DisplayCaps {
    bool atomic = false;           // DRM_CLIENT_CAP_ATOMIC was accepted
    bool async_page_flip = false;  // DRM_CAP_ASYNC_PAGE_FLIP is set
};

// A page flip completion, decoded from a kernel DRM_EVENT_FLIP_COMPLETE.
struct FlipEvent {
    uint64_t user_data = 0;  // Cookie given with the commit
    uint32_t crtc_id = 0;
    uint32_t sequence = 0;   // Vblank counter
    double time = 0.0;       // CLOCK_MONOTONIC time of the flip
};

// A property attached to a KMS object (plane, CRTC, connector).
struct ObjectProperty {
    uint32_t prop_id = 0;
    uint64_t value = 0;  // Value when queried
};

// Called (on whichever thread runs dispatch_events()) for each flip event.
using FlipHandler = std::function<void(FlipEvent const&)>;

// Interface to an opened GPU device. Returned by open_display_device().
// *Internally synchronized* for multithreaded access.
class DisplayDevice {
  public:
    virtual ~DisplayDevice() = default;

    virtual std::string const& dev_file() const = 0;
    virtual std::shared_ptr<FileDescriptor> const& fd() const = 0;
    virtual DisplayCaps caps() const = 0;

    // Returns all properties of a KMS object, by property name.
    virtual std::map<std::string, ObjectProperty> object_properties(
        uint32_t obj_id
    ) = 0;

    // Registers a handler for flip events whose user data matches the
    // returned (nonzero) cookie. The handler may be called at any time
    // from any thread that calls dispatch_events().
    virtual uint64_t add_flip_handler(FlipHandler) = 0;

    // Unregisters a handler, waiting for any running call to finish.
    virtual void remove_flip_handler(uint64_t cookie) = 0;

    // Reads all pending kernel events without blocking, and calls the
    // matching handlers. Returns the number of flip events handled.
    virtual int dispatch_events() = 0;
};

// Description of a GPU device. Returned by list_display_devices().
struct DisplayDeviceListing {
    std::string dev_file;       // Like "/dev/dri/card0"
    std::string system_path;    // Like "platform/gpu/drm/card0" (more stable)
    std::string driver;         // Like "vc4" or "i915"
    std::string driver_desc;    // Like "Broadcom VC4 graphics"
    std::string driver_bus_id;  // Like "fec00000.v3d" (PCI address, etc)
    auto operator<=>(DisplayDeviceListing const&) const = default;
};

// Lists KMS-capable GPU devices present on the system.
std::vector<DisplayDeviceListing> list_display_devices(
    std::shared_ptr<UnixSystem> const& sys
);

// Opens a GPU device, given dev_file from DisplayDeviceListing.
// Universal planes are required; atomic modesetting is optional (see caps()).
std::shared_ptr<DisplayDevice> open_display_device(
    std::shared_ptr<UnixSystem> sys, std::string const& dev_file
);

// Support KMS/DRM ioctl conventions for variable size arrays;
// returns true if the ioctl needs to be re-submitted with a resized array.
template <typename Pointer, typename Count, typename Item>
bool size_vec(Pointer* ptr, Count* count, std::vector<Item>* v) {
    if (*count == v->size() && *ptr == (Pointer) v->data()) return false;
    v->resize(*count);
    *ptr = (Pointer) v->data();
    return true;
}

std::string debug(DisplayDeviceListing const&);
std::string debug(DisplayCaps const&);

}  // namespace planeflip
