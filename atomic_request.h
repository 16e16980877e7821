// Builder for DRM atomic modesetting commits (DRM_IOCTL_MODE_ATOMIC).

#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "unix_system.h"

namespace planeflip {

// Accumulates (object, property, value) triples for one atomic commit.
class AtomicRequest {
  public:
    // Sets a property value. Returns false (adding nothing) if either id
    // is zero, which usually means the property was never resolved.
    [[nodiscard]] bool add(uint32_t obj_id, uint32_t prop_id, uint64_t value);

    bool empty() const { return props.empty(); }
    size_t size() const;

    // Issues the commit with DRM_MODE_* flags; the user data comes back in
    // any completion event. Returns the kernel result (does not throw).
    ErrnoOr<int> commit(
        FileDescriptor*, uint32_t flags, uint64_t user_data = 0
    ) const;

  private:
    std::map<uint32_t, std::map<uint32_t, uint64_t>> props;
};

std::string debug_atomic_flags(uint32_t flags);

}  // namespace planeflip
