#include "atomic_request.h"

#include <drm/drm.h>

#include <vector>

#include <fmt/core.h>

#include "logging_policy.h"

namespace planeflip {

namespace {

auto const& atomic_logger() {
    static const auto logger = make_logger("atomic");
    return logger;
}

}  // anonymous namespace

bool AtomicRequest::add(uint32_t obj_id, uint32_t prop_id, uint64_t value) {
    if (!obj_id || !prop_id) return false;
    props[obj_id][prop_id] = value;
    return true;
}

size_t AtomicRequest::size() const {
    size_t total = 0;
    for (auto const& obj_props : props) total += obj_props.second.size();
    return total;
}

ErrnoOr<int> AtomicRequest::commit(
    FileDescriptor* fd, uint32_t flags, uint64_t user_data
) const {
    auto const& logger = atomic_logger();
    std::vector<uint32_t> obj_ids;
    std::vector<uint32_t> obj_prop_counts;
    std::vector<uint32_t> prop_ids;
    std::vector<uint64_t> prop_values;
    for (auto const& obj_props : props) {
        obj_ids.push_back(obj_props.first);
        obj_prop_counts.push_back(obj_props.second.size());
        for (auto const& prop_value : obj_props.second) {
            TRACE(
                logger, "  #{} p{} = {}",
                obj_props.first, prop_value.first, prop_value.second
            );
            prop_ids.push_back(prop_value.first);
            prop_values.push_back(prop_value.second);
        }
    }

    drm_mode_atomic atomic = {
        .flags = flags,
        .count_objs = (uint32_t) obj_ids.size(),
        .objs_ptr = (uint64_t) obj_ids.data(),
        .count_props_ptr = (uint64_t) obj_prop_counts.data(),
        .props_ptr = (uint64_t) prop_ids.data(),
        .prop_values_ptr = (uint64_t) prop_values.data(),
        .reserved = 0,
        .user_data = user_data,
    };

    TRACE(logger, "Commit u{} {}", user_data, debug_atomic_flags(flags));
    return fd->ioc<DRM_IOCTL_MODE_ATOMIC>(&atomic);
}

std::string debug_atomic_flags(uint32_t flags) {
    std::string out;
    auto const flag = [&](uint32_t bit, char const* name) {
        if (!(flags & bit)) return;
        if (!out.empty()) out += "|";
        out += name;
        flags &= ~bit;
    };

    flag(DRM_MODE_PAGE_FLIP_EVENT, "EVENT");
    flag(DRM_MODE_PAGE_FLIP_ASYNC, "ASYNC");
    flag(DRM_MODE_ATOMIC_TEST_ONLY, "TEST_ONLY");
    flag(DRM_MODE_ATOMIC_NONBLOCK, "NONBLOCK");
    flag(DRM_MODE_ATOMIC_ALLOW_MODESET, "ALLOW_MODESET");
    if (flags) out += fmt::format("{}0x{:x}", out.empty() ? "" : "|", flags);
    return out.empty() ? "blocking" : out;
}

}  // namespace planeflip
