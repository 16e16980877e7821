#include "fake_drm.h"

#include <drm_fourcc.h>
#include <stdio.h>
#include <string.h>
#include <sys/sysmacros.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>

#include <fmt/core.h>

namespace planeflip {

namespace {

// Kernel side of the variable size array convention (see size_vec()).
template <typename Pointer, typename Count, typename Item>
void fill(Pointer ptr, Count* count, std::vector<Item> const& v) {
    if (ptr && *count >= v.size()) std::copy(v.begin(), v.end(), (Item*) ptr);
    *count = v.size();
}

std::vector<char> chars(std::string const& s) { return {s.begin(), s.end()}; }

class FakeDrmFd : public FileDescriptor {
  public:
    FakeDrmFd(std::shared_ptr<FakeDrm> drm) : drm(std::move(drm)) {}
    virtual int raw_fd() const final { return drm->raw_fd(); }
    virtual ErrnoOr<int> read(void* buf, size_t len) final {
        return drm->read(buf, len);
    }
    virtual ErrnoOr<int> ioctl(uint32_t nr, void* data) final {
        return drm->ioctl(nr, data);
    }
    virtual ErrnoOr<std::shared_ptr<void>> mmap(
        size_t len, int prot, int flags, off_t off
    ) final {
        return drm->mmap(len, prot, flags, off);
    }
    virtual ErrnoOr<int> poll(short mask, double timeout) final {
        return drm->poll(mask, timeout);
    }

  private:
    std::shared_ptr<FakeDrm> drm;
};

}  // anonymous namespace

bool FakeCommit::has(uint32_t obj, std::string const& name) const {
    auto const iter = values.find(obj);
    return iter != values.end() && iter->second.count(name);
}

uint64_t FakeCommit::value(uint32_t obj, std::string const& name) const {
    if (!has(obj, name))
        throw std::out_of_range(fmt::format("No #{} {} in commit", obj, name));
    return values.at(obj).at(name);
}

// Like the kernel, returns as many whole events as fit.
ErrnoOr<int> FakeDrm::read(void* buf, size_t len) {
    std::scoped_lock const lock{mutex};
    if (events.empty()) return {EAGAIN, -1};
    if (len < events.front().size()) return {EINVAL, -1};

    size_t used = 0;
    while (!events.empty() && used + events.front().size() <= len) {
        auto const& ev = events.front();
        memcpy((uint8_t*) buf + used, ev.data(), ev.size());
        used += ev.size();
        events.pop_front();
    }
    return {0, int(used)};
}

ErrnoOr<int> FakeDrm::poll(short mask, double timeout) {
    std::unique_lock lock{mutex};
    if (poll_stall) {
        ++stalled_polls;
        wakeup.notify_all();
        wakeup.wait(lock, [this] { return !poll_stall; });
        --stalled_polls;
    }
    if (poll_fail_count > 0) {
        --poll_fail_count;
        return {poll_fail_err, -1};
    }

    wakeup.wait_for(
        lock, std::chrono::duration<double>(timeout),
        [this] { return !events.empty(); }
    );
    return {0, events.empty() ? 0 : (mask & POLLIN)};
}

ErrnoOr<int> FakeDrm::ioctl(uint32_t nr, void* data) {
    switch (nr) {
        case DRM_IOCTL_SET_MASTER: return {};

        case DRM_IOCTL_SET_CLIENT_CAP: {
            std::scoped_lock const lock{mutex};
            auto const* cap = (drm_set_client_cap const*) data;
            if (cap->capability == DRM_CLIENT_CAP_ATOMIC && !atomic)
                return {EOPNOTSUPP, -1};
            return {};
        }

        case DRM_IOCTL_GET_CAP: {
            std::scoped_lock const lock{mutex};
            auto* cap = (drm_get_cap*) data;
            cap->value =
                (cap->capability == DRM_CAP_ASYNC_PAGE_FLIP) ? async_cap : 0;
            return {};
        }

        case DRM_IOCTL_VERSION: {
            auto* ver = (drm_version*) data;
            ver->version_major = 1;
            fill(ver->name, &ver->name_len, chars("fake"));
            fill(ver->date, &ver->date_len, chars("20260101"));
            fill(ver->desc, &ver->desc_len, chars("Fake DRM"));
            return {};
        }

        case DRM_IOCTL_GET_UNIQUE: {
            auto* uniq = (drm_unique*) data;
            fill(uniq->unique, &uniq->unique_len, chars("fake.0"));
            return {};
        }

        case DRM_IOCTL_MODE_GETRESOURCES: {
            std::scoped_lock const lock{mutex};
            auto* res = (drm_mode_card_res*) data;
            std::vector<uint32_t> fb_ids, conn_ids, enc_ids;
            for (auto const& fb : fbs) fb_ids.push_back(fb.first);
            for (auto const& conn : connectors) conn_ids.push_back(conn.id);
            for (auto const& enc : encoders) enc_ids.push_back(enc.first);
            fill(res->fb_id_ptr, &res->count_fbs, fb_ids);
            fill(res->crtc_id_ptr, &res->count_crtcs, crtcs);
            fill(res->connector_id_ptr, &res->count_connectors, conn_ids);
            fill(res->encoder_id_ptr, &res->count_encoders, enc_ids);
            res->max_width = res->max_height = 4096;
            return {};
        }

        case DRM_IOCTL_MODE_GETCONNECTOR:
            return get_connector((drm_mode_get_connector*) data);

        case DRM_IOCTL_MODE_GETENCODER: {
            std::scoped_lock const lock{mutex};
            auto* enc = (drm_mode_get_encoder*) data;
            auto const iter = encoders.find(enc->encoder_id);
            if (iter == encoders.end()) return {ENOENT, -1};
            enc->encoder_type = DRM_MODE_ENCODER_TMDS;
            enc->crtc_id = iter->second.crtc_id;
            enc->possible_crtcs = iter->second.possible_crtcs;
            return {};
        }

        case DRM_IOCTL_MODE_GETPLANERESOURCES: {
            std::scoped_lock const lock{mutex};
            auto* res = (drm_mode_get_plane_res*) data;
            std::vector<uint32_t> ids;
            for (auto const& plane : planes) ids.push_back(plane.first);
            fill(res->plane_id_ptr, &res->count_planes, ids);
            return {};
        }

        case DRM_IOCTL_MODE_GETPLANE: {
            std::scoped_lock const lock{mutex};
            auto* pdat = (drm_mode_get_plane*) data;
            auto const iter = planes.find(pdat->plane_id);
            if (iter == planes.end()) return {ENOENT, -1};
            auto& props = objects[pdat->plane_id];
            pdat->crtc_id = props[prop_id_locked("CRTC_ID")];
            pdat->fb_id = props[prop_id_locked("FB_ID")];
            pdat->possible_crtcs = iter->second.possible_crtcs;
            fill(
                pdat->format_type_ptr, &pdat->count_format_types,
                iter->second.formats
            );
            return {};
        }

        case DRM_IOCTL_MODE_OBJ_GETPROPERTIES: {
            std::scoped_lock const lock{mutex};
            auto* odat = (drm_mode_obj_get_properties*) data;
            auto const iter = objects.find(odat->obj_id);
            if (iter == objects.end()) return {ENOENT, -1};
            std::vector<uint32_t> ids;
            std::vector<uint64_t> values;
            for (auto const& prop : iter->second) {
                ids.push_back(prop.first);
                values.push_back(prop.second);
            }
            auto count = odat->count_props;
            fill(odat->props_ptr, &count, ids);
            fill(odat->prop_values_ptr, &odat->count_props, values);
            return {};
        }

        case DRM_IOCTL_MODE_GETPROPERTY: {
            std::scoped_lock const lock{mutex};
            auto* pdat = (drm_mode_get_property*) data;
            auto const iter = prop_names.find(pdat->prop_id);
            if (iter == prop_names.end()) return {ENOENT, -1};
            strncpy(pdat->name, iter->second.c_str(), sizeof(pdat->name) - 1);
            return {};
        }

        case DRM_IOCTL_PRIME_FD_TO_HANDLE: {
            std::scoped_lock const lock{mutex};
            auto* hdat = (drm_prime_handle*) data;
            if (hdat->fd < 0) return {EBADF, -1};
            if (fail_import) return {EINVAL, -1};
            hdat->handle = next_handle++;
            handles.insert(hdat->handle);
            return {};
        }

        case DRM_IOCTL_GEM_CLOSE: {
            std::scoped_lock const lock{mutex};
            auto const* cdat = (drm_gem_close const*) data;
            if (!handles.erase(cdat->handle)) return {ENOENT, -1};
            return {};
        }

        case DRM_IOCTL_MODE_ADDFB2: {
            std::scoped_lock const lock{mutex};
            auto* fdat = (drm_mode_fb_cmd2*) data;
            if (fail_addfb || !fdat->width || !fdat->height) return {EINVAL, -1};
            if (!handles.count(fdat->handles[0])) return {ENOENT, -1};
            fdat->fb_id = next_fb++;
            fbs[fdat->fb_id] = fdat->pixel_format;
            return {};
        }

        case DRM_IOCTL_MODE_RMFB: {
            std::scoped_lock const lock{mutex};
            auto const* id = (uint32_t const*) data;
            if (!fbs.erase(*id)) return {ENOENT, -1};
            ++fbs_removed;
            return {};
        }

        case DRM_IOCTL_MODE_ATOMIC:
            return atomic_commit(*(drm_mode_atomic const*) data);

        case DRM_IOCTL_MODE_SETPLANE: {
            std::scoped_lock const lock{mutex};
            auto const* sp = (drm_mode_set_plane const*) data;
            if (fail_count > 0) {
                --fail_count;
                return {fail_err, -1};
            }
            if (!planes.count(sp->plane_id)) return {ENOENT, -1};
            if (sp->fb_id && !fbs.count(sp->fb_id)) return {ENOENT, -1};
            auto& props = objects[sp->plane_id];
            props[prop_id_locked("FB_ID")] = sp->fb_id;
            props[prop_id_locked("CRTC_ID")] = sp->fb_id ? sp->crtc_id : 0;
            set_plane_log.push_back(*sp);
            return {};
        }

        case DRM_IOCTL_MODE_SETCRTC:
            return set_crtc(*(drm_mode_crtc const*) data);
    }

    return {ENOTTY, -1};
}

ErrnoOr<int> FakeDrm::get_connector(drm_mode_get_connector* cdat) {
    std::scoped_lock const lock{mutex};
    auto const iter = std::find_if(
        connectors.begin(), connectors.end(),
        [&](auto const& c) { return c.id == cdat->connector_id; }
    );
    if (iter == connectors.end()) return {ENOENT, -1};
    fill(cdat->modes_ptr, &cdat->count_modes, iter->modes);
    fill(cdat->encoders_ptr, &cdat->count_encoders, iter->encoder_ids);
    cdat->count_props = 0;
    cdat->encoder_id = iter->encoder_id;
    cdat->connector_type = iter->type;
    cdat->connector_type_id = iter->type_id;
    cdat->connection = iter->connected ? 1 : 2;
    return {};
}

ErrnoOr<int> FakeDrm::set_crtc(drm_mode_crtc const& cdat) {
    std::scoped_lock const lock{mutex};
    if (std::find(crtcs.begin(), crtcs.end(), cdat.crtc_id) == crtcs.end())
        return {ENOENT, -1};
    if (cdat.fb_id && !fbs.count(cdat.fb_id)) return {ENOENT, -1};

    FakeModeSet set = {};
    set.crtc_id = cdat.crtc_id;
    set.fb_id = cdat.fb_id;
    auto const* conns = (uint32_t const*) cdat.set_connectors_ptr;
    set.connector_ids.assign(conns, conns + cdat.count_connectors);
    if (cdat.mode_valid) set.mode = cdat.mode;
    mode_set_log.push_back(set);
    return {};
}

ErrnoOr<int> FakeDrm::atomic_commit(drm_mode_atomic const& a) {
    std::scoped_lock const lock{mutex};
    if (!atomic) return {EINVAL, -1};
    if (fail_count > 0) {
        --fail_count;
        return {fail_err, -1};
    }
    if ((a.flags & DRM_MODE_PAGE_FLIP_ASYNC) && (reject_async || !async_cap))
        return {EINVAL, -1};

    auto const* objs = (uint32_t const*) a.objs_ptr;
    auto const* counts = (uint32_t const*) a.count_props_ptr;
    auto const* props = (uint32_t const*) a.props_ptr;
    auto const* values = (uint64_t const*) a.prop_values_ptr;

    FakeCommit commit = {};
    commit.flags = a.flags;
    commit.user_data = a.user_data;
    std::vector<std::pair<uint64_t*, uint64_t>> updates;
    uint32_t event_crtc = 0;
    for (uint32_t o = 0, p = 0; o < a.count_objs; ++o) {
        auto const obj_iter = objects.find(objs[o]);
        if (obj_iter == objects.end()) return {ENOENT, -1};
        for (uint32_t end = p + counts[o]; p < end; ++p) {
            auto const prop_iter = obj_iter->second.find(props[p]);
            if (prop_iter == obj_iter->second.end()) return {EINVAL, -1};
            auto const& name = prop_names.at(props[p]);
            if (name == "FB_ID" && values[p] && !fbs.count(values[p]))
                return {EINVAL, -1};
            if (name == "CRTC_ID" && values[p]) event_crtc = values[p];
            commit.values[objs[o]][name] = values[p];
            updates.push_back({&prop_iter->second, values[p]});
        }
    }

    bool const event = a.flags & DRM_MODE_PAGE_FLIP_EVENT;
    if (event) {
        for (auto const& flip : pending) {
            if (flip.first == a.user_data) return {EBUSY, -1};
        }
    }

    for (auto const& update : updates) *update.first = update.second;
    commit_log.push_back(std::move(commit));
    if (event) {
        pending.push_back({a.user_data, event_crtc});
        int same = 0;
        for (auto const& flip : pending) same += (flip.first == a.user_data);
        max_pending = std::max(max_pending, same);
        if (auto_flip) {
            pending.pop_back();
            queue_event_locked(a.user_data, event_crtc);
        }
    }
    return {};
}

uint32_t FakeDrm::prop_id(std::string const& name) {
    std::scoped_lock const lock{mutex};
    return prop_id_locked(name);
}

uint32_t FakeDrm::prop_id_locked(std::string const& name) {
    auto const iter = prop_ids.find(name);
    if (iter != prop_ids.end()) return iter->second;
    uint32_t const id = 100 + prop_ids.size();
    prop_ids[name] = id;
    prop_names[id] = name;
    return id;
}

void FakeDrm::set_property(uint32_t obj, std::string const& name, uint64_t v) {
    std::scoped_lock const lock{mutex};
    objects[obj][prop_id_locked(name)] = v;
}

void FakeDrm::remove_property(uint32_t obj, std::string const& name) {
    std::scoped_lock const lock{mutex};
    objects[obj].erase(prop_id_locked(name));
}

void FakeDrm::add_crtc(uint32_t id) {
    set_property(id, "ACTIVE", 0);
    set_property(id, "MODE_ID", 0);
    std::scoped_lock const lock{mutex};
    crtcs.push_back(id);
}

void FakeDrm::add_encoder(uint32_t id, uint32_t crtc_id, uint32_t possible) {
    std::scoped_lock const lock{mutex};
    encoders[id] = {crtc_id, possible};
}

void FakeDrm::add_connector(FakeConnector const& conn) {
    set_property(conn.id, "CRTC_ID", 0);
    std::scoped_lock const lock{mutex};
    connectors.push_back(conn);
}

void FakeDrm::add_plane(
    uint32_t id, uint64_t type, uint32_t possible_crtcs,
    std::vector<uint32_t> const& formats, bool blend_props
) {
    set_property(id, "type", type);
    for (auto const* name : {
        "FB_ID", "CRTC_ID", "CRTC_X", "CRTC_Y", "CRTC_W", "CRTC_H",
        "SRC_X", "SRC_Y", "SRC_W", "SRC_H",
    }) {
        set_property(id, name, 0);
    }

    if (blend_props) {
        set_property(id, "pixel blend mode", 1);
        set_property(id, "alpha", 0xFFFF);
        set_property(id, "zpos", 1);
    }

    std::scoped_lock const lock{mutex};
    planes[id] = {possible_crtcs, formats};
}

void FakeDrm::set_atomic(bool v) { std::scoped_lock const l{mutex}; atomic = v; }
void FakeDrm::set_async_cap(bool v) { std::scoped_lock const l{mutex}; async_cap = v; }
void FakeDrm::set_auto_flip(bool v) { std::scoped_lock const l{mutex}; auto_flip = v; }
void FakeDrm::set_reject_async(bool v) { std::scoped_lock const l{mutex}; reject_async = v; }
void FakeDrm::set_fail_import(bool v) { std::scoped_lock const l{mutex}; fail_import = v; }
void FakeDrm::set_fail_addfb(bool v) { std::scoped_lock const l{mutex}; fail_addfb = v; }

void FakeDrm::fail_polls(int count, int err) {
    std::scoped_lock const lock{mutex};
    poll_fail_count = count;
    poll_fail_err = err;
}

void FakeDrm::set_poll_stall(bool v) {
    std::scoped_lock const lock{mutex};
    poll_stall = v;
    wakeup.notify_all();
}

bool FakeDrm::wait_for_stalled_polls(int count, double timeout) {
    std::unique_lock lock{mutex};
    return wakeup.wait_for(
        lock, std::chrono::duration<double>(timeout),
        [&] { return stalled_polls >= count; }
    );
}

void FakeDrm::fail_commits(int count, int err) {
    std::scoped_lock const lock{mutex};
    fail_count = count;
    fail_err = err;
}

bool FakeDrm::complete_flip() {
    std::scoped_lock const lock{mutex};
    if (pending.empty()) return false;
    auto const flip = pending.front();
    pending.pop_front();
    queue_event_locked(flip.first, flip.second);
    return true;
}

int FakeDrm::complete_all_flips() {
    int count = 0;
    while (complete_flip()) ++count;
    return count;
}

void FakeDrm::queue_flip_event(uint64_t user_data, uint32_t crtc_id) {
    std::scoped_lock const lock{mutex};
    queue_event_locked(user_data, crtc_id);
}

void FakeDrm::queue_event_locked(uint64_t user_data, uint32_t crtc_id) {
    timespec ts = {};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    drm_event_vblank ev = {};
    ev.base.type = DRM_EVENT_FLIP_COMPLETE;
    ev.base.length = sizeof(ev);
    ev.user_data = user_data;
    ev.tv_sec = ts.tv_sec;
    ev.tv_usec = ts.tv_nsec / 1000;
    ev.sequence = ++sequence;
    ev.crtc_id = crtc_id;
    auto const* bytes = (uint8_t const*) &ev;
    events.emplace_back(bytes, bytes + sizeof(ev));
    wakeup.notify_all();
}

void FakeDrm::queue_raw_event(uint32_t type, uint32_t length) {
    std::scoped_lock const lock{mutex};
    if (length < sizeof(drm_event))
        throw std::invalid_argument(fmt::format("Event length {} too short", length));
    drm_event const header = {.type = type, .length = length};
    std::vector<uint8_t> ev(length, 0);
    memcpy(ev.data(), &header, sizeof(header));
    events.push_back(std::move(ev));
    wakeup.notify_all();
}

std::vector<FakeCommit> FakeDrm::commits() const {
    std::scoped_lock const lock{mutex};
    return commit_log;
}

std::vector<drm_mode_set_plane> FakeDrm::set_planes() const {
    std::scoped_lock const lock{mutex};
    return set_plane_log;
}

std::vector<FakeModeSet> FakeDrm::mode_sets() const {
    std::scoped_lock const lock{mutex};
    return mode_set_log;
}

uint64_t FakeDrm::property(uint32_t obj, std::string const& name) const {
    std::scoped_lock const lock{mutex};
    return objects.at(obj).at(prop_ids.at(name));
}

int FakeDrm::pending_flips() const {
    std::scoped_lock const lock{mutex};
    return pending.size();
}

int FakeDrm::max_pending_flips() const {
    std::scoped_lock const lock{mutex};
    return max_pending;
}

size_t FakeDrm::framebuffer_count() const {
    std::scoped_lock const lock{mutex};
    return fbs.size();
}

size_t FakeDrm::framebuffers_removed() const {
    std::scoped_lock const lock{mutex};
    return fbs_removed;
}

size_t FakeDrm::handle_count() const {
    std::scoped_lock const lock{mutex};
    return handles.size();
}

size_t FakeDrm::queued_events() const {
    std::scoped_lock const lock{mutex};
    return events.size();
}

void FakeSystem::add_device(std::string const& path, std::shared_ptr<FakeDrm> d) {
    devices[path] = std::move(d);
}

double FakeSystem::clock(clockid_t id) const {
    return global_system()->clock(id);
}

std::unique_ptr<SyncFlag> FakeSystem::make_flag(clockid_t id) const {
    return global_system()->make_flag(id);
}

ErrnoOr<struct stat> FakeSystem::stat(std::string const& path) const {
    auto const iter = devices.find(path);
    if (iter == devices.end()) return {ENOENT, {}};
    ErrnoOr<struct stat> ret;
    ret.value.st_mode = S_IFCHR | 0660;
    ret.value.st_rdev = makedev(226, std::distance(devices.begin(), iter));
    return ret;
}

ErrnoOr<std::string> FakeSystem::realpath(std::string const&) const {
    return {ENOENT, {}};
}

ErrnoOr<std::vector<std::string>> FakeSystem::ls(std::string const& dir) const {
    ErrnoOr<std::vector<std::string>> ret;
    auto const prefix = dir + "/";
    for (auto const& dev : devices) {
        if (dev.first.substr(0, prefix.size()) == prefix)
            ret.value.push_back(dev.first.substr(prefix.size()));
    }
    if (ret.value.empty()) ret.err = ENOENT;
    return ret;
}

ErrnoOr<std::unique_ptr<FileDescriptor>> FakeSystem::open(
    std::string const& path, int, mode_t
) {
    auto const iter = devices.find(path);
    if (iter == devices.end()) return {ENOENT, {}};
    return {0, std::make_unique<FakeDrmFd>(iter->second)};
}

std::unique_ptr<FileDescriptor> FakeSystem::adopt(int raw_fd) {
    return global_system()->adopt(raw_fd);
}

std::unique_ptr<DmaMemory> FakeAllocator::allocate(size_t size) {
    if (fail) throw std::runtime_error("Fake allocation failure");
    ++allocations;
    return std::make_unique<FakeMemory>(next_fd++, size);
}

drm_mode_modeinfo fake_mode(int width, int height, int hz, bool preferred) {
    drm_mode_modeinfo mode = {};
    mode.hdisplay = width;
    mode.hsync_start = width + 88;
    mode.hsync_end = width + 132;
    mode.htotal = width + 280;
    mode.vdisplay = height;
    mode.vsync_start = height + 4;
    mode.vsync_end = height + 9;
    mode.vtotal = height + 45;
    mode.clock = mode.htotal * mode.vtotal * hz / 1000;
    mode.vrefresh = hz;
    mode.type = DRM_MODE_TYPE_DRIVER | (preferred ? DRM_MODE_TYPE_PREFERRED : 0);
    snprintf(mode.name, sizeof(mode.name), "%dx%d", width, height);
    return mode;
}

void setup_basic_display(FakeDrm* drm) {
    using namespace basic_display;
    drm->add_crtc(crtc);
    drm->add_encoder(encoder, crtc, 0x1);

    FakeConnector conn = {};
    conn.id = connector;
    conn.encoder_id = encoder;
    conn.encoder_ids = {encoder};
    conn.modes = {fake_mode(1920, 1080, 60, true), fake_mode(1280, 720, 60, false)};
    drm->add_connector(conn);

    drm->add_plane(
        primary, 1, 0x1, {DRM_FORMAT_XRGB8888, DRM_FORMAT_ARGB8888}
    );
    drm->add_plane(
        overlay, 0, 0x1,
        {DRM_FORMAT_NV12, DRM_FORMAT_ARGB8888, DRM_FORMAT_XRGB8888}, true
    );
    drm->add_plane(cursor, 2, 0x1, {DRM_FORMAT_ARGB8888});
}

FakeRig::FakeRig() {
    setup_basic_display(drm.get());
    sys->add_device("/dev/dri/card0", drm);
    device = open_display_device(sys, "/dev/dri/card0");
    buffers = make_buffer_manager(device, allocator);
}

}  // namespace planeflip
