#include "runbox/filesystem.hpp"
#include <errno.h>
#include <fcntl.h>
#include <glog/logging.h>
#include <stdlib.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include "runbox/common/exceptions.hpp"
#include "runbox/common/utils.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

const vector<fs::path> sandbox_devices = {"/dev/null", "/dev/zero", "/dev/random", "/dev/urandom"};

void linux_mount_ops::mount_tmpfs(const fs::path &target, const string &options) {
    if (mount("tmpfs", target.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, options.c_str()) < 0)
        system_failure(errno, "unable to mount tmpfs on '{}'", target);
}

void linux_mount_ops::bind(const fs::path &source, const fs::path &target) {
    if (mount(source.c_str(), target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) < 0)
        system_failure(errno, "unable to bind '{}' to '{}'", source, target);
}

static void remount_single_readonly(const fs::path &target) {
    // The locked flags of the original mount must be kept, or the kernel rejects
    // the remount inside a user namespace.
    struct statvfs st;
    if (statvfs(target.c_str(), &st) < 0)
        system_failure(errno, "unable to statvfs '{}'", target);

    unsigned long flags = MS_REMOUNT | MS_BIND | MS_RDONLY;
    if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (st.f_flag & ST_NOATIME) flags |= MS_NOATIME;
    if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (st.f_flag & ST_RELATIME) flags |= MS_RELATIME;

    if (mount(nullptr, target.c_str(), nullptr, flags, nullptr) < 0)
        system_failure(errno, "unable to remount '{}' read-only", target);
}

/**
 * @brief 解码 mountinfo 中的八进制转义，比如 \040 表示空格
 */
static string unescape_mountinfo(const string &field) {
    string result;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() && isdigit((unsigned char)field[i + 1]) &&
            isdigit((unsigned char)field[i + 2]) && isdigit((unsigned char)field[i + 3])) {
            result += (char)stoi(field.substr(i + 1, 3), nullptr, 8);
            i += 3;
        } else {
            result += field[i];
        }
    }
    return result;
}

vector<fs::path> mounts_beneath(const fs::path &target, const string &mountinfo) {
    vector<fs::path> result;
    istringstream lines(mountinfo);
    string line;
    while (getline(lines, line)) {
        // mount ID, parent ID, major:minor, root, mount point, ...
        istringstream fields(line);
        string id, parent, device, root, mount_point;
        if (!(fields >> id >> parent >> device >> root >> mount_point)) continue;
        fs::path path = unescape_mountinfo(mount_point);
        if (path != target && is_beneath(target, path))
            result.push_back(path);
    }
    return result;
}

void linux_mount_ops::remount_readonly(const fs::path &target, bool recursive) {
    if (!recursive) {
        remount_single_readonly(target);
        return;
    }

    struct mount_attr attr;
    memset(&attr, 0, sizeof(attr));
    attr.attr_set = MOUNT_ATTR_RDONLY;
    if (mount_setattr(AT_FDCWD, target.c_str(), AT_RECURSIVE, &attr, sizeof(attr)) == 0)
        return;
    if (errno != ENOSYS)
        system_failure(errno, "unable to make '{}' read-only", target);

    // Kernels before 5.12: remount every mount of the subtree one by one.
    remount_single_readonly(target);
    for (auto &path : mounts_beneath(target, read_file("/proc/self/mountinfo")))
        remount_single_readonly(path);
}

void linux_mount_ops::mount_proc(const fs::path &target) {
    if (mount("proc", target.c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) < 0)
        system_failure(errno, "unable to mount proc on '{}'", target);
}

void linux_mount_ops::unmount(const fs::path &target) {
    if (umount2(target.c_str(), MNT_DETACH) < 0)
        system_failure(errno, "unable to unmount '{}'", target);
}

void linux_mount_ops::create_entry(const fs::path &source, const fs::path &target) {
    if (fs::is_directory(source)) {
        fs::create_directories(target);
        return;
    }

    fs::create_directories(target.parent_path());
    int fd = open(target.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) system_failure(errno, "unable to create '{}'", target);
    close(fd);
}

void linux_mount_ops::require_entry(const fs::path &source, const fs::path &target) {
    struct stat st;
    if (stat(target.c_str(), &st) < 0)
        system_failure(errno, "mount point '{}' does not exist in the directory mounted above it", target);
    if (fs::is_directory(source) != S_ISDIR(st.st_mode))
        system_failure(fs::is_directory(source) ? ENOTDIR : EISDIR, "mount point '{}' does not match the type of '{}'", target, source);
}

bool is_beneath(const fs::path &ancestor, const fs::path &path) {
    fs::path parent = ancestor.lexically_normal(), child = path.lexically_normal();
    auto a = parent.begin(), b = child.begin();
    for (; a != parent.end() && b != child.end(); ++a, ++b) {
        // a trailing separator normalizes to an empty last element
        if (a->empty()) break;
        if (*a != *b) return false;
    }
    return a == parent.end() || a->empty();
}

staging_plan make_staging_plan(const sandbox_configuration &config) {
    staging_plan plan;
    plan.rules = sort_mount_rules(config.mounts);
    plan.mount_tmpfs = config.mount_tmpfs;
    plan.mount_proc = config.mount_proc;
    return plan;
}

staged_root::staged_root(fs::path scratch, shared_ptr<mount_ops> ops)
    : scratch(move(scratch)), ops(move(ops)) {}

staged_root::~staged_root() {
    teardown();
}

fs::path staged_root::root() const {
    return is_host_root() ? fs::path("/") : scratch;
}

bool staged_root::is_host_root() const {
    return scratch.empty();
}

const vector<fs::path> &staged_root::mounted() const {
    return mounted_so_far;
}

static fs::path inside(const fs::path &root, const fs::path &sandbox_path) {
    return root / sandbox_path.lexically_normal().relative_path();
}

void staged_root::mount_step(const fs::path &target, const function<void()> &action) {
    action();
    mounted_so_far.push_back(target);
}

void staged_root::stage(const staging_plan &plan) {
    if (is_host_root()) return;

    fs::path current;
    try {
        current = scratch;
        mount_step(scratch, [&] { ops->mount_tmpfs(scratch, "size=256M,mode=0755"); });

        for (auto &device : sandbox_devices) {
            current = inside(scratch, device);
            ops->create_entry(device, current);
            mount_step(current, [&] { ops->bind(device, current); });
        }

        if (plan.mount_tmpfs) {
            for (const char *dir : {"/tmp", "/dev/shm"}) {
                current = inside(scratch, dir);
                fs::create_directories(current);
                mount_step(current, [&] { ops->mount_tmpfs(current, "mode=1777"); });
            }
        }

        for (size_t i = 0; i < plan.rules.size(); ++i) {
            auto &rule = plan.rules[i];
            current = inside(scratch, rule.sandbox_path);
            // Beneath an earlier bind the mount point lives on the host, so it
            // must already exist there.
            bool nested = any_of(plan.rules.begin(), plan.rules.begin() + i, [&](const mount_rule &outer) {
                return is_beneath(outer.sandbox_path, rule.sandbox_path);
            });
            if (nested)
                ops->require_entry(rule.host_path, current);
            else
                ops->create_entry(rule.host_path, current);
            mount_step(current, [&] { ops->bind(rule.host_path, current); });
            if (rule.mode == access_mode::read_only)
                ops->remount_readonly(current, true);
        }

        if (plan.mount_proc) {
            current = inside(scratch, "/proc");
            fs::create_directories(current);
            mount_step(current, [&] { ops->mount_proc(current); });
        }

        current = scratch;
        ops->remount_readonly(scratch, false);
    } catch (system_error &e) {
        // The namespace is discarded together with the staging process, so a
        // failed rollback cannot leak anything onto the host.
        (void)unmount_all();
        throw sandbox_error(error_kind::mount_failed, fmt::format("unable to stage '{}': {}", current, e.what()));
    }
}

bool staged_root::unmount_all() noexcept {
    bool success = true;
    while (!mounted_so_far.empty()) {
        try {
            ops->unmount(mounted_so_far.back());
        } catch (system_error &) {
            success = false;
        }
        mounted_so_far.pop_back();
    }
    return success;
}

void staged_root::teardown() noexcept {
    if (finished) return;
    finished = true;

    if (!unmount_all())
        LOG(WARNING) << "Some mount points of " << scratch << " could not be unmounted";

    if (!scratch.empty()) {
        error_code ec;
        fs::remove_all(scratch, ec);
        if (ec) LOG(WARNING) << "Unable to remove scratch directory " << scratch << ": " << ec.message();
    }
}

bool staged_root::torn_down() const {
    return finished;
}

unique_ptr<staged_root> create_staged_root(shared_ptr<mount_ops> ops) {
    error_code ec;
    fs::path temp = fs::temp_directory_path(ec);
    if (ec) temp = "/tmp";

    string templ = (temp / "runbox-XXXXXX").string();
    if (mkdtemp(templ.data()) == nullptr)
        throw sandbox_error(error_kind::mount_failed, fmt::format("unable to create scratch directory in '{}': {}", temp, strerror(errno)));
    return make_unique<staged_root>(fs::path(templ), move(ops));
}

unique_ptr<staged_root> host_root() {
    return make_unique<staged_root>(fs::path(), nullptr);
}

}  // namespace runbox
