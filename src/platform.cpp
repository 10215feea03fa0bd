#include "runbox/platform.hpp"
#include <errno.h>
#include <fcntl.h>
#include <glog/logging.h>
#include <sched.h>
#include <signal.h>
#include <sys/mman.h>
#include <sys/mount.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cstdint>
#include <boost/algorithm/string/trim.hpp>
#include "runbox/common/exceptions.hpp"
#include "runbox/common/utils.hpp"
#include "runbox/isolation.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

const char *get_display_message(strategy_kind kind) {
    switch (kind) {
        case strategy_kind::full_isolation: return "full-isolation";
        case strategy_kind::degraded_supervision: return "degraded-supervision";
    }
    return "unknown";
}

strategy_kind select_strategy() {
    static const strategy_kind strategy = [] {
#ifdef __linux__
        return strategy_kind::full_isolation;
#else
        return strategy_kind::degraded_supervision;
#endif
    }();
    return strategy;
}

static int clone_entry(void *arg) {
    auto &fn = *static_cast<const function<int()> *>(arg);
    _exit(fn());
}

static pid_t clone_with_stack(int flags, const function<int()> &fn) noexcept {
    // The child gets a private copy of the whole address space, only the stack
    // it starts on is new.
    size_t stack_size = 8 * 1024 * 1024;
    char *stack = (char *)mmap(nullptr, stack_size, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS | MAP_STACK | MAP_NORESERVE, -1, 0);
    if (stack == MAP_FAILED) return -1;

    pid_t pid = clone(clone_entry, stack + stack_size, flags, const_cast<function<int()> *>(&fn));
    int err = errno;
    munmap(stack, stack_size);
    errno = err;
    return pid;
}

pid_t clone_process(int flags, const function<int()> &fn) {
    // clone() skips the fork handlers of libc, so a child cloned directly from a
    // multithreaded process may start with a malloc lock held by another thread.
    // A forked helper is single threaded and safe to clone from, and
    // CLONE_PARENT hands the new process over to us.
    int channel[2];
    if (pipe2(channel, O_CLOEXEC) != 0) system_failure(errno, "pipe2");

    pid_t helper = fork();
    if (helper < 0) {
        int err = errno;
        close(channel[0]);
        close(channel[1]);
        system_failure(err, "fork");
    }
    if (helper == 0) {
        close(channel[0]);
        pid_t pid = clone_with_stack(flags | CLONE_PARENT | SIGCHLD, fn);
        int32_t result[2] = {pid, pid < 0 ? errno : 0};
        _exit(write(channel[1], result, sizeof(result)) == (ssize_t)sizeof(result) ? 0 : 1);
    }

    close(channel[1]);
    int32_t result[2] = {-1, 0};
    ssize_t ret;
    do {
        ret = read(channel[0], result, sizeof(result));
    } while (ret < 0 && errno == EINTR);
    int err = ret < 0 ? errno : EPROTO;
    close(channel[0]);

    int status;
    while (waitpid(helper, &status, 0) < 0 && errno == EINTR) {}

    if (ret != (ssize_t)sizeof(result))
        system_failure(err, "clone helper {} exited without reporting", helper);
    if (result[0] < 0) system_failure(result[1], "clone");
    return result[0];
}

static bool read_flag(const fs::path &path, bool def_value) {
    if (!fs::exists(path)) return def_value;
    try {
        return boost::algorithm::trim_copy(read_file(path)) != "0";
    } catch (system_error &) {
        return def_value;
    }
}

static bool probe_user_namespace() {
    if (!fs::exists("/proc/self/ns/user")) {
        LOG(INFO) << "/proc/self/ns/user does not exist, the kernel was likely built without CONFIG_USER_NS";
        return false;
    }
    if (!read_flag("/proc/sys/user/max_user_namespaces", false)) {
        LOG(INFO) << "user namespaces are disabled by /proc/sys/user/max_user_namespaces";
        return false;
    }
    if (!read_flag("/proc/sys/kernel/unprivileged_userns_clone", true)) {
        LOG(INFO) << "user namespaces are disabled by /proc/sys/kernel/unprivileged_userns_clone";
        return false;
    }

    int control[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, control) != 0) return false;

    pid_t pid;
    try {
        pid = clone_process(CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWPID, [&] {
            close(control[1]);
            char c;
            if (read(control[0], &c, 1) != 1) return 1;
            if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) return 2;
            if (mount("tmpfs", "/tmp", "tmpfs", 0, "size=1M") != 0) return 3;
            return 0;
        });
    } catch (system_error &e) {
        close(control[0]);
        close(control[1]);
        LOG(INFO) << "user namespaces do not work on this system: " << e.what();
        return false;
    }
    close(control[0]);

    bool mapped = true;
    try {
        write_file(fmt::format("/proc/{}/setgroups", pid), "deny");
        write_file(fmt::format("/proc/{}/uid_map", pid), fmt::format("0 {} 1\n", getuid()));
        write_file(fmt::format("/proc/{}/gid_map", pid), fmt::format("0 {} 1\n", getgid()));
    } catch (system_error &e) {
        LOG(INFO) << "unable to write id maps of a user namespace: " << e.what();
        mapped = false;
    }
    if (mapped) {
        char c = 'g';
        mapped = send(control[1], &c, 1, MSG_NOSIGNAL) == 1;
    }
    close(control[1]);

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return false;
    }
    if (!mapped) return false;
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        LOG(INFO) << "mounting inside a user namespace is not permitted (status " << status << ")";
        return false;
    }
    return true;
}

bool user_namespaces_supported() {
    static const bool supported = probe_user_namespace();
    return supported;
}

full_isolation::full_isolation(shared_ptr<mount_ops> ops) : ops(move(ops)) {}

strategy_kind full_isolation::kind() const {
    return strategy_kind::full_isolation;
}

bool full_isolation::reduced_guarantees() const {
    return false;
}

unique_ptr<staged_root> full_isolation::stage(const sandbox_configuration &) {
    return create_staged_root(ops);
}

strategy_kind degraded_supervision::kind() const {
    return strategy_kind::degraded_supervision;
}

bool degraded_supervision::reduced_guarantees() const {
    return true;
}

unique_ptr<staged_root> degraded_supervision::stage(const sandbox_configuration &) {
    return host_root();
}

unique_ptr<isolation_strategy> make_strategy(isolation_mode mode, shared_ptr<mount_ops> ops) {
    strategy_kind kind;
    switch (mode) {
        case isolation_mode::full: kind = strategy_kind::full_isolation; break;
        case isolation_mode::degraded: kind = strategy_kind::degraded_supervision; break;
        default: kind = select_strategy(); break;
    }

    if (kind == strategy_kind::degraded_supervision)
        return make_unique<degraded_supervision>();

    if (select_strategy() != strategy_kind::full_isolation)
        throw sandbox_error(error_kind::unsupported_platform, "full isolation requires Linux namespaces");
    if (!ops) ops = make_shared<linux_mount_ops>();
    return make_unique<full_isolation>(move(ops));
}

}  // namespace runbox
