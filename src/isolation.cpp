#include "runbox/isolation.hpp"
#include <errno.h>
#include <fcntl.h>
#include <glog/logging.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include "runbox/channel.hpp"
#include "runbox/common/exceptions.hpp"
#include "runbox/common/utils.hpp"
#include "runbox/platform.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

static const char GO = 'g';

/**
 * @brief 从控制管道读一个字节，父进程退出时直接结束
 */
static void wait_for_parent(int control_fd) noexcept {
    char c;
    ssize_t ret;
    do {
        ret = read(control_fd, &c, 1);
    } while (ret < 0 && errno == EINTR);
    if (ret != 1) _exit(1);
}

/**
 * @brief 向子进程发送一个字节，子进程已经退出时返回 false（errno 为 EPIPE），不会产生 SIGPIPE
 */
static bool notify_child(int control_fd) {
    ssize_t ret;
    do {
        ret = send(control_fd, &GO, 1, MSG_NOSIGNAL);
    } while (ret < 0 && errno == EINTR);
    return ret == 1;
}

static int open_control_channel(int fds[2]) {
    return socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds);
}

static void close_fd(int &fd) noexcept {
    if (fd >= 0) close(fd);
    fd = -1;
}

static void pivot_into(const fs::path &root, int status_fd) noexcept {
    if (chdir(root.c_str()) != 0)
        fail_child(status_fd, child_stage::pivot, errno, fmt::format("chdir({})", root));
    // Stack the old root on top of the new one and detach it, so that no path
    // leads back to the host filesystem.
    if (syscall(SYS_pivot_root, ".", ".") != 0)
        fail_child(status_fd, child_stage::pivot, errno, "pivot_root");
    if (umount2(".", MNT_DETACH) != 0)
        fail_child(status_fd, child_stage::pivot, errno, "unable to detach the old root");
    if (chdir("/") != 0)
        fail_child(status_fd, child_stage::pivot, errno, "chdir(/)");
}

/**
 * @brief 启动目标程序并等待它结束，只在 init 进程中调用
 */
[[noreturn]] static void supervise_target(const exec_plan &plan, const stdio_redirection &stdio, int status_fd) noexcept {
    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) != 0)
        fail_child(status_fd, child_stage::spawn, errno, "pipe2");

    pid_t target = fork();
    if (target < 0)
        fail_child(status_fd, child_stage::spawn, errno, "fork");
    if (target == 0) {
        close(exec_pipe[0]);
        close(status_fd);
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        plan.exec(stdio, exec_pipe[1]);
    }

    close(exec_pipe[1]);
    for (int stream = STDIN_FILENO; stream <= STDERR_FILENO; ++stream)
        close(stdio.fd(stream));

    child_report report;
    bool failed;
    try {
        failed = receive_report(exec_pipe[0], report);
    } catch (system_error &e) {
        kill(target, SIGKILL);
        fail_child(status_fd, child_stage::spawn, e.code().value(), e.what());
    }
    close(exec_pipe[0]);

    if (failed) {
        int status;
        waitpid(target, &status, 0);
        send_report(status_fd, report);
        _exit(127);
    }
    send_report(status_fd, make_report(child_stage::started, 0, ""));

    // Reap orphans until the target itself terminates. Their usage is added to
    // the report since they are all descendants of the target.
    child_report exited = make_report(child_stage::exited, 0, "");
    while (true) {
        int status;
        struct rusage ru;
        pid_t pid = wait4(-1, &status, 0, &ru);
        if (pid < 0) {
            if (errno == EINTR) continue;
            exited.error = errno;
            break;
        }
        accumulate_usage(exited, ru);
        if (pid == target) {
            exited.status = status;
            break;
        }
    }
    send_report(status_fd, exited);
    // Everything left in the PID namespace is killed by the kernel now.
    _exit(0);
}

namespace {
struct init_arguments {
    staged_root *root;
    staging_plan plan;
    const exec_plan *exec;
    const stdio_redirection *stdio;
    int status_fd;
    int control_fd;
};
}  // namespace

/**
 * @brief 命名空间中 1 号进程的入口
 */
static int sandbox_init(const init_arguments &args) noexcept {
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    close_descriptors_except({STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO, args.status_fd, args.control_fd,
                              args.stdio->fd(STDIN_FILENO), args.stdio->fd(STDOUT_FILENO), args.stdio->fd(STDERR_FILENO)});

    // uid_map and gid_map are written by the parent
    wait_for_parent(args.control_fd);

    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0)
        fail_child(args.status_fd, child_stage::mount, errno, "unable to make / private");

    try {
        args.root->stage(args.plan);
    } catch (sandbox_error &e) {
        fail_child(args.status_fd, child_stage::mount, 0, e.what());
    }

    pivot_into(args.root->root(), args.status_fd);

    send_report(args.status_fd, make_report(child_stage::ready, 0, ""));
    wait_for_parent(args.control_fd);
    close(args.control_fd);

    supervise_target(*args.exec, *args.stdio, args.status_fd);
}

static string describe(const child_report &report) {
    string detail(report.detail, strnlen(report.detail, sizeof(report.detail)));
    if (report.error != 0)
        return fmt::format("{}: {}", detail, strerror(report.error));
    return detail;
}

static error_kind kind_of(child_stage stage) {
    switch (stage) {
        case child_stage::user_namespace: return error_kind::namespace_creation_failed;
        case child_stage::mount: return error_kind::mount_failed;
        case child_stage::pivot: return error_kind::pivot_failed;
        default: return error_kind::spawn_failed;
    }
}

unique_ptr<isolation_context> full_isolation::enter_isolation(const sandbox_configuration &config, staged_root &root,
                                                              const exec_plan &plan, const stdio_redirection &stdio) {
    int status_pipe[2], control_channel[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0)
        throw sandbox_error(error_kind::namespace_creation_failed, fmt::format("pipe2: {}", strerror(errno)));
    if (open_control_channel(control_channel) != 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw sandbox_error(error_kind::namespace_creation_failed, fmt::format("socketpair: {}", strerror(err)));
    }

    init_arguments args{&root, make_staging_plan(config), &plan, &stdio, status_pipe[1], control_channel[0]};
    int flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWIPC | CLONE_NEWUTS;
    if (!config.share_network) flags |= CLONE_NEWNET;

    pid_t pid;
    try {
        pid = clone_process(flags, [&] { return sandbox_init(args); });
    } catch (system_error &e) {
        for (int fd : {status_pipe[0], status_pipe[1], control_channel[0], control_channel[1]}) close(fd);
        throw sandbox_error(error_kind::namespace_creation_failed, e.what());
    }
    close(status_pipe[1]);
    close(control_channel[0]);

    auto context = make_unique<namespace_context>(pid, status_pipe[0], control_channel[1]);
    LOG(INFO) << "Sandbox init process " << pid << " created in new namespaces";

    try {
        write_file(fmt::format("/proc/{}/setgroups", pid), "deny");
        write_file(fmt::format("/proc/{}/uid_map", pid), fmt::format("{} {} 1\n", config.uid, getuid()));
        write_file(fmt::format("/proc/{}/gid_map", pid), fmt::format("{} {} 1\n", config.gid, getgid()));
    } catch (system_error &e) {
        throw sandbox_error(error_kind::namespace_creation_failed, fmt::format("unable to map ids: {}", e.what()));
    }

    context->wait_ready();
    return context;
}

namespace_context::namespace_context(pid_t pid, int status_fd, int control_fd)
    : pid(pid), status_fd(status_fd), control_fd(control_fd) {}

namespace_context::~namespace_context() {
    release();
}

pid_t namespace_context::root_pid() const {
    return pid;
}

void namespace_context::wait_ready() {
    if (!notify_child(control_fd))
        throw sandbox_error(error_kind::namespace_creation_failed, fmt::format("sandbox init exited early: {}", strerror(errno)));

    child_report report;
    bool received;
    try {
        received = receive_report(status_fd, report);
    } catch (system_error &e) {
        throw sandbox_error(error_kind::namespace_creation_failed, e.what());
    }
    if (!received)
        throw sandbox_error(error_kind::namespace_creation_failed, "sandbox init exited before the root was ready");
    if (report.stage != child_stage::ready)
        throw sandbox_error(kind_of(report.stage), describe(report));
}

shared_ptr<running_process> namespace_context::launch() {
    if (launched)
        throw internal_error("target already launched");

    if (!notify_child(control_fd))
        throw sandbox_error(error_kind::spawn_failed, fmt::format("sandbox init exited early: {}", strerror(errno)));
    close_fd(control_fd);

    child_report report;
    bool received;
    try {
        received = receive_report(status_fd, report);
    } catch (system_error &e) {
        throw sandbox_error(error_kind::spawn_failed, e.what());
    }
    if (!received)
        throw sandbox_error(error_kind::spawn_failed, "sandbox init exited before launching the target");
    if (report.stage != child_stage::started)
        throw sandbox_error(kind_of(report.stage), describe(report));

    // The exit report is read after the init process has terminated.
    fcntl(status_fd, F_SETFL, fcntl(status_fd, F_GETFL) | O_NONBLOCK);

    auto process = make_shared<namespace_process>(pid, status_fd);
    launched = true;
    status_fd = -1;
    return process;
}

void namespace_context::release() noexcept {
    if (!launched && pid > 0) {
        kill(pid, SIGKILL);
        int status;
        if (waitpid(pid, &status, 0) < 0)
            LOG(ERROR) << "Unable to reap sandbox init " << pid << ": " << strerror(errno);
    }
    pid = -1;
    close_fd(status_fd);
    close_fd(control_fd);
}

namespace_process::namespace_process(pid_t init_pid, int status_fd)
    : running_process(init_pid), status_fd(status_fd) {}

namespace_process::~namespace_process() {
    ensure_reaped();
    close_fd(status_fd);
}

bool namespace_process::account_root() const {
    return false;
}

void namespace_process::wait_for_termination() {
    wait_without_reaping(pid_);
}

void namespace_process::signal_all() noexcept {
    // Killing the init process tears down the whole PID namespace.
    ::kill(pid_, SIGKILL);
}

exit_report namespace_process::reap_exited() {
    child_report relay;
    bool relayed = false;
    try {
        relayed = receive_report(status_fd, relay) && relay.stage == child_stage::exited && relay.error == 0;
    } catch (system_error &e) {
        LOG(WARNING) << "Unable to read exit report of sandbox init " << pid_ << ": " << e.what();
    }

    int status;
    struct rusage ru;
    reap_process(pid_, &status, &ru);

    exit_report report;
    if (relayed) {
        report.status = relay.status;
        report.usage.user_time = relay.user_usec / 1e6;
        report.usage.system_time = relay.system_usec / 1e6;
    } else {
        // The init process was killed before the target terminated.
        report.status = status;
        report.usage = usage_from_rusage(ru);
        report.from_target = false;
    }
    return report;
}

unique_ptr<isolation_context> degraded_supervision::enter_isolation(const sandbox_configuration &, staged_root &,
                                                                    const exec_plan &plan, const stdio_redirection &stdio) {
    int status_pipe[2], control_channel[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0)
        throw sandbox_error(error_kind::spawn_failed, fmt::format("pipe2: {}", strerror(errno)));
    if (open_control_channel(control_channel) != 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw sandbox_error(error_kind::spawn_failed, fmt::format("socketpair: {}", strerror(err)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {status_pipe[0], status_pipe[1], control_channel[0], control_channel[1]}) close(fd);
        throw sandbox_error(error_kind::spawn_failed, fmt::format("fork: {}", strerror(err)));
    }

    if (pid == 0) {
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        // run the command in a separate process group, so the command and all
        // its child processes can be killed off with one signal
        setpgid(0, 0);
        close_descriptors_except({STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO, status_pipe[1], control_channel[0],
                                  stdio.fd(STDIN_FILENO), stdio.fd(STDOUT_FILENO), stdio.fd(STDERR_FILENO)});
        wait_for_parent(control_channel[0]);
        plan.exec(stdio, status_pipe[1]);
    }

    // Also set in the parent so that the group exists before any kill(-pid).
    setpgid(pid, pid);
    close(status_pipe[1]);
    close(control_channel[0]);
    LOG(INFO) << "Supervised process " << pid << " created without isolation";
    return make_unique<process_group_context>(pid, status_pipe[0], control_channel[1]);
}

process_group_context::process_group_context(pid_t pid, int status_fd, int control_fd)
    : pid(pid), status_fd(status_fd), control_fd(control_fd) {}

process_group_context::~process_group_context() {
    release();
}

pid_t process_group_context::root_pid() const {
    return pid;
}

shared_ptr<running_process> process_group_context::launch() {
    if (launched)
        throw internal_error("target already launched");

    if (!notify_child(control_fd))
        throw sandbox_error(error_kind::spawn_failed, fmt::format("supervised process exited early: {}", strerror(errno)));
    close_fd(control_fd);

    // The status pipe is closed on exec: end of file means the target is running.
    child_report report;
    bool received;
    try {
        received = receive_report(status_fd, report);
    } catch (system_error &e) {
        throw sandbox_error(error_kind::spawn_failed, e.what());
    }
    close_fd(status_fd);
    if (received)
        throw sandbox_error(kind_of(report.stage), describe(report));

    auto process = make_shared<process_group>(pid);
    launched = true;
    return process;
}

void process_group_context::release() noexcept {
    if (!launched && pid > 0) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        int status;
        if (waitpid(pid, &status, 0) < 0)
            LOG(ERROR) << "Unable to reap supervised process " << pid << ": " << strerror(errno);
    }
    pid = -1;
    close_fd(status_fd);
    close_fd(control_fd);
}

process_group::process_group(pid_t pid) : running_process(pid) {}

process_group::~process_group() {
    ensure_reaped();
}

bool process_group::account_root() const {
    return true;
}

void process_group::wait_for_termination() {
    wait_without_reaping(pid_);
}

void process_group::signal_all() noexcept {
    ::kill(-pid_, SIGKILL);
}

exit_report process_group::reap_exited() {
    // The zombie leader keeps the process group id reserved, so the rest of the
    // group is killed before reaping it.
    ::kill(-pid_, SIGKILL);

    int status;
    struct rusage ru;
    reap_process(pid_, &status, &ru);

    exit_report report;
    report.status = status;
    report.usage = usage_from_rusage(ru);
    return report;
}

shared_ptr<running_process> launch(isolation_context &context) {
    return context.launch();
}

}  // namespace runbox
