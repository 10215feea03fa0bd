#include "runbox/launcher.hpp"
#include <errno.h>
#include <fcntl.h>
#include <glog/logging.h>
#include <math.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <linux/securebits.h>
#include <system_error>
#include "runbox/channel.hpp"
#include "runbox/common/exceptions.hpp"
#include "runbox/common/utils.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

stdio_redirection::stdio_redirection(const sandbox_configuration &config) {
    try {
        fds[STDIN_FILENO] = open_target(config.stdin_target, STDIN_FILENO);
        fds[STDOUT_FILENO] = open_target(config.stdout_target, STDOUT_FILENO);

        // stdout and stderr written to the same file share one descriptor, so the
        // output is interleaved instead of overwritten.
        if (config.stderr_target.kind == stream_target::type::file &&
            config.stdout_target.kind == stream_target::type::file &&
            fs::absolute(config.stderr_target.path) == fs::absolute(config.stdout_target.path))
            fds[STDERR_FILENO] = fds[STDOUT_FILENO];
        else
            fds[STDERR_FILENO] = open_target(config.stderr_target, STDERR_FILENO);
    } catch (system_error &e) {
        close_all();
        throw sandbox_error(error_kind::spawn_failed, e.what());
    }
}

stdio_redirection::~stdio_redirection() {
    close_all();
}

int stdio_redirection::open_target(const stream_target &target, int stream) {
    int fd = -1;
    switch (target.kind) {
        case stream_target::type::null_device:
            fd = open("/dev/null", (stream == STDIN_FILENO ? O_RDONLY : O_WRONLY) | O_CLOEXEC);
            if (fd < 0) system_failure(errno, "unable to open /dev/null");
            break;
        case stream_target::type::file:
            if (stream == STDIN_FILENO)
                fd = open(target.path.c_str(), O_RDONLY | O_CLOEXEC);
            else
                fd = open(target.path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0) system_failure(errno, "unable to open '{}' for fd {}", target.path, stream);
            break;
        case stream_target::type::descriptor:
            fd = fcntl(target.fd, F_DUPFD_CLOEXEC, 3);
            if (fd < 0) system_failure(errno, "unable to duplicate descriptor {} for fd {}", target.fd, stream);
            owned.push_back(fd);
            return fd;
    }
    owned.push_back(fd);

    // Keep 0, 1 and 2 free so that dup2 in the child never clobbers a source.
    if (fd <= STDERR_FILENO) {
        int moved = fcntl(fd, F_DUPFD_CLOEXEC, 3);
        if (moved < 0) system_failure(errno, "unable to move descriptor {}", fd);
        close(fd);
        owned.back() = moved;
        fd = moved;
    }
    return fd;
}

int stdio_redirection::fd(int stream) const {
    return fds.at(stream);
}

void stdio_redirection::apply() const {
    for (int stream = STDIN_FILENO; stream <= STDERR_FILENO; ++stream)
        if (dup2(fds[stream], stream) < 0)
            system_failure(errno, "unable to redirect fd {}", stream);
}

void stdio_redirection::close_all() noexcept {
    for (int fd : owned) close(fd);
    owned.clear();
    fds = {-1, -1, -1};
}

exec_plan::exec_plan(const sandbox_configuration &config, bool drop_capabilities)
    : executable_(config.executable.string()),
      working_directory(config.working_directory),
      limits(config.limits),
      cpu_core(config.cpu_core),
      filter(config.filter),
      drop_capabilities(drop_capabilities) {
    args.push_back(executable_);
    args.insert(args.end(), config.arguments.begin(), config.arguments.end());
    for (auto &[key, value] : config.environment)
        env.push_back(key + "=" + value);

    for (auto &arg : args) argv_.push_back(arg.data());
    argv_.push_back(nullptr);
    for (auto &var : env) envp_.push_back(var.data());
    envp_.push_back(nullptr);
}

const string &exec_plan::executable() const {
    return executable_;
}

char *const *exec_plan::argv() const {
    return argv_.data();
}

char *const *exec_plan::envp() const {
    return envp_.data();
}

static void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        system_failure(errno, "setrlimit({})", resource);
}

void set_resource_limits(const resource_limits &limits) {
    if (limits.max_cpu_time) {
        /* At the soft limit the kernel sends SIGXCPU, at the hard limit SIGKILL.
           SIGXCPU is not caught by default, which gives a reliable way to detect
           that the CPU time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(*limits.max_cpu_time);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    // memory limit is enforced by the monitor
    if (limits.max_stack) set_rlimit(RLIMIT_STACK, *limits.max_stack, *limits.max_stack);
    if (limits.max_file_size) set_rlimit(RLIMIT_FSIZE, *limits.max_file_size, *limits.max_file_size);
    if (limits.max_processes) set_rlimit(RLIMIT_NPROC, *limits.max_processes, *limits.max_processes);
    set_rlimit(RLIMIT_CORE, 0, 0);
}

void exec_plan::exec(const stdio_redirection &stdio, int status_fd) const noexcept {
    try {
        if (chdir(working_directory.c_str()) != 0)
            system_failure(errno, "unable to chdir to '{}'", working_directory);

        set_resource_limits(limits);

        if (cpu_core) {
            cpu_set_t mask;
            CPU_ZERO(&mask);
            CPU_SET(*cpu_core, &mask);
            if (sched_setaffinity(0, sizeof(mask), &mask) != 0)
                system_failure(errno, "unable to bind to cpu {}", *cpu_core);
        }

        // uid 0 inside the user namespace must not regain capabilities on execve
        if (drop_capabilities && prctl(PR_SET_SECUREBITS, SECBIT_NOROOT | SECBIT_NOROOT_LOCKED, 0, 0, 0) != 0)
            system_failure(errno, "unable to set securebits");

        stdio.apply();

        sigset_t mask;
        sigemptyset(&mask);
        sigprocmask(SIG_SETMASK, &mask, nullptr);

        if (filter) filter->load();

        execve(executable_.c_str(), argv(), envp());
        system_failure(errno, "unable to execute '{}'", executable_);
    } catch (system_error &e) {
        fail_child(status_fd, child_stage::spawn, e.code().value(), e.what());
    } catch (exception &e) {
        fail_child(status_fd, child_stage::spawn, EINVAL, e.what());
    }
}

running_process::running_process(pid_t pid) : pid_(pid) {}

running_process::~running_process() = default;

pid_t running_process::pid() const {
    return pid_;
}

bool running_process::kill() noexcept {
    lock_guard<std::mutex> guard(exit_mutex);
    if (exited_) return false;
    signal_all();
    return true;
}

bool running_process::exited() const {
    lock_guard<std::mutex> guard(exit_mutex);
    return exited_;
}

void running_process::wait_exit() {
    wait_for_termination();
    lock_guard<std::mutex> guard(exit_mutex);
    exited_ = true;
}

exit_report running_process::reap() {
    exit_report report = reap_exited();
    reaped = true;
    return report;
}

exit_report running_process::wait() {
    wait_exit();
    return reap();
}

void running_process::ensure_reaped() noexcept {
    if (reaped) return;
    try {
        kill();
        wait();
    } catch (system_error &e) {
        LOG(ERROR) << "Unable to reap process " << pid_ << ": " << e.what();
    }
}

resource_usage usage_from_rusage(const struct rusage &ru) {
    resource_usage usage;
    usage.user_time = ru.ru_utime.tv_sec + ru.ru_utime.tv_usec / 1e6;
    usage.system_time = ru.ru_stime.tv_sec + ru.ru_stime.tv_usec / 1e6;
    return usage;
}

void wait_without_reaping(pid_t pid) {
    siginfo_t info;
    while (waitid(P_PID, pid, &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR)
            system_failure(errno, "unable to wait for process {}", pid);
    }
}

pid_t reap_process(pid_t pid, int *status, struct rusage *ru) {
    pid_t ret;
    while ((ret = wait4(pid, status, 0, ru)) < 0) {
        if (errno != EINTR)
            system_failure(errno, "unable to reap process {}", pid);
    }
    return ret;
}

}  // namespace runbox
