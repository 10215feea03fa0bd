#include "runbox/collector.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include "runbox/cgroup.hpp"
#include "runbox/common/exceptions.hpp"
#include "runbox/monitor.hpp"

namespace runbox {
using namespace std;

sandbox_status classify(const termination &term, const resource_limits &limits) {
    if (term.monitor_failure)
        return sandbox_status::internal(internal_error_kind::monitor_failed);
    if (term.violation)
        return sandbox_status::limit_exceeded(*term.violation);
    if (term.oom)
        return sandbox_status::limit_exceeded(limit_kind::memory);

    int status = term.exit.status;
    if (term.cancelled)
        return sandbox_status::signaled(WIFSIGNALED(status) ? WTERMSIG(status) : SIGKILL);

    if (WIFSIGNALED(status) && WTERMSIG(status) == SIGXCPU && limits.max_cpu_time)
        return sandbox_status::limit_exceeded(limit_kind::cpu_time);

    // Usage gathered after the process is gone may reveal a violation that
    // happened between two samples.
    if (auto exceeded = resource_monitor::check_limits(limits, term.usage))
        return sandbox_status::limit_exceeded(*exceeded);

    if (!term.exit.from_target)
        return sandbox_status::internal(internal_error_kind::wait_failed);
    if (WIFSIGNALED(status))
        return sandbox_status::signaled(WTERMSIG(status));
    if (WIFEXITED(status))
        return sandbox_status::success(WEXITSTATUS(status));
    return sandbox_status::internal(internal_error_kind::wait_failed);
}

outcome_collector::outcome_collector(shared_ptr<running_process> process, resource_monitor &monitor,
                                     const resource_limits &limits, cgroup_accounting *cgroup)
    : process(move(process)), monitor(monitor), limits(limits), cgroup(cgroup) {}

sandbox_result outcome_collector::collect(const string &strategy, bool reduced_guarantees) {
    termination term;
    string message;
    double wall_time = 0;
    try {
        process->wait_exit();
        wall_time = monitor.elapsed();
        // The terminated process is not reaped yet, so its last usage is still visible.
        monitor.sample_now();
        term.exit = process->reap();
    } catch (system_error &e) {
        LOG(ERROR) << "Unable to wait for process " << process->pid() << ": " << e.what();
        monitor.stop();
        process->ensure_reaped();
        resource_usage usage = monitor.snapshot();
        return sandbox_result(sandbox_status::internal(internal_error_kind::wait_failed), usage, strategy,
                              reduced_guarantees, monitor.cancelled(), e.what());
    }
    monitor.stop();

    term.usage = monitor.snapshot();
    term.usage.merge(term.exit.usage);
    term.usage.wall_time = max(term.usage.wall_time, wall_time);

    if (cgroup) {
        try {
            cgroup_usage cg = cgroup->read();
            resource_usage extra;
            extra.user_time = cg.user_time;
            extra.system_time = cg.system_time;
            extra.peak_memory = cg.peak_memory;
            term.usage.merge(extra);
        } catch (sandbox_error &e) {
            LOG(WARNING) << "Unable to read cgroup " << cgroup->name() << ": " << e.what();
        }
        term.oom = cgroup->oom_killed();
    }

    term.monitor_failure = monitor.failure();
    term.violation = monitor.violation();
    term.cancelled = monitor.cancelled();

    sandbox_status status = classify(term, limits);
    if (term.monitor_failure)
        message = *term.monitor_failure;
    else if (status.kind == status_kind::internal_error)
        message = fmt::format("unexpected wait status {:#x}", term.exit.status);

    LOG(INFO) << "Process " << process->pid() << " finished: " << to_string(status)
              << ", cpu " << term.usage.cpu_time() << "s, wall " << term.usage.wall_time
              << "s, memory " << term.usage.peak_memory / 1024 << "kB";
    return sandbox_result(status, term.usage, strategy, reduced_guarantees, term.cancelled, message);
}

}  // namespace runbox
