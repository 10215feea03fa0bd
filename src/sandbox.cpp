#include "runbox/sandbox.hpp"
#include <glog/logging.h>
#include "runbox/cgroup.hpp"
#include "runbox/collector.hpp"
#include "runbox/common/defer.hpp"
#include "runbox/common/exceptions.hpp"
#include "runbox/isolation.hpp"
#include "runbox/launcher.hpp"
#include "runbox/monitor.hpp"
#include "runbox/platform.hpp"

namespace runbox {
using namespace std;

const char *get_display_message(run_state state) {
    switch (state) {
        case run_state::idle: return "Idle";
        case run_state::staging: return "Staging";
        case run_state::isolating: return "Isolating";
        case run_state::launching: return "Launching";
        case run_state::running: return "Running";
        case run_state::completed: return "Completed";
        case run_state::signaled: return "Signaled";
        case run_state::limit_exceeded: return "LimitExceeded";
        case run_state::setup_failed: return "SetupFailed";
        case run_state::torn_down: return "TornDown";
    }
    return "Unknown";
}

sandbox::sandbox(sandbox_configuration config, shared_ptr<mount_ops> ops)
    : config(move(config)), ops(move(ops)) {}

sandbox::~sandbox() {
    teardown();
}

const sandbox_configuration &sandbox::configuration() const {
    return config;
}

run_state sandbox::state() const {
    lock_guard<mutex> guard(state_mutex);
    return state_;
}

vector<run_state> sandbox::history() const {
    lock_guard<mutex> guard(state_mutex);
    return history_;
}

void sandbox::transition(run_state next) {
    lock_guard<mutex> guard(state_mutex);
    state_ = next;
    history_.push_back(next);
}

void sandbox::cancel() {
    lock_guard<mutex> guard(state_mutex);
    cancel_requested = true;
    if (monitor) monitor->cancel();
}

void sandbox::teardown() noexcept {
    {
        lock_guard<mutex> guard(state_mutex);
        if (state_ == run_state::idle || state_ == run_state::torn_down) return;
    }

    // Release order is the reverse of creation.
    if (process) process->ensure_reaped();
    process.reset();
    if (context) context->release();
    context.reset();
    if (cgroup) cgroup->release();
    cgroup.reset();
    if (root) root->teardown();
    root.reset();

    transition(run_state::torn_down);
}

sandbox_result sandbox::run() {
    {
        lock_guard<mutex> guard(state_mutex);
        if (started) throw internal_error("a sandbox can only run once");
        started = true;
    }

    scoped_guard release([this] { teardown(); });
    try {
        return execute();
    } catch (exception &e) {
        LOG(WARNING) << "Sandbox setup failed in state " << get_display_message(state()) << ": " << e.what();
        transition(run_state::setup_failed);
        throw;
    }
}

sandbox_result sandbox::execute() {
    transition(run_state::staging);
    config.validate();
    auto strategy = make_strategy(config.isolation, ops);
    bool full = strategy->kind() == strategy_kind::full_isolation;

    stdio_redirection stdio(config);
    exec_plan plan(config, full);
    root = strategy->stage(config);
    if (!config.cgroup.empty())
        cgroup = make_unique<cgroup_accounting>(config.cgroup, config.limits.max_memory);

    transition(run_state::isolating);
    context = strategy->enter_isolation(config, *root, plan, stdio);
    if (cgroup) cgroup->attach(context->root_pid());

    transition(run_state::launching);
    process = launch(*context);
    // The child holds its own copies now; ours would keep pipes from reaching EOF.
    stdio.close_all();

    resource_monitor usage_monitor(process, config.limits, config.monitor_interval, cgroup.get());
    usage_monitor.start();
    {
        lock_guard<mutex> guard(state_mutex);
        monitor = &usage_monitor;
        if (cancel_requested) usage_monitor.cancel();
    }
    defer {
        lock_guard<mutex> guard(state_mutex);
        monitor = nullptr;
    };
    transition(run_state::running);
    LOG(INFO) << "Started " << plan.executable() << " as process " << process->pid()
              << " with " << get_display_message(strategy->kind());

    outcome_collector collector(process, usage_monitor, config.limits, cgroup.get());
    sandbox_result result = collector.collect(get_display_message(strategy->kind()), strategy->reduced_guarantees());

    switch (result.status().kind) {
        case status_kind::signaled: transition(run_state::signaled); break;
        case status_kind::limit_exceeded: transition(run_state::limit_exceeded); break;
        default: transition(run_state::completed); break;
    }
    return result;
}

sandbox_result run_sandbox(const sandbox_configuration &config) {
    sandbox box(config);
    return box.run();
}

}  // namespace runbox
