#include "runbox/syscall_filter.hpp"
#include <fmt/core.h>
#include <seccomp.h>
#include <system_error>
#include "runbox/common/defer.hpp"
#include "runbox/common/exceptions.hpp"

namespace runbox {
using namespace std;

syscall_action syscall_action::allow() {
    return {type::allow, 0};
}

syscall_action syscall_action::kill() {
    return {type::kill, 0};
}

syscall_action syscall_action::error(int error_number) {
    return {type::error, error_number};
}

bool syscall_action::operator==(const syscall_action &other) const {
    return kind == other.kind && error_number == other.error_number;
}

static uint32_t to_seccomp_action(const syscall_action &action) {
    switch (action.kind) {
        case syscall_action::type::allow: return SCMP_ACT_ALLOW;
        case syscall_action::type::kill: return SCMP_ACT_KILL;
        case syscall_action::type::error: return SCMP_ACT_ERRNO(action.error_number);
    }
    return SCMP_ACT_KILL;
}

syscall_filter syscall_filter::build(bool multiprocess, bool chmod) {
    syscall_filter filter;
    filter.set_default_action(syscall_action::allow());
    if (!multiprocess) {
        filter.add_rule("fork", syscall_action::kill());
        filter.add_rule("vfork", syscall_action::kill());
        filter.add_rule("clone", syscall_action::kill());
    }
    if (!chmod) {
        filter.add_rule("chmod", syscall_action::kill());
        filter.add_rule("fchmod", syscall_action::kill());
        filter.add_rule("fchmodat", syscall_action::kill());
    }
    return filter;
}

syscall_filter &syscall_filter::set_default_action(syscall_action action) {
    default_action = action;
    return *this;
}

syscall_filter &syscall_filter::add_rule(const string &syscall, syscall_action action) {
    rules.emplace_back(syscall, action);
    return *this;
}

void syscall_filter::validate() const {
    for (auto &[name, action] : rules) {
        if (seccomp_syscall_resolve_name(name.c_str()) == __NR_SCMP_ERROR)
            throw sandbox_error(error_kind::invalid_configuration, fmt::format("unknown system call '{}'", name));
        if (action.kind == syscall_action::type::error && (action.error_number <= 0 || action.error_number > 0xffff))
            throw sandbox_error(error_kind::invalid_configuration, fmt::format("invalid errno {} for system call '{}'", action.error_number, name));
    }
}

void syscall_filter::load() const {
    scmp_filter_ctx ctx = seccomp_init(to_seccomp_action(default_action));
    if (ctx == nullptr)
        throw system_error(EINVAL, system_category(), "seccomp_init");
    defer { seccomp_release(ctx); };

    for (auto &[name, action] : rules) {
        // Rules equal to the default action are rejected by libseccomp.
        if (action == default_action) continue;

        int syscall = seccomp_syscall_resolve_name(name.c_str());
        if (syscall == __NR_SCMP_ERROR)
            throw system_error(EINVAL, system_category(), fmt::format("seccomp_syscall_resolve_name({})", name));
        int ret = seccomp_rule_add(ctx, to_seccomp_action(action), syscall, 0);
        if (ret < 0)
            throw system_error(-ret, system_category(), fmt::format("seccomp_rule_add({})", name));
    }

    int ret = seccomp_load(ctx);
    if (ret < 0)
        throw system_error(-ret, system_category(), "seccomp_load");
}

}  // namespace runbox
