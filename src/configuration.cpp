#include "runbox/configuration.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <set>
#include "runbox/common/exceptions.hpp"
#include "runbox/common/utils.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

bool mount_rule::operator==(const mount_rule &other) const {
    return host_path == other.host_path && sandbox_path == other.sandbox_path && mode == other.mode;
}

stream_target stream_target::null_device() {
    return stream_target();
}

stream_target stream_target::file(const fs::path &path) {
    stream_target target;
    target.kind = type::file;
    target.path = path;
    return target;
}

stream_target stream_target::descriptor(int fd) {
    stream_target target;
    target.kind = type::descriptor;
    target.fd = fd;
    return target;
}

bool stream_target::operator==(const stream_target &other) const {
    return kind == other.kind && path == other.path && fd == other.fd;
}

sandbox_configuration &sandbox_configuration::set_executable(const fs::path &executable) {
    this->executable = executable;
    return *this;
}

sandbox_configuration &sandbox_configuration::add_argument(const string &argument) {
    arguments.push_back(argument);
    return *this;
}

sandbox_configuration &sandbox_configuration::set_env(const string &key, const string &value) {
    environment[key] = value;
    return *this;
}

sandbox_configuration &sandbox_configuration::set_working_directory(const fs::path &dir) {
    working_directory = dir;
    return *this;
}

sandbox_configuration &sandbox_configuration::add_mount(const fs::path &host_path, const fs::path &sandbox_path, access_mode mode) {
    mounts.push_back({host_path, sandbox_path, mode});
    return *this;
}

sandbox_configuration &sandbox_configuration::set_cpu_time_limit(double seconds) {
    limits.max_cpu_time = seconds;
    return *this;
}

sandbox_configuration &sandbox_configuration::set_memory_limit(uint64_t bytes) {
    limits.max_memory = bytes;
    return *this;
}

sandbox_configuration &sandbox_configuration::set_wall_time_limit(double seconds) {
    limits.max_wall_time = seconds;
    return *this;
}

static void check_positive(const optional<double> &value, const char *name) {
    if (value && !(*value > 0))
        throw sandbox_error(error_kind::invalid_configuration, fmt::format("{} must be positive, got {}", name, *value));
}

static void check_positive(const optional<uint64_t> &value, const char *name) {
    if (value && *value == 0)
        throw sandbox_error(error_kind::invalid_configuration, fmt::format("{} must be positive", name));
}

static void check_stream(const stream_target &target, const char *name) {
    if (target.kind == stream_target::type::file && target.path.empty())
        throw sandbox_error(error_kind::invalid_configuration, fmt::format("{} redirects to an empty path", name));
    if (target.kind == stream_target::type::descriptor && target.fd < 0)
        throw sandbox_error(error_kind::invalid_configuration, fmt::format("{} redirects to invalid descriptor {}", name, target.fd));
}

void sandbox_configuration::validate() const {
    if (executable.empty())
        throw sandbox_error(error_kind::invalid_configuration, "executable is not specified");
    if (!working_directory.is_absolute())
        throw sandbox_error(error_kind::invalid_configuration, fmt::format("working directory '{}' is not absolute", working_directory));
    if (monitor_interval.count() <= 0)
        throw sandbox_error(error_kind::invalid_configuration, "monitor interval must be positive");

    set<fs::path> targets;
    for (auto &rule : mounts) {
        if (!rule.host_path.is_absolute())
            throw sandbox_error(error_kind::mount_failed, fmt::format("host path '{}' is not absolute", rule.host_path));
        if (!rule.sandbox_path.is_absolute())
            throw sandbox_error(error_kind::mount_failed, fmt::format("sandbox path '{}' is not absolute", rule.sandbox_path));
        fs::path target = rule.sandbox_path.lexically_normal();
        if (path_depth(target) == 0)
            throw sandbox_error(error_kind::mount_failed, "the sandbox root cannot be a mount target");
        if (!target.has_filename()) target = target.parent_path();
        if (!targets.insert(target).second)
            throw sandbox_error(error_kind::mount_failed, fmt::format("sandbox path '{}' is mounted more than once", rule.sandbox_path));
    }

    check_positive(limits.max_cpu_time, "cpu time limit");
    check_positive(limits.max_wall_time, "wall time limit");
    check_positive(limits.max_memory, "memory limit");
    check_positive(limits.max_stack, "stack limit");
    check_positive(limits.max_file_size, "file size limit");
    check_positive(limits.max_processes, "process limit");

    check_stream(stdin_target, "stdin");
    check_stream(stdout_target, "stdout");
    check_stream(stderr_target, "stderr");

    if (cpu_core && *cpu_core < 0)
        throw sandbox_error(error_kind::invalid_configuration, fmt::format("invalid cpu core {}", *cpu_core));

    if (filter) filter->validate();
}

size_t path_depth(const fs::path &path) {
    size_t depth = 0;
    for (auto &part : path.lexically_normal().relative_path())
        if (!part.empty() && part != ".") ++depth;
    return depth;
}

vector<mount_rule> sort_mount_rules(vector<mount_rule> rules) {
    stable_sort(rules.begin(), rules.end(), [](const mount_rule &a, const mount_rule &b) {
        return path_depth(a.sandbox_path) < path_depth(b.sandbox_path);
    });
    return rules;
}

}  // namespace runbox
