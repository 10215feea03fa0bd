#include "runbox/serialization.hpp"
#include <chrono>

namespace runbox {
using namespace std;
using namespace nlohmann;

NLOHMANN_JSON_SERIALIZE_ENUM(access_mode, {
    {access_mode::read_only, "read-only"},
    {access_mode::read_write, "read-write"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(stream_target::type, {
    {stream_target::type::null_device, "null"},
    {stream_target::type::file, "file"},
    {stream_target::type::descriptor, "descriptor"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(syscall_action::type, {
    {syscall_action::type::allow, "allow"},
    {syscall_action::type::kill, "kill"},
    {syscall_action::type::error, "errno"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(isolation_mode, {
    {isolation_mode::automatic, "automatic"},
    {isolation_mode::full, "full"},
    {isolation_mode::degraded, "degraded"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(status_kind, {
    {status_kind::success, "success"},
    {status_kind::signaled, "signaled"},
    {status_kind::limit_exceeded, "limit-exceeded"},
    {status_kind::internal_error, "internal-error"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(limit_kind, {
    {limit_kind::cpu_time, "cpu-time"},
    {limit_kind::memory, "memory"},
    {limit_kind::wall_time, "wall-time"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(internal_error_kind, {
    {internal_error_kind::none, "none"},
    {internal_error_kind::monitor_failed, "monitor-failed"},
    {internal_error_kind::wait_failed, "wait-failed"},
    {internal_error_kind::inconsistent_usage, "inconsistent-usage"},
})

template <typename T>
static void get_optional(const json &j, const char *key, optional<T> &value) {
    if (j.count(key) && !j.at(key).is_null())
        value = j.at(key).get<T>();
}

template <typename T>
static void put_optional(json &j, const char *key, const optional<T> &value) {
    if (value) j[key] = *value;
}

template <typename T>
static void get_if_exists(const json &j, const char *key, T &value) {
    if (j.count(key)) j.at(key).get_to(value);
}

void to_json(json &j, const mount_rule &value) {
    j = {{"host_path", value.host_path.string()},
         {"sandbox_path", value.sandbox_path.string()},
         {"mode", value.mode}};
}

void from_json(const json &j, mount_rule &value) {
    value.host_path = j.at("host_path").get<string>();
    value.sandbox_path = j.at("sandbox_path").get<string>();
    get_if_exists(j, "mode", value.mode);
}

void to_json(json &j, const stream_target &value) {
    j = {{"type", value.kind}};
    if (value.kind == stream_target::type::file) j["path"] = value.path.string();
    if (value.kind == stream_target::type::descriptor) j["fd"] = value.fd;
}

void from_json(const json &j, stream_target &value) {
    value = stream_target();
    j.at("type").get_to(value.kind);
    if (j.count("path")) value.path = j.at("path").get<string>();
    get_if_exists(j, "fd", value.fd);
}

void to_json(json &j, const resource_limits &value) {
    j = json::object();
    put_optional(j, "max_cpu_time", value.max_cpu_time);
    put_optional(j, "max_memory", value.max_memory);
    put_optional(j, "max_wall_time", value.max_wall_time);
    put_optional(j, "max_stack", value.max_stack);
    put_optional(j, "max_file_size", value.max_file_size);
    put_optional(j, "max_processes", value.max_processes);
}

void from_json(const json &j, resource_limits &value) {
    get_optional(j, "max_cpu_time", value.max_cpu_time);
    get_optional(j, "max_memory", value.max_memory);
    get_optional(j, "max_wall_time", value.max_wall_time);
    get_optional(j, "max_stack", value.max_stack);
    get_optional(j, "max_file_size", value.max_file_size);
    get_optional(j, "max_processes", value.max_processes);
}

void to_json(json &j, const syscall_action &value) {
    j = {{"type", value.kind}};
    if (value.kind == syscall_action::type::error) j["errno"] = value.error_number;
}

void from_json(const json &j, syscall_action &value) {
    j.at("type").get_to(value.kind);
    value.error_number = 0;
    get_if_exists(j, "errno", value.error_number);
}

void to_json(json &j, const syscall_filter &value) {
    j = {{"default_action", value.default_action}, {"rules", json::array()}};
    for (auto &[name, action] : value.rules)
        j["rules"].push_back({{"syscall", name}, {"action", action}});
}

void from_json(const json &j, syscall_filter &value) {
    get_if_exists(j, "default_action", value.default_action);
    value.rules.clear();
    if (j.count("rules"))
        for (auto &rule : j.at("rules"))
            value.rules.emplace_back(rule.at("syscall").get<string>(), rule.at("action").get<syscall_action>());
}

void to_json(json &j, const sandbox_configuration &value) {
    j = {{"executable", value.executable.string()},
         {"arguments", value.arguments},
         {"environment", value.environment},
         {"working_directory", value.working_directory.string()},
         {"mounts", value.mounts},
         {"limits", value.limits},
         {"stdin", value.stdin_target},
         {"stdout", value.stdout_target},
         {"stderr", value.stderr_target},
         {"mount_tmpfs", value.mount_tmpfs},
         {"mount_proc", value.mount_proc},
         {"share_network", value.share_network},
         {"uid", value.uid},
         {"gid", value.gid},
         {"cgroup", value.cgroup},
         {"isolation", value.isolation},
         {"monitor_interval_ms", value.monitor_interval.count()}};
    put_optional(j, "cpu_core", value.cpu_core);
    put_optional(j, "syscall_filter", value.filter);
}

void from_json(const json &j, sandbox_configuration &value) {
    if (j.count("executable")) value.executable = j.at("executable").get<string>();
    get_if_exists(j, "arguments", value.arguments);
    get_if_exists(j, "environment", value.environment);
    if (j.count("working_directory")) value.working_directory = j.at("working_directory").get<string>();
    get_if_exists(j, "mounts", value.mounts);
    get_if_exists(j, "limits", value.limits);
    get_if_exists(j, "stdin", value.stdin_target);
    get_if_exists(j, "stdout", value.stdout_target);
    get_if_exists(j, "stderr", value.stderr_target);
    get_if_exists(j, "mount_tmpfs", value.mount_tmpfs);
    get_if_exists(j, "mount_proc", value.mount_proc);
    get_if_exists(j, "share_network", value.share_network);
    get_if_exists(j, "uid", value.uid);
    get_if_exists(j, "gid", value.gid);
    get_optional(j, "cpu_core", value.cpu_core);
    get_optional(j, "syscall_filter", value.filter);
    get_if_exists(j, "cgroup", value.cgroup);
    get_if_exists(j, "isolation", value.isolation);
    if (j.count("monitor_interval_ms"))
        value.monitor_interval = chrono::milliseconds(j.at("monitor_interval_ms").get<int64_t>());
}

void to_json(json &j, const resource_usage &value) {
    j = {{"user_time", value.user_time},
         {"system_time", value.system_time},
         {"cpu_time", value.cpu_time()},
         {"wall_time", value.wall_time},
         {"peak_memory", value.peak_memory}};
}

void from_json(const json &j, resource_usage &value) {
    j.at("user_time").get_to(value.user_time);
    j.at("system_time").get_to(value.system_time);
    j.at("wall_time").get_to(value.wall_time);
    j.at("peak_memory").get_to(value.peak_memory);
}

void to_json(json &j, const sandbox_status &value) {
    j = {{"status", value.kind}};
    switch (value.kind) {
        case status_kind::success: j["exit_code"] = value.exit_code; break;
        case status_kind::signaled: j["signal"] = value.signal; break;
        case status_kind::limit_exceeded: j["limit"] = value.limit; break;
        case status_kind::internal_error: j["internal_error"] = value.error; break;
    }
}

void from_json(const json &j, sandbox_status &value) {
    value = sandbox_status();
    j.at("status").get_to(value.kind);
    get_if_exists(j, "exit_code", value.exit_code);
    get_if_exists(j, "signal", value.signal);
    get_if_exists(j, "limit", value.limit);
    get_if_exists(j, "internal_error", value.error);
}

void to_json(json &j, const sandbox_result &value) {
    j = value.status();
    j["usage"] = value.usage();
    j["strategy"] = value.strategy();
    j["reduced_guarantees"] = value.reduced_guarantees();
    j["cancelled"] = value.cancelled();
    if (!value.message().empty()) j["message"] = value.message();
}

}  // namespace runbox

namespace nlohmann {

runbox::sandbox_result adl_serializer<runbox::sandbox_result>::from_json(const json &j) {
    std::string message;
    if (j.count("message")) j.at("message").get_to(message);
    return runbox::sandbox_result(j.get<runbox::sandbox_status>(),
                                  j.at("usage").get<runbox::resource_usage>(),
                                  j.at("strategy").get<std::string>(),
                                  j.at("reduced_guarantees").get<bool>(),
                                  j.value("cancelled", false),
                                  message);
}

void adl_serializer<runbox::sandbox_result>::to_json(json &j, const runbox::sandbox_result &value) {
    runbox::to_json(j, value);
}

}  // namespace nlohmann
