#include <errno.h>
#include <signal.h>
#include "gtest/gtest.h"
#include "runbox/serialization.hpp"

using namespace std;
using namespace runbox;
using nlohmann::json;

TEST(SerializationTest, ConfigurationFromJson) {
    auto j = json::parse(R"json({
        "executable": "/usr/bin/python3",
        "arguments": ["-c", "print(1)"],
        "environment": {"PATH": "/usr/bin"},
        "working_directory": "/box",
        "mounts": [
            {"host_path": "/usr", "sandbox_path": "/usr"},
            {"host_path": "/srv/box", "sandbox_path": "/box", "mode": "read-write"}
        ],
        "limits": {"max_cpu_time": 1.5, "max_memory": 268435456, "max_wall_time": null},
        "stdout": {"type": "file", "path": "/tmp/out"},
        "mount_tmpfs": true,
        "cpu_core": 1,
        "syscall_filter": {
            "default_action": {"type": "allow"},
            "rules": [{"syscall": "ptrace", "action": {"type": "errno", "errno": 1}}]
        },
        "isolation": "degraded",
        "monitor_interval_ms": 5
    })json");

    sandbox_configuration config;
    from_json(j, config);
    EXPECT_EQ(config.executable, "/usr/bin/python3");
    EXPECT_EQ(config.arguments, (vector<string>{"-c", "print(1)"}));
    EXPECT_EQ(config.environment.at("PATH"), "/usr/bin");
    EXPECT_EQ(config.working_directory, "/box");
    ASSERT_EQ(config.mounts.size(), 2u);
    EXPECT_EQ(config.mounts[0].mode, access_mode::read_only);
    EXPECT_EQ(config.mounts[1].mode, access_mode::read_write);
    EXPECT_EQ(config.limits.max_cpu_time, 1.5);
    EXPECT_EQ(config.limits.max_memory, 268435456u);
    EXPECT_FALSE(config.limits.max_wall_time);
    EXPECT_EQ(config.stdout_target, stream_target::file("/tmp/out"));
    EXPECT_EQ(config.stdin_target, stream_target::null_device());
    EXPECT_TRUE(config.mount_tmpfs);
    EXPECT_EQ(config.cpu_core, 1);
    ASSERT_TRUE(config.filter);
    EXPECT_EQ(config.filter->default_action, syscall_action::allow());
    ASSERT_EQ(config.filter->rules.size(), 1u);
    EXPECT_EQ(config.filter->rules[0].second, syscall_action::error(EPERM));
    EXPECT_EQ(config.isolation, isolation_mode::degraded);
    EXPECT_EQ(config.monitor_interval.count(), 5);
}

TEST(SerializationTest, MissingKeysKeepExistingValues) {
    sandbox_configuration config;
    config.set_executable("/bin/cat").set_wall_time_limit(2);
    config.share_network = true;

    from_json(json::parse(R"({"arguments": ["a"]})"), config);
    EXPECT_EQ(config.executable, "/bin/cat");
    EXPECT_EQ(config.limits.max_wall_time, 2.0);
    EXPECT_TRUE(config.share_network);
    EXPECT_EQ(config.arguments, vector<string>{"a"});
}

TEST(SerializationTest, ConfigurationRoundTrip) {
    sandbox_configuration config;
    config.set_executable("/bin/sh")
        .add_argument("-c")
        .add_argument("exit 0")
        .set_env("A", "1")
        .add_mount("/bin", "/bin")
        .set_memory_limit(1 << 26);
    config.stderr_target = stream_target::descriptor(7);
    config.filter = syscall_filter::build(false, true);

    json j = config;
    sandbox_configuration read;
    from_json(j, read);
    EXPECT_EQ(json(read), j);
    EXPECT_EQ(read.stderr_target, stream_target::descriptor(7));
    EXPECT_EQ(read.mounts, config.mounts);
}

TEST(SerializationTest, StreamWithoutTypeIsRejected) {
    sandbox_configuration config;
    EXPECT_THROW(from_json(json::parse(R"({"stdout": {"path": "/x"}})"), config), json::exception);
}

TEST(SerializationTest, ResultToJson) {
    resource_usage usage;
    usage.user_time = 0.5;
    usage.system_time = 0.25;
    usage.wall_time = 1;
    usage.peak_memory = 1024;
    sandbox_result result(sandbox_status::limit_exceeded(limit_kind::memory), usage, "full-isolation", false);

    json j = result;
    EXPECT_EQ(j["status"], "limit-exceeded");
    EXPECT_EQ(j["limit"], "memory");
    EXPECT_EQ(j["usage"]["cpu_time"], 0.75);
    EXPECT_EQ(j["usage"]["peak_memory"], 1024);
    EXPECT_EQ(j["strategy"], "full-isolation");
    EXPECT_EQ(j["reduced_guarantees"], false);
    EXPECT_FALSE(j.contains("message"));

    auto read = j.get<sandbox_result>();
    EXPECT_EQ(read.status(), result.status());
    EXPECT_EQ(read.usage(), usage);
}

TEST(SerializationTest, SignaledStatus) {
    json j = sandbox_status::signaled(SIGSEGV);
    EXPECT_EQ(j, json::parse(R"({"status": "signaled", "signal": 11})"));
    EXPECT_EQ(j.get<sandbox_status>(), sandbox_status::signaled(SIGSEGV));
}
