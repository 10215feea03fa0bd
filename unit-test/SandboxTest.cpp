#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include "gtest/gtest.h"
#include "runbox/common/exceptions.hpp"
#include "runbox/common/utils.hpp"
#include "runbox/isolation.hpp"
#include "runbox/launcher.hpp"
#include "runbox/platform.hpp"
#include "runbox/sandbox.hpp"

using namespace std;
using namespace runbox;
namespace fs = std::filesystem;

/**
 * @brief 检查是否还有命令行参数中包含 marker 的进程
 */
static bool process_alive(const string &marker) {
    for (auto &entry : fs::directory_iterator("/proc")) {
        string name = entry.path().filename().string();
        if (!is_number(name)) continue;
        ifstream fin(entry.path() / "cmdline");
        string cmdline((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
        if (cmdline.find(marker) != string::npos) return true;
    }
    return false;
}

class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        workdir = fs::path(::testing::TempDir()) /
                  fmt::format("runbox-sandbox-{}-{}", getpid(), ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(workdir);
        fs::create_directories(workdir);
    }

    void TearDown() override {
        fs::remove_all(workdir);
    }

    virtual sandbox_configuration make_config(const fs::path &executable) {
        sandbox_configuration config;
        config.set_executable(executable).set_wall_time_limit(10);
        config.isolation = isolation_mode::degraded;
        return config;
    }

    sandbox_configuration shell(const string &script) {
        auto config = make_config("/bin/sh");
        config.add_argument("-c").add_argument(script);
        return config;
    }

    sandbox_configuration helper(const vector<string> &args) {
        auto config = make_config(self());
        config.add_argument("--runbox-test-helper");
        for (auto &arg : args) config.add_argument(arg);
        return config;
    }

    static fs::path self() {
        return fs::read_symlink("/proc/self/exe");
    }

    fs::path workdir;
};

/**
 * @brief 使用用户命名空间完整隔离，宿主机不支持时跳过
 */
class FullIsolationTest : public SandboxTest {
protected:
    void SetUp() override {
        if (!user_namespaces_supported())
            GTEST_SKIP() << "unprivileged user namespaces are not available";
        SandboxTest::SetUp();
    }

    sandbox_configuration make_config(const fs::path &executable) override {
        sandbox_configuration config;
        config.set_executable(executable).set_wall_time_limit(10);
        config.isolation = isolation_mode::full;
        for (const char *dir : {"/bin", "/sbin", "/usr", "/lib", "/lib32", "/lib64", "/etc"})
            if (fs::exists(dir)) config.add_mount(dir, dir);
        config.add_mount(self(), self());
        return config;
    }
};

class DegradedSupervisionTest : public SandboxTest {};

TEST_F(FullIsolationTest, TrueSucceeds) {
    auto result = run_sandbox(make_config("/bin/true"));
    EXPECT_EQ(result.status(), sandbox_status::success(0));
    EXPECT_GT(result.usage().wall_time, 0);
    EXPECT_EQ(result.strategy(), "full-isolation");
    EXPECT_FALSE(result.reduced_guarantees());
    EXPECT_FALSE(result.cancelled());
}

TEST_F(FullIsolationTest, ExitCodeIsReported) {
    EXPECT_EQ(run_sandbox(shell("exit 7")).status(), sandbox_status::success(7));
}

TEST_F(FullIsolationTest, SelfKillIsSignaled) {
    EXPECT_EQ(run_sandbox(shell("kill -9 $$")).status(), sandbox_status::signaled(SIGKILL));
}

TEST_F(FullIsolationTest, WallTimeLimit) {
    auto config = shell("sleep 10");
    config.set_wall_time_limit(0.5);

    elapsed_time timer;
    auto result = run_sandbox(config);
    EXPECT_EQ(result.status(), sandbox_status::limit_exceeded(limit_kind::wall_time));
    EXPECT_GE(result.usage().wall_time, 0.5);
    // 超时之后至多两个采样周期内被杀死，另外留出调度的余量
    EXPECT_LE(result.usage().wall_time, 0.5 + 2 * 0.01 + 0.2);
    EXPECT_LT(timer.seconds(), 3);
}

TEST_F(FullIsolationTest, CpuTimeLimit) {
    auto config = helper({"spin"});
    config.set_cpu_time_limit(0.5);

    auto result = run_sandbox(config);
    EXPECT_EQ(result.status(), sandbox_status::limit_exceeded(limit_kind::cpu_time));
    EXPECT_GE(result.usage().cpu_time(), 0.4);
}

TEST_F(FullIsolationTest, MemoryLimit) {
    auto config = helper({"alloc", "256"});
    config.set_memory_limit(64 << 20);

    auto result = run_sandbox(config);
    EXPECT_EQ(result.status(), sandbox_status::limit_exceeded(limit_kind::memory));
    EXPECT_GT(result.usage().peak_memory, 64u << 20);
}

TEST_F(FullIsolationTest, MemoryBelowLimit) {
    auto config = helper({"alloc", "16"});
    config.set_memory_limit(256 << 20);

    auto result = run_sandbox(config);
    EXPECT_EQ(result.status(), sandbox_status::success(0));
    EXPECT_GE(result.usage().peak_memory, 16u << 20);
}

TEST_F(FullIsolationTest, OnlyConfiguredEnvironmentIsVisible) {
    auto config = make_config("/usr/bin/env");
    config.set_env("FOO", "bar");
    config.stdout_target = stream_target::file(workdir / "env.out");

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::success(0));
    EXPECT_EQ(read_file(workdir / "env.out"), "FOO=bar\n");
}

TEST_F(FullIsolationTest, StreamsAreRedirected) {
    write_file(workdir / "in", "hello sandbox\n");
    auto config = shell("cat; echo oops >&2");
    config.stdin_target = stream_target::file(workdir / "in");
    config.stdout_target = stream_target::file(workdir / "out");
    config.stderr_target = stream_target::file(workdir / "err");

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::success(0));
    EXPECT_EQ(read_file(workdir / "out"), "hello sandbox\n");
    EXPECT_EQ(read_file(workdir / "err"), "oops\n");
}

TEST_F(FullIsolationTest, ReadOnlyMountRejectsWrites) {
    fs::create_directories(workdir / "data");
    auto config = shell("echo x > /data/f");
    config.add_mount(workdir / "data", "/data");
    config.stderr_target = stream_target::file(workdir / "err");

    auto result = run_sandbox(config);
    EXPECT_EQ(result.status().kind, status_kind::success);
    EXPECT_NE(result.status().exit_code, 0);
    EXPECT_FALSE(fs::exists(workdir / "data" / "f"));
    EXPECT_NE(read_file(workdir / "err").find("Read-only file system"), string::npos);
}

TEST_F(FullIsolationTest, ReadWriteMountAcceptsWrites) {
    fs::create_directories(workdir / "data");
    auto config = shell("echo x > /data/f");
    config.add_mount(workdir / "data", "/data", access_mode::read_write);

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::success(0));
    EXPECT_EQ(read_file(workdir / "data" / "f"), "x\n");
}

TEST_F(FullIsolationTest, UnmountedHostPathIsInvisible) {
    fs::create_directories(workdir / "secret");
    auto config = shell(fmt::format("test -e '{}'", (workdir / "secret").string()));

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::success(1));
}

TEST_F(FullIsolationTest, PrivateTmpfsIsWritable) {
    auto config = shell("echo x > /tmp/f && test -f /tmp/f && test -d /dev/shm");
    config.mount_tmpfs = true;

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::success(0));
}

TEST_F(FullIsolationTest, ProcessesDoNotOutliveTheRun) {
    string marker = fmt::format("1000.{}", getpid());
    auto result = run_sandbox(shell(fmt::format("sleep {} & sleep {} & exit 0", marker, marker)));

    EXPECT_EQ(result.status(), sandbox_status::success(0));
    EXPECT_FALSE(process_alive(marker));
}

TEST_F(FullIsolationTest, LimitKillsTheWholeTree) {
    string marker = fmt::format("1001.{}", getpid());
    auto config = shell(fmt::format("sleep {} & sleep {} & wait", marker, marker));
    config.set_wall_time_limit(0.3);

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::limit_exceeded(limit_kind::wall_time));
    EXPECT_FALSE(process_alive(marker));
}

TEST_F(FullIsolationTest, SeparatePidNamespace) {
    auto config = shell("echo $$; test -d /proc/1 && test -d /proc/2");
    config.mount_proc = true;
    config.stdout_target = stream_target::file(workdir / "out");

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::success(0));
    // 沙箱的 init 进程号为 1，目标程序为 2
    EXPECT_EQ(read_file(workdir / "out"), "2\n");
}

TEST_F(FullIsolationTest, SyscallFilterKillsTarget) {
    auto config = make_config("/usr/bin/id");
    config.add_argument("-u");
    config.filter = syscall_filter()
                        .set_default_action(syscall_action::allow())
                        .add_rule("getuid", syscall_action::kill())
                        .add_rule("geteuid", syscall_action::kill());

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::signaled(SIGSYS));
}

TEST_F(FullIsolationTest, ScratchDirectoryIsRemoved) {
    auto count = [] {
        size_t n = 0;
        // 临时目录的名字形如 runbox-XXXXXX
        for (auto &entry : fs::directory_iterator(fs::temp_directory_path())) {
            string name = entry.path().filename().string();
            if (name.size() == 13 && name.rfind("runbox-", 0) == 0) ++n;
        }
        return n;
    };

    size_t before = count();
    sandbox box(make_config("/bin/true"));
    box.run();
    EXPECT_EQ(count(), before);
}

TEST_F(FullIsolationTest, MissingExecutableFailsToSpawn) {
    sandbox box(make_config("/no/such/program"));
    try {
        box.run();
        FAIL() << "run should fail";
    } catch (sandbox_error &e) {
        EXPECT_EQ(e.kind(), error_kind::spawn_failed);
    }
    EXPECT_EQ(box.state(), run_state::torn_down);
    auto history = box.history();
    ASSERT_GE(history.size(), 2u);
    EXPECT_EQ(history[history.size() - 2], run_state::setup_failed);
}

TEST_F(FullIsolationTest, MissingMountSourceFailsToMount) {
    auto config = make_config("/bin/true");
    config.add_mount(workdir / "missing", "/missing");

    try {
        run_sandbox(config);
        FAIL() << "run should fail";
    } catch (sandbox_error &e) {
        EXPECT_EQ(e.kind(), error_kind::mount_failed);
    }
}

TEST_F(FullIsolationTest, NestedMountPointMustExistOnTheHost) {
    for (auto mode : {access_mode::read_write, access_mode::read_only}) {
        fs::create_directories(workdir / "data");
        auto config = make_config("/bin/true");
        config.add_mount(workdir / "data", "/data", mode).add_mount("/bin/true", "/data/true");

        try {
            run_sandbox(config);
            FAIL() << "run should fail";
        } catch (sandbox_error &e) {
            EXPECT_EQ(e.kind(), error_kind::mount_failed);
        }
        // 挂载点不能创建在宿主机的目录中
        EXPECT_TRUE(fs::is_empty(workdir / "data"));
    }
}

TEST_F(FullIsolationTest, NestedMountIntoExistingEntry) {
    fs::create_directories(workdir / "data" / "bin");
    auto config = shell("test -x /data/bin/sh && echo x > /data/f && ! touch /data/bin/x 2>/dev/null");
    config.add_mount(workdir / "data", "/data", access_mode::read_write).add_mount("/bin", "/data/bin");

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::success(0));
    EXPECT_EQ(read_file(workdir / "data" / "f"), "x\n");
    EXPECT_TRUE(fs::is_empty(workdir / "data" / "bin"));
}

TEST_F(FullIsolationTest, ConcurrentRunsComplete) {
    // 另一个线程不断分配内存，clone 出来的子进程不能因此卡住
    atomic<bool> done{false};
    thread allocator([&] {
        while (!done) {
            vector<string> garbage;
            for (int i = 0; i < 1000; ++i) garbage.emplace_back(64 + i % 512, 'x');
        }
    });

    vector<thread> runners;
    atomic<int> succeeded{0};
    for (int i = 0; i < 4; ++i) {
        runners.emplace_back([&, i] {
            for (int round = 0; round < 5; ++round) {
                auto result = run_sandbox(shell(fmt::format("exit {}", i)));
                if (result.status() == sandbox_status::success(i)) ++succeeded;
            }
        });
    }
    for (auto &runner : runners) runner.join();
    done = true;
    allocator.join();

    EXPECT_EQ(succeeded, 20);
}

/**
 * @brief 目标程序启动前子进程已经被外部杀死，launch 应该报错而不是让调用者收到 SIGPIPE
 */
static void expect_launch_fails_after_external_kill(const sandbox_configuration &config, bool full) {
    auto strategy = make_strategy(config.isolation);
    stdio_redirection stdio(config);
    exec_plan plan(config, full);
    auto root = strategy->stage(config);
    auto context = strategy->enter_isolation(config, *root, plan, stdio);

    pid_t pid = context->root_pid();
    ASSERT_EQ(kill(pid, SIGKILL), 0);
    siginfo_t info;
    ASSERT_EQ(waitid(P_PID, pid, &info, WEXITED | WNOWAIT), 0);

    try {
        context->launch();
        FAIL() << "launch should fail";
    } catch (sandbox_error &e) {
        EXPECT_EQ(e.kind(), error_kind::spawn_failed);
    }
    context->release();
    root->teardown();
}

TEST_F(FullIsolationTest, KilledInitFailsToLaunch) {
    expect_launch_fails_after_external_kill(make_config("/bin/true"), true);
}

TEST_F(DegradedSupervisionTest, KilledChildFailsToLaunch) {
    expect_launch_fails_after_external_kill(make_config("/bin/true"), false);
}

TEST_F(DegradedSupervisionTest, TrueSucceeds) {
    auto result = run_sandbox(make_config("/bin/true"));
    EXPECT_EQ(result.status(), sandbox_status::success(0));
    EXPECT_GT(result.usage().wall_time, 0);
    EXPECT_EQ(result.strategy(), "degraded-supervision");
    EXPECT_TRUE(result.reduced_guarantees());
}

TEST_F(DegradedSupervisionTest, SelfKillIsSignaled) {
    EXPECT_EQ(run_sandbox(shell("kill -9 $$")).status(), sandbox_status::signaled(SIGKILL));
}

TEST_F(DegradedSupervisionTest, WallTimeLimit) {
    auto config = shell("sleep 10");
    config.set_wall_time_limit(0.5);

    auto result = run_sandbox(config);
    EXPECT_EQ(result.status(), sandbox_status::limit_exceeded(limit_kind::wall_time));
    EXPECT_LE(result.usage().wall_time, 0.5 + 2 * 0.01 + 0.2);
}

TEST_F(DegradedSupervisionTest, CpuTimeLimit) {
    auto config = helper({"spin"});
    config.set_cpu_time_limit(0.5);

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::limit_exceeded(limit_kind::cpu_time));
}

TEST_F(DegradedSupervisionTest, MemoryLimit) {
    auto config = helper({"alloc", "256"});
    config.set_memory_limit(64 << 20);

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::limit_exceeded(limit_kind::memory));
}

TEST_F(DegradedSupervisionTest, OnlyConfiguredEnvironmentIsVisible) {
    auto config = make_config("/usr/bin/env");
    config.set_env("FOO", "bar");
    config.stdout_target = stream_target::file(workdir / "env.out");

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::success(0));
    EXPECT_EQ(read_file(workdir / "env.out"), "FOO=bar\n");
}

TEST_F(DegradedSupervisionTest, ProcessesDoNotOutliveTheRun) {
    string marker = fmt::format("1002.{}", getpid());
    auto result = run_sandbox(shell(fmt::format("sleep {} & exit 0", marker)));

    EXPECT_EQ(result.status(), sandbox_status::success(0));
    EXPECT_FALSE(process_alive(marker));
}

TEST_F(DegradedSupervisionTest, SyscallFilterKillsTarget) {
    auto config = make_config("/usr/bin/id");
    config.add_argument("-u");
    config.filter = syscall_filter()
                        .set_default_action(syscall_action::allow())
                        .add_rule("getuid", syscall_action::kill())
                        .add_rule("geteuid", syscall_action::kill());

    EXPECT_EQ(run_sandbox(config).status(), sandbox_status::signaled(SIGSYS));
}

TEST_F(DegradedSupervisionTest, CancelKillsTheTarget) {
    sandbox box(shell("sleep 10"));
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(200));
        box.cancel();
        box.cancel();
    });

    auto result = box.run();
    canceller.join();
    EXPECT_EQ(result.status(), sandbox_status::signaled(SIGKILL));
    EXPECT_TRUE(result.cancelled());
    EXPECT_LT(result.usage().wall_time, 2);
}

TEST_F(DegradedSupervisionTest, CancelBeforeRun) {
    sandbox box(shell("sleep 10"));
    box.cancel();

    auto result = box.run();
    EXPECT_EQ(result.status(), sandbox_status::signaled(SIGKILL));
    EXPECT_TRUE(result.cancelled());
}

TEST_F(DegradedSupervisionTest, StateHistoryAndRepeatedTeardown) {
    sandbox box(make_config("/bin/true"));
    EXPECT_EQ(box.state(), run_state::idle);

    box.run();
    box.teardown();
    box.teardown();

    EXPECT_EQ(box.state(), run_state::torn_down);
    EXPECT_EQ(box.history(), (vector<run_state>{run_state::staging, run_state::isolating, run_state::launching,
                                                run_state::running, run_state::completed, run_state::torn_down}));
}

TEST_F(DegradedSupervisionTest, RunsOnlyOnce) {
    sandbox box(make_config("/bin/true"));
    box.run();
    EXPECT_THROW(box.run(), internal_error);
}

TEST_F(DegradedSupervisionTest, InvalidConfigurationIsRejected) {
    auto config = make_config("/bin/true");
    config.add_mount("relative", "/x");

    sandbox box(config);
    try {
        box.run();
        FAIL() << "run should fail";
    } catch (sandbox_error &e) {
        EXPECT_EQ(e.kind(), error_kind::mount_failed);
    }
    EXPECT_EQ(box.history(), (vector<run_state>{run_state::staging, run_state::setup_failed, run_state::torn_down}));
}
