#pragma once

#include <memory>
#include <mutex>
#include <vector>
#include "runbox/configuration.hpp"
#include "runbox/filesystem.hpp"
#include "runbox/result.hpp"

namespace runbox {

class cgroup_accounting;
class isolation_context;
class resource_monitor;
class running_process;

/**
 * @brief 一次运行的状态
 * Staging → Isolating → Launching → Running → {Completed, Signaled, LimitExceeded, SetupFailed} → TornDown，
 * 任何非初始状态都会最终进入 TornDown。
 */
enum class run_state {
    idle,
    staging,
    isolating,
    launching,
    running,

    /**
     * @brief 进程正常退出，或者运行期间出现内部错误
     */
    completed,
    signaled,
    limit_exceeded,
    setup_failed,
    torn_down
};

const char *get_display_message(run_state state);

/**
 * @brief 沙箱：一个配置对应一次运行和一个结果
 *
 * 本次运行创建的临时目录、命名空间、cgroup 和子进程都由这个对象独占，
 * 不论 run() 正常返回还是抛出异常，离开 run() 之前都会被释放。
 * 不同的 sandbox 对象之间没有共享状态，可以在不同线程中同时运行。
 */
class sandbox {
public:
    /**
     * @param ops 挂载操作，为空时使用 linux_mount_ops
     */
    explicit sandbox(sandbox_configuration config, std::shared_ptr<mount_ops> ops = nullptr);
    sandbox(const sandbox &) = delete;
    sandbox &operator=(const sandbox &) = delete;
    ~sandbox();

    /**
     * @brief 运行目标程序，只能调用一次
     * @return 目标程序启动之后的所有结束方式（包括超限和内部错误）
     * @throw sandbox_error 当目标程序启动之前失败时，此时所有资源已经释放
     */
    sandbox_result run();

    /**
     * @brief 取消运行，可以在任意线程中调用任意多次
     * 效果和超出资源限制相同：杀死整个进程树。目标程序尚未启动时，会在启动后立即被杀死。
     */
    void cancel();

    /**
     * @brief 释放本次运行的所有资源，可以重复调用
     */
    void teardown() noexcept;

    run_state state() const;

    /**
     * @brief 经历过的所有状态
     */
    std::vector<run_state> history() const;

    const sandbox_configuration &configuration() const;

private:
    void transition(run_state next);
    sandbox_result execute();

    sandbox_configuration config;
    std::shared_ptr<mount_ops> ops;

    std::unique_ptr<staged_root> root;
    std::unique_ptr<cgroup_accounting> cgroup;
    std::unique_ptr<isolation_context> context;
    std::shared_ptr<running_process> process;

    mutable std::mutex state_mutex;
    run_state state_ = run_state::idle;
    std::vector<run_state> history_;
    bool cancel_requested = false;
    bool started = false;
    resource_monitor *monitor = nullptr;
};

/**
 * @brief 用给定的配置运行一次沙箱
 * @throw sandbox_error
 */
sandbox_result run_sandbox(const sandbox_configuration &config);

}  // namespace runbox
