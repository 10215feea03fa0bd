#pragma once

#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "runbox/common/utils.hpp"
#include "runbox/configuration.hpp"
#include "runbox/result.hpp"

namespace runbox {

class running_process;
class cgroup_accounting;

/**
 * @brief /proc/[pid]/stat 中用到的字段，时间的单位为 clock tick
 */
struct proc_stat {
    pid_t pid = 0;
    std::string comm;
    char state = '?';
    pid_t ppid = 0;
    uint64_t utime = 0;
    uint64_t stime = 0;
    uint64_t cutime = 0;
    uint64_t cstime = 0;

    /**
     * @brief 常驻内存，单位为页
     */
    uint64_t rss = 0;
};

/**
 * @brief 解析 /proc/[pid]/stat 的内容
 * 进程名可能包含空格和括号，因此以最后一个右括号作为进程名的结尾。
 * @return 格式不正确时返回 std::nullopt
 */
std::optional<proc_stat> parse_proc_stat(const std::string &content);

/**
 * @brief 一次对进程树的采样结果
 */
struct tree_sample {
    double user_time = 0;
    double system_time = 0;

    /**
     * @brief 所有进程当前常驻内存之和，以及单个进程的 VmHWM 中的最大值，两者取大
     */
    uint64_t memory = 0;

    std::size_t processes = 0;
};

/**
 * @brief 统计以 root 为根的进程树（通过父进程号构建）的资源使用情况
 * CPU 时间为树中每个进程的 utime + stime + cutime + cstime 之和。
 * @param include_root 为 false 时不统计根进程自身的 CPU 时间和内存，只统计它回收的子进程
 * @param proc proc 文件系统的挂载点
 * @throw std::system_error 当 proc 目录无法读取时
 */
tree_sample sample_process_tree(pid_t root, bool include_root, const std::filesystem::path &proc = "/proc");

/**
 * @brief 资源监视器
 *
 * 在单独的线程中周期性地采样目标程序的进程树（以及 cgroup 的统计信息），
 * 将结果逐项取最大值合并进快照。发现超出限制时杀死整个进程树并记录超出的限制。
 * 快照只在锁内读写，调用方任何时候都能读到一致的快照。
 *
 * 检测会在超限后的一个采样间隔内发生，因此墙上时间超限时报告的墙上时间不超过
 * 限制加两个采样间隔（再加上杀死和回收进程的延迟）。
 */
class resource_monitor {
public:
    resource_monitor(std::shared_ptr<running_process> process, const resource_limits &limits,
                     std::chrono::milliseconds interval, cgroup_accounting *cgroup = nullptr);
    resource_monitor(const resource_monitor &) = delete;
    resource_monitor &operator=(const resource_monitor &) = delete;
    ~resource_monitor();

    /**
     * @brief 启动监视线程，墙上时间从此时开始计算
     */
    void start();

    /**
     * @brief 停止监视线程，可以重复调用
     */
    void stop();

    /**
     * @brief 立即采样一次，用于进程结束之后、回收之前的最后一次统计
     */
    void sample_now();

    /**
     * @brief 当前的快照
     */
    resource_usage snapshot() const;

    /**
     * @brief 被超出的限制，没有超限时为 std::nullopt
     */
    std::optional<limit_kind> violation() const;

    /**
     * @brief 监视器无法读取进程信息时的错误信息
     */
    std::optional<std::string> failure() const;

    /**
     * @brief 取消运行：和超限一样杀死整个进程树，可以重复调用，也可以和进程正常退出并发
     */
    void cancel();

    bool cancelled() const;

    /**
     * @brief 从启动开始经过的墙上时间，单位为秒
     */
    double elapsed() const;

    /**
     * @brief 检查资源使用情况是否超出限制
     */
    static std::optional<limit_kind> check_limits(const resource_limits &limits, const resource_usage &usage);

private:
    void run();
    void sample();
    void enforce(limit_kind kind);

    std::shared_ptr<running_process> process;
    resource_limits limits;
    std::chrono::milliseconds interval;
    cgroup_accounting *cgroup;
    elapsed_time clock;

    mutable std::mutex usage_mutex;
    std::condition_variable stop_signal;
    bool stopping = false;
    resource_usage usage;
    std::optional<limit_kind> violation_;
    std::optional<std::string> failure_;
    std::atomic<bool> cancelled_{false};
    std::thread worker;
};

}  // namespace runbox
