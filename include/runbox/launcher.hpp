#pragma once

#include <sys/types.h>
#include <array>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "runbox/configuration.hpp"
#include "runbox/result.hpp"

namespace runbox {

/**
 * @brief 目标程序的标准输入输出
 * 所有文件在父进程中打开（宿主机路径），描述符编号不小于 3 并带有 FD_CLOEXEC，
 * 子进程在 execve 之前才通过 dup2 接到 0、1、2 上。
 */
class stdio_redirection {
public:
    /**
     * @throw sandbox_error(spawn_failed) 当文件无法打开时
     */
    explicit stdio_redirection(const sandbox_configuration &config);
    stdio_redirection(const stdio_redirection &) = delete;
    stdio_redirection &operator=(const stdio_redirection &) = delete;
    ~stdio_redirection();

    /**
     * @brief 标准流 stream（0、1、2）对应的描述符
     */
    int fd(int stream) const;

    /**
     * @brief 将描述符接到 0、1、2 上，只能在子进程中调用
     * @throw std::system_error
     */
    void apply() const;

    /**
     * @brief 关闭所有描述符，可以重复调用
     */
    void close_all() noexcept;

private:
    int open_target(const stream_target &target, int stream);

    std::array<int, 3> fds{-1, -1, -1};
    std::vector<int> owned;
};

/**
 * @brief 子进程 execve 所需的全部数据，在 fork 之前准备好
 */
class exec_plan {
public:
    exec_plan(const sandbox_configuration &config, bool drop_capabilities);
    exec_plan(const exec_plan &) = delete;
    exec_plan &operator=(const exec_plan &) = delete;

    const std::string &executable() const;
    char *const *argv() const;
    char *const *envp() const;

    /**
     * @brief 在子进程中设置工作目录、资源限制、CPU 亲和性和标准流，加载系统调用过滤器并执行目标程序
     * 只在 execve 失败或者准备工作失败时返回：此时已经通过 status_fd 报告了错误，并退出子进程。
     * @param status_fd 报告错误的管道
     */
    [[noreturn]] void exec(const stdio_redirection &stdio, int status_fd) const noexcept;

private:
    std::string executable_;
    std::vector<std::string> args;
    std::vector<std::string> env;
    std::vector<char *> argv_;
    std::vector<char *> envp_;
    std::filesystem::path working_directory;
    resource_limits limits;
    std::optional<int> cpu_core;
    std::optional<syscall_filter> filter;
    bool drop_capabilities;
};

/**
 * @brief 设置资源限制
 * CPU 时间的软限制为向上取整后的秒数，硬限制再加一秒，超过软限制时内核发送 SIGXCPU。
 * 同时禁止生成 core dump。
 * @throw std::system_error 当 setrlimit 失败时
 */
void set_resource_limits(const resource_limits &limits);

/**
 * @brief 目标程序结束时通过 wait 获得的信息
 */
struct exit_report {
    /**
     * @brief wait status
     */
    int status = 0;

    /**
     * @brief 由内核统计的 CPU 时间
     */
    resource_usage usage;

    /**
     * @brief 为 false 时 status 不是目标程序本身的退出状态（比如目标程序所在的命名空间被整体杀死）
     */
    bool from_target = true;
};

/**
 * @brief 正在运行的目标程序
 *
 * 等待分两步：先在不回收进程的情况下等待进程结束，在锁内标记为已退出，然后才回收。
 * 因此进程号在标记之前不会被复用，而标记之后 kill() 不会再发送信号，
 * 并发的 kill() 和 wait() 是安全的。
 * 子类的析构函数需要调用 ensure_reaped()。
 */
class running_process {
public:
    explicit running_process(pid_t pid);
    running_process(const running_process &) = delete;
    running_process &operator=(const running_process &) = delete;
    virtual ~running_process();

    /**
     * @brief 被监视的进程树的根在宿主机上的进程号
     */
    pid_t pid() const;

    /**
     * @brief 资源统计时是否包括根进程本身
     */
    virtual bool account_root() const = 0;

    /**
     * @brief 用 SIGKILL 杀死所有相关进程
     * @return 进程已经退出时返回 false，不发送任何信号
     */
    bool kill() noexcept;

    bool exited() const;

    /**
     * @brief 阻塞直到进程结束并标记为已退出，但不回收，此后 kill() 不再发送信号
     * @throw std::system_error 当 wait 失败时
     */
    void wait_exit();

    /**
     * @brief 回收已经结束的进程，只能在 wait_exit() 之后调用一次
     * @throw std::system_error 当 wait 失败时
     */
    exit_report reap();

    /**
     * @brief 等待进程结束并回收
     */
    exit_report wait();

    /**
     * @brief 杀死并回收尚未回收的进程，用于异常路径
     */
    void ensure_reaped() noexcept;

protected:
    /**
     * @brief 阻塞直到进程结束，但不回收进程
     */
    virtual void wait_for_termination() = 0;

    /**
     * @brief 发送 SIGKILL，调用时持有锁且进程尚未标记为已退出
     */
    virtual void signal_all() noexcept = 0;

    /**
     * @brief 回收进程，调用时进程已经结束
     */
    virtual exit_report reap_exited() = 0;

    pid_t pid_;

private:
    mutable std::mutex exit_mutex;
    bool exited_ = false;
    bool reaped = false;
};

/**
 * @brief 将 rusage 中的 CPU 时间转换为资源使用情况
 * ru_maxrss 包含了子进程 execve 之前从父进程复制来的内存映像，不能作为目标程序的内存峰值，
 * 内存峰值只来自资源监视器读取的 VmHWM 和 cgroup。
 */
resource_usage usage_from_rusage(const struct rusage &ru);

/**
 * @brief 阻塞等待进程结束，但不回收
 * @throw std::system_error
 */
void wait_without_reaping(pid_t pid);

/**
 * @brief 回收进程，EINTR 时重试
 * @throw std::system_error
 */
pid_t reap_process(pid_t pid, int *status, struct rusage *ru);

}  // namespace runbox
