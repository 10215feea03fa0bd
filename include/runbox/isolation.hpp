#pragma once

#include <sys/types.h>
#include <memory>
#include "runbox/launcher.hpp"

namespace runbox {

/**
 * @brief 一次运行的隔离环境
 * 独占本次运行的子进程和管道，析构时保证没有遗留的进程。
 */
class isolation_context {
public:
    virtual ~isolation_context() = default;

    /**
     * @brief 等待启动的子进程在宿主机上的进程号
     */
    virtual pid_t root_pid() const = 0;

    /**
     * @brief 启动目标程序
     * @throw sandbox_error(spawn_failed) 当目标程序无法执行时，此时子进程已经被回收
     */
    virtual std::shared_ptr<running_process> launch() = 0;

    /**
     * @brief 如果目标程序尚未启动，杀死并回收子进程，可以重复调用
     */
    virtual void release() noexcept = 0;
};

/**
 * @brief 在命名空间中等待启动的 init 进程
 *
 * init 进程是新 PID 命名空间中的 1 号进程，目标程序是它的子进程。
 * 命名空间内的进程无法向 1 号进程发送它没有处理的信号，因此目标程序不能作为 1 号进程，
 * 否则它无法被自己杀死。init 进程回收所有孤儿进程，在目标程序结束后通过状态管道转发
 * 目标程序的 wait status 和资源统计，然后退出，命名空间中剩余的进程随之被内核杀死。
 */
class namespace_context : public isolation_context {
public:
    namespace_context(pid_t pid, int status_fd, int control_fd);
    ~namespace_context() override;

    pid_t root_pid() const override;
    std::shared_ptr<running_process> launch() override;
    void release() noexcept override;

    /**
     * @brief 通知 init 进程 uid_map 和 gid_map 已经写好，并等待根目录准备完毕
     * @throw sandbox_error
     */
    void wait_ready();

private:
    pid_t pid;
    int status_fd;
    int control_fd;
    bool launched = false;
};

/**
 * @brief 降级模式：在单独进程组中等待启动的子进程
 */
class process_group_context : public isolation_context {
public:
    process_group_context(pid_t pid, int status_fd, int control_fd);
    ~process_group_context() override;

    pid_t root_pid() const override;
    std::shared_ptr<running_process> launch() override;
    void release() noexcept override;

private:
    pid_t pid;
    int status_fd;
    int control_fd;
    bool launched = false;
};

/**
 * @brief 命名空间中 init 进程的目标程序
 */
class namespace_process : public running_process {
public:
    namespace_process(pid_t init_pid, int status_fd);
    ~namespace_process() override;

    bool account_root() const override;

protected:
    void wait_for_termination() override;
    void signal_all() noexcept override;
    exit_report reap_exited() override;

private:
    int status_fd;
};

/**
 * @brief 进程组的组长
 */
class process_group : public running_process {
public:
    explicit process_group(pid_t pid);
    ~process_group() override;

    bool account_root() const override;

protected:
    void wait_for_termination() override;
    void signal_all() noexcept override;
    exit_report reap_exited() override;
};

/**
 * @brief 在隔离环境中启动目标程序
 * 参数、环境变量和标准流已经在 enter_isolation 时交给了隔离环境。
 * @throw sandbox_error(spawn_failed)
 */
std::shared_ptr<running_process> launch(isolation_context &context);

}  // namespace runbox
