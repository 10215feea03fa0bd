#pragma once

#include <sys/resource.h>
#include <cstdint>
#include <string>

namespace runbox {

/**
 * @brief 子进程通过状态管道报告的阶段
 */
enum class child_stage : int32_t {
    /**
     * @brief 无法在命名空间中获得 uid/gid 映射
     */
    user_namespace,

    /**
     * @brief 挂载失败
     */
    mount,

    /**
     * @brief pivot_root 失败
     */
    pivot,

    /**
     * @brief 目标程序无法启动
     */
    spawn,

    /**
     * @brief 沙箱根目录已经准备好，等待启动目标程序
     */
    ready,

    /**
     * @brief 目标程序已经成功 execve
     */
    started,

    /**
     * @brief 目标程序已经退出，status 和资源统计有效
     */
    exited
};

/**
 * @brief 状态管道中传输的消息，长度小于 PIPE_BUF，保证原子写入
 */
struct child_report {
    child_stage stage;
    int32_t error;

    /**
     * @brief stage 为 exited 时，目标程序的 wait status
     */
    int32_t status;

    /**
     * @brief 目标程序及其后代进程的 CPU 时间，单位为微秒
     */
    int64_t user_usec;
    int64_t system_usec;

    char detail[256];
};

child_report make_report(child_stage stage, int error, const std::string &detail) noexcept;

/**
 * @brief 将 rusage 中的 CPU 时间累加进 report
 */
void accumulate_usage(child_report &report, const struct rusage &usage) noexcept;

/**
 * @brief 写入一条消息
 * @return 完整写入时返回 true
 */
bool send_report(int fd, const child_report &report) noexcept;

/**
 * @brief 读取一条消息
 * @return 读到完整的消息时返回 true，对端关闭或者非阻塞模式下没有消息时返回 false
 * @throw std::system_error 当读取失败或者消息不完整时
 */
bool receive_report(int fd, child_report &report);

/**
 * @brief 报告失败并退出子进程，只能在子进程中调用
 */
[[noreturn]] void fail_child(int fd, child_stage stage, int error, const std::string &detail) noexcept;

}  // namespace runbox
