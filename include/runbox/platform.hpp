#pragma once

#include <functional>
#include <memory>
#include <sys/types.h>
#include "runbox/configuration.hpp"
#include "runbox/filesystem.hpp"
#include "runbox/launcher.hpp"

namespace runbox {

class isolation_context;

/**
 * @brief 隔离策略的种类
 */
enum class strategy_kind {
    /**
     * @brief 使用非特权用户命名空间完整隔离
     */
    full_isolation,

    /**
     * @brief 只监督进程组并统计资源
     */
    degraded_supervision
};

const char *get_display_message(strategy_kind kind);

/**
 * @brief 根据宿主机的操作系统选择隔离策略，结果在进程内只计算一次
 * 不检查命名空间是否真正可用，不可用时会在 enter_isolation 时报错。
 */
strategy_kind select_strategy();

/**
 * @brief 检查非特权用户命名空间是否可用，结果在进程内只计算一次
 * 依次检查 /proc/self/ns/user、/proc/sys/user/max_user_namespaces、
 * /proc/sys/kernel/unprivileged_userns_clone，最后实际创建一个命名空间并挂载 tmpfs。
 */
bool user_namespaces_supported();

/**
 * @brief 在新的命名空间中运行 fn，返回子进程在宿主机上的进程号
 * clone 由一个单线程的辅助进程完成，新进程通过 CLONE_PARENT 成为调用者的子进程，
 * 因此 fn 中可以正常分配内存，不会继承其他线程持有的 malloc 锁。
 * @param flags clone 的 CLONE_NEW* 标志
 * @throw std::system_error 当 clone 失败时
 */
pid_t clone_process(int flags, const std::function<int()> &fn);

/**
 * @brief 隔离策略
 * 调用方只依赖这个接口，只有通过 reduced_guarantees() 才能知道当前是否是降级模式。
 */
class isolation_strategy {
public:
    virtual ~isolation_strategy() = default;

    virtual strategy_kind kind() const = 0;

    /**
     * @brief 是否没有文件系统和命名空间隔离
     */
    virtual bool reduced_guarantees() const = 0;

    /**
     * @brief 准备沙箱的根目录
     * @throw sandbox_error(mount_failed)
     */
    virtual std::unique_ptr<staged_root> stage(const sandbox_configuration &config) = 0;

    /**
     * @brief 创建隔离环境，并让子进程停在启动目标程序之前
     * 失败时已经清理了创建的子进程，调用方负责清理 root。
     * @throw sandbox_error(namespace_creation_failed, mount_failed, pivot_failed, spawn_failed)
     */
    virtual std::unique_ptr<isolation_context> enter_isolation(const sandbox_configuration &config, staged_root &root,
                                                               const exec_plan &plan, const stdio_redirection &stdio) = 0;
};

/**
 * @brief 使用用户、挂载、PID、IPC、UTS（以及网络）命名空间隔离
 */
class full_isolation : public isolation_strategy {
public:
    explicit full_isolation(std::shared_ptr<mount_ops> ops);

    strategy_kind kind() const override;
    bool reduced_guarantees() const override;
    std::unique_ptr<staged_root> stage(const sandbox_configuration &config) override;
    std::unique_ptr<isolation_context> enter_isolation(const sandbox_configuration &config, staged_root &root,
                                                       const exec_plan &plan, const stdio_redirection &stdio) override;

private:
    std::shared_ptr<mount_ops> ops;
};

/**
 * @brief 只把目标程序放在单独的进程组中，不隔离文件系统
 */
class degraded_supervision : public isolation_strategy {
public:
    strategy_kind kind() const override;
    bool reduced_guarantees() const override;
    std::unique_ptr<staged_root> stage(const sandbox_configuration &config) override;
    std::unique_ptr<isolation_context> enter_isolation(const sandbox_configuration &config, staged_root &root,
                                                       const exec_plan &plan, const stdio_redirection &stdio) override;
};

/**
 * @brief 根据配置创建隔离策略
 * @param ops 完整隔离时使用的挂载操作，为空时使用 linux_mount_ops
 * @throw sandbox_error(unsupported_platform) 当要求完整隔离但平台不支持时
 */
std::unique_ptr<isolation_strategy> make_strategy(isolation_mode mode, std::shared_ptr<mount_ops> ops = nullptr);

}  // namespace runbox
