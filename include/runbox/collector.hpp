#pragma once

#include <memory>
#include <optional>
#include <string>
#include "runbox/configuration.hpp"
#include "runbox/launcher.hpp"
#include "runbox/result.hpp"

namespace runbox {

class cgroup_accounting;
class resource_monitor;

/**
 * @brief 判断运行结果所需的全部信息
 */
struct termination {
    /**
     * @brief 资源监视器的错误信息
     */
    std::optional<std::string> monitor_failure;

    /**
     * @brief 资源监视器发现的超限
     */
    std::optional<limit_kind> violation;

    /**
     * @brief cgroup 中是否发生了 OOM
     */
    bool oom = false;

    bool cancelled = false;

    exit_report exit;

    /**
     * @brief 合并后的最终资源使用情况
     */
    resource_usage usage;
};

/**
 * @brief 根据进程的结束方式决定运行结果
 *
 * 优先级从高到低：
 * 1. 监视器出错：InternalError(monitor_failed)
 * 2. 监视器或 cgroup 发现超限：ResourceLimitExceeded
 * 3. 调用方取消：Signaled（取消时发送的信号）
 * 4. 进程收到 SIGXCPU，或者事后发现资源使用超出限制：ResourceLimitExceeded
 * 5. 进程被信号杀死：Signaled；进程正常退出：Success(exit code)
 */
sandbox_status classify(const termination &term, const resource_limits &limits);

/**
 * @brief 等待进程结束并生成唯一的运行结果
 */
class outcome_collector {
public:
    outcome_collector(std::shared_ptr<running_process> process, resource_monitor &monitor,
                      const resource_limits &limits, cgroup_accounting *cgroup);

    /**
     * @brief 等待进程结束，做最后一次采样，回收进程，停止监视器并合并统计
     * 进程启动之后的任何错误都会变成 InternalError 结果，不会抛出异常。
     */
    sandbox_result collect(const std::string &strategy, bool reduced_guarantees);

private:
    std::shared_ptr<running_process> process;
    resource_monitor &monitor;
    const resource_limits &limits;
    cgroup_accounting *cgroup;
};

}  // namespace runbox
