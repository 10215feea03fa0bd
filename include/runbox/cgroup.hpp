#pragma once

#include <sys/types.h>
#include <cstdint>
#include <optional>
#include <string>

namespace runbox {

/**
 * @brief cgroup 统计的资源使用情况
 */
struct cgroup_usage {
    double user_time = 0;
    double system_time = 0;
    uint64_t peak_memory = 0;
};

/**
 * @brief 一次运行专用的 cgroup
 * 在父 cgroup 下创建名字唯一的子 cgroup，并在 release() 时杀死其中所有进程再删除。
 */
class cgroup_accounting {
public:
    /**
     * @param parent 父 cgroup 的名称，比如 /runbox
     * @param memory_limit 内存限制，超出时内核会触发 OOM
     * @throw sandbox_error(cgroup_failed)
     */
    cgroup_accounting(const std::string &parent, std::optional<uint64_t> memory_limit);
    cgroup_accounting(const cgroup_accounting &) = delete;
    cgroup_accounting &operator=(const cgroup_accounting &) = delete;
    ~cgroup_accounting();

    const std::string &name() const;

    /**
     * @throw sandbox_error(cgroup_failed)
     */
    void attach(pid_t pid);

    /**
     * @brief 读取 memory 和 cpuacct 的统计值
     * @throw sandbox_error(cgroup_failed)
     */
    cgroup_usage read() const;

    /**
     * @brief cgroup 中是否有进程因为超出内存限制被 OOM killer 杀死
     */
    bool oom_killed() const;

    /**
     * @brief 杀死 cgroup 中的所有进程
     */
    void kill_all() noexcept;

    /**
     * @brief 杀死所有进程并删除 cgroup，可以重复调用
     */
    void release() noexcept;

private:
    std::string name_;
    bool released = false;
};

}  // namespace runbox
