#pragma once

#include <cstdint>
#include <string>

namespace runbox {

/**
 * @brief 被超出的资源限制
 */
enum class limit_kind {
    cpu_time,
    memory,
    wall_time
};

const char *get_display_message(limit_kind kind);

/**
 * @brief 沙箱运行结果的类型
 */
enum class status_kind {
    /**
     * @brief 程序正常退出（不论退出码是多少）
     */
    success,

    /**
     * @brief 程序被信号杀死，且该信号不是资源监视器因为超限发出的
     */
    signaled,

    /**
     * @brief 程序超出了资源限制并被杀死
     */
    limit_exceeded,

    /**
     * @brief 沙箱在程序运行期间出现了意料之外的错误
     */
    internal_error
};

const char *get_display_message(status_kind kind);

/**
 * @brief 运行期间的内部错误类型
 */
enum class internal_error_kind {
    none,

    /**
     * @brief 资源监视器无法读取进程信息
     */
    monitor_failed,

    /**
     * @brief 等待子进程失败，或者子进程的状态无法解释
     */
    wait_failed,

    /**
     * @brief 统计数据不一致
     */
    inconsistent_usage
};

const char *get_display_message(internal_error_kind kind);

/**
 * @brief 资源使用情况
 * 同一次运行中各项数值只会增加。
 */
struct resource_usage {
    /**
     * @brief 用户态 CPU 时间，单位为秒
     */
    double user_time = 0;

    /**
     * @brief 内核态 CPU 时间，单位为秒
     */
    double system_time = 0;

    /**
     * @brief 墙上时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 常驻内存峰值，单位为字节
     */
    uint64_t peak_memory = 0;

    double cpu_time() const;

    /**
     * @brief 逐项取最大值
     */
    void merge(const resource_usage &other);

    bool operator==(const resource_usage &other) const;
};

/**
 * @brief 运行结果的状态，只能通过工厂函数构造
 */
struct sandbox_status {
    status_kind kind = status_kind::success;

    /**
     * @brief kind 为 success 时的退出码
     */
    int exit_code = 0;

    /**
     * @brief kind 为 signaled 时杀死程序的信号
     */
    int signal = 0;

    /**
     * @brief kind 为 limit_exceeded 时被超出的限制
     */
    limit_kind limit = limit_kind::cpu_time;

    /**
     * @brief kind 为 internal_error 时的错误类型
     */
    internal_error_kind error = internal_error_kind::none;

    static sandbox_status success(int exit_code);
    static sandbox_status signaled(int signal);
    static sandbox_status limit_exceeded(limit_kind limit);
    static sandbox_status internal(internal_error_kind error);

    bool operator==(const sandbox_status &other) const;
};

std::string to_string(const sandbox_status &status);

/**
 * @brief 一次沙箱运行的最终结果，创建之后不可修改
 */
class sandbox_result {
public:
    sandbox_result(sandbox_status status, resource_usage usage, std::string strategy, bool reduced_guarantees, bool cancelled = false, std::string message = "");

    const sandbox_status &status() const noexcept;
    const resource_usage &usage() const noexcept;

    /**
     * @brief 本次运行使用的隔离策略名称
     */
    const std::string &strategy() const noexcept;

    /**
     * @brief 为 true 时说明本次运行没有文件系统和命名空间隔离
     */
    bool reduced_guarantees() const noexcept;

    /**
     * @brief 为 true 时说明调用方取消了本次运行
     */
    bool cancelled() const noexcept;

    /**
     * @brief 内部错误的详细信息
     */
    const std::string &message() const noexcept;

private:
    sandbox_status status_;
    resource_usage usage_;
    std::string strategy_;
    bool reduced_guarantees_;
    bool cancelled_;
    std::string message_;
};

}  // namespace runbox
