#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace runbox {

struct runbox_exception : std::exception {
    runbox_exception();
    explicit runbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runbox_exception &ex);

    const char *what() const noexcept override;

protected:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 沙箱在启动目标程序之前失败的原因
 */
enum class error_kind {
    /**
     * @brief 无法构建沙箱的文件系统视图（目标路径冲突、bind mount 失败等）
     */
    mount_failed,

    /**
     * @brief 无法创建命名空间，或者无法写入 uid_map/gid_map
     * 比如内核禁用了非特权用户命名空间
     */
    namespace_creation_failed,

    /**
     * @brief 无法切换到沙箱的根目录
     */
    pivot_failed,

    /**
     * @brief 无法启动目标程序：文件不存在、不可执行，或者 fork/exec 失败
     */
    spawn_failed,

    /**
     * @brief 当前平台不支持所请求的隔离策略
     */
    unsupported_platform,

    /**
     * @brief 沙箱配置不合法
     */
    invalid_configuration,

    /**
     * @brief 无法创建或者操作 cgroup
     */
    cgroup_failed
};

const char *get_display_message(error_kind kind);

/**
 * @brief 沙箱启动阶段的错误
 * 抛出该异常时，本次运行创建的所有资源（挂载点、临时目录、子进程）都已经被清理。
 */
struct sandbox_error : public runbox_exception {
    sandbox_error(error_kind kind, const std::string &message);

    error_kind kind() const noexcept;

    template <typename T>
    sandbox_error operator<<(const T &t) const {
        return sandbox_error(error_kind_, message + boost::lexical_cast<std::string>(t));
    }

private:
    error_kind error_kind_;
};

/**
 * @brief 表示沙箱的内部错误，不应该由用户程序的行为导致
 */
struct internal_error : public runbox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

}  // namespace runbox
