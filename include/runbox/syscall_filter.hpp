#pragma once

#include <string>
#include <utility>
#include <vector>

namespace runbox {

/**
 * @brief 系统调用过滤规则命中后的动作
 */
struct syscall_action {
    enum class type {
        /**
         * @brief 允许该系统调用
         */
        allow,

        /**
         * @brief 以 SIGSYS 杀死进程
         */
        kill,

        /**
         * @brief 系统调用返回错误码 error_number
         */
        error
    };

    type kind = type::kill;
    int error_number = 0;

    static syscall_action allow();
    static syscall_action kill();
    static syscall_action error(int error_number);

    bool operator==(const syscall_action &other) const;
};

/**
 * @brief seccomp 系统调用过滤器配置
 * 在子进程 execve 之前由 libseccomp 编译并加载，加载之后对目标程序及其子进程都生效。
 */
struct syscall_filter {
    /**
     * @brief 没有规则命中时执行的动作
     */
    syscall_action default_action = syscall_action::kill();

    /**
     * @brief 过滤规则，形如 (系统调用名, 动作)
     */
    std::vector<std::pair<std::string, syscall_action>> rules;

    /**
     * @brief 构建一个拦截常见危险系统调用的过滤器，默认动作为允许
     * @param multiprocess 是否允许创建子进程（fork、vfork、clone）
     * @param chmod 是否允许修改文件权限（chmod、fchmod、fchmodat）
     */
    static syscall_filter build(bool multiprocess, bool chmod);

    syscall_filter &set_default_action(syscall_action action);
    syscall_filter &add_rule(const std::string &syscall, syscall_action action);

    /**
     * @brief 检查所有规则中的系统调用名能被 libseccomp 识别
     * @throw sandbox_error(invalid_configuration) 当存在未知的系统调用名时
     */
    void validate() const;

    /**
     * @brief 在当前进程中加载过滤器
     * 只在沙箱子进程中、execve 之前调用。
     * @throw std::system_error 当 libseccomp 初始化或加载失败时
     */
    void load() const;
};

}  // namespace runbox
