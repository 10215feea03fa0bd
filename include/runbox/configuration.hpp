#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "runbox/syscall_filter.hpp"

namespace runbox {

/**
 * @brief 挂载点在沙箱内的访问权限
 */
enum class access_mode {
    read_only,
    read_write
};

/**
 * @brief 将宿主机的路径挂载到沙箱内的规则
 */
struct mount_rule {
    /**
     * @brief 宿主机上的路径，必须是绝对路径
     */
    std::filesystem::path host_path;

    /**
     * @brief 沙箱内可见的路径，必须是绝对路径，且不能是 /
     */
    std::filesystem::path sandbox_path;

    access_mode mode = access_mode::read_only;

    bool operator==(const mount_rule &other) const;
};

/**
 * @brief 标准输入输出流的重定向目标
 */
struct stream_target {
    enum class type {
        /**
         * @brief 重定向到 /dev/null
         */
        null_device,

        /**
         * @brief 重定向到宿主机上的文件
         * 标准输入以只读方式打开；标准输出和标准错误会创建或截断该文件。
         */
        file,

        /**
         * @brief 使用调用方提供的文件描述符（比如管道）
         * 调用方负责在沙箱运行结束后关闭该描述符。
         */
        descriptor
    };

    type kind = type::null_device;
    std::filesystem::path path;
    int fd = -1;

    static stream_target null_device();
    static stream_target file(const std::filesystem::path &path);
    static stream_target descriptor(int fd);

    bool operator==(const stream_target &other) const;
};

/**
 * @brief 资源限制，std::nullopt 表示不限制
 */
struct resource_limits {
    /**
     * @brief CPU 时间限制（用户态 + 内核态），单位为秒
     */
    std::optional<double> max_cpu_time;

    /**
     * @brief 内存限制（常驻内存峰值），单位为字节
     */
    std::optional<uint64_t> max_memory;

    /**
     * @brief 墙上时间限制，单位为秒
     */
    std::optional<double> max_wall_time;

    /**
     * @brief 栈空间限制，单位为字节
     */
    std::optional<uint64_t> max_stack;

    /**
     * @brief 单个文件的最大大小，单位为字节
     */
    std::optional<uint64_t> max_file_size;

    /**
     * @brief 当前用户最多能拥有的进程数
     */
    std::optional<uint64_t> max_processes;
};

/**
 * @brief 运行时采用的隔离策略
 */
enum class isolation_mode {
    /**
     * @brief 由 select_strategy() 根据平台决定
     */
    automatic,

    /**
     * @brief 使用用户命名空间完整隔离，不支持时报错
     */
    full,

    /**
     * @brief 只监督进程组并统计资源，不隔离文件系统
     */
    degraded
};

/**
 * @brief 一次沙箱运行的全部配置
 * 沙箱开始运行之后配置不会再被修改。
 */
struct sandbox_configuration {
    /**
     * @brief 目标程序的路径（沙箱内路径），同时作为 argv[0]
     */
    std::filesystem::path executable;

    /**
     * @brief 目标程序的参数，不包括 argv[0]
     */
    std::vector<std::string> arguments;

    /**
     * @brief 目标程序的环境变量，宿主机的环境变量不会被继承
     */
    std::map<std::string, std::string> environment;

    /**
     * @brief 目标程序在沙箱内的工作目录
     */
    std::filesystem::path working_directory = "/";

    /**
     * @brief 挂载规则。实际挂载时会按照沙箱内路径的深度排序（稳定排序）
     */
    std::vector<mount_rule> mounts;

    resource_limits limits;

    stream_target stdin_target;
    stream_target stdout_target;
    stream_target stderr_target;

    /**
     * @brief 是否在 /tmp 和 /dev/shm 挂载私有的 tmpfs
     */
    bool mount_tmpfs = false;

    /**
     * @brief 是否为新的 PID 命名空间挂载 /proc
     */
    bool mount_proc = false;

    /**
     * @brief 是否与宿主机共享网络命名空间
     */
    bool share_network = false;

    /**
     * @brief 目标程序在沙箱内的用户 id 和组 id
     */
    uint32_t uid = 0;
    uint32_t gid = 0;

    /**
     * @brief 将目标程序绑定到指定的 CPU 核心上
     */
    std::optional<int> cpu_core;

    std::optional<syscall_filter> filter;

    /**
     * @brief 如果非空，为本次运行在该父 cgroup 下创建子 cgroup 来统计资源
     */
    std::string cgroup;

    isolation_mode isolation = isolation_mode::automatic;

    /**
     * @brief 资源监视器的采样间隔
     */
    std::chrono::milliseconds monitor_interval{10};

    sandbox_configuration &set_executable(const std::filesystem::path &executable);
    sandbox_configuration &add_argument(const std::string &argument);
    sandbox_configuration &set_env(const std::string &key, const std::string &value);
    sandbox_configuration &set_working_directory(const std::filesystem::path &dir);
    sandbox_configuration &add_mount(const std::filesystem::path &host_path, const std::filesystem::path &sandbox_path, access_mode mode = access_mode::read_only);
    sandbox_configuration &set_cpu_time_limit(double seconds);
    sandbox_configuration &set_memory_limit(uint64_t bytes);
    sandbox_configuration &set_wall_time_limit(double seconds);

    /**
     * @brief 检查配置是否合法
     * @throw sandbox_error(mount_failed) 当挂载规则使用相对路径、挂载到 / 或者沙箱内路径互相重复时
     * @throw sandbox_error(invalid_configuration) 当其他字段不合法时
     */
    void validate() const;
};

/**
 * @brief 计算路径的深度，即路径中文件名部分的个数，/ 的深度为 0
 */
std::size_t path_depth(const std::filesystem::path &path);

/**
 * @brief 按照沙箱内路径的深度对挂载规则进行稳定排序
 * 深度相同的规则保持调用方给出的顺序，保证父目录总是先于子目录挂载。
 */
std::vector<mount_rule> sort_mount_rules(std::vector<mount_rule> rules);

}  // namespace runbox
