#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "runbox/configuration.hpp"

namespace runbox {

/**
 * @brief 挂载相关的系统调用
 * 所有操作失败时抛出 std::system_error。单元测试通过 mock 该接口来检查挂载顺序。
 */
class mount_ops {
public:
    virtual ~mount_ops() = default;

    /**
     * @brief 在 target 上挂载 tmpfs
     * @param options tmpfs 的挂载参数，比如 "size=256M,mode=0755"
     */
    virtual void mount_tmpfs(const std::filesystem::path &target, const std::string &options) = 0;

    /**
     * @brief 将 source 递归地 bind mount 到 target
     */
    virtual void bind(const std::filesystem::path &source, const std::filesystem::path &target) = 0;

    /**
     * @brief 将 target 上的挂载点重新挂载为只读，保留 nosuid、nodev、noexec 等标志
     * @param recursive 为 true 时 target 下面的所有挂载点也变为只读
     */
    virtual void remount_readonly(const std::filesystem::path &target, bool recursive) = 0;

    /**
     * @brief 在 target 上挂载 proc 文件系统
     */
    virtual void mount_proc(const std::filesystem::path &target) = 0;

    /**
     * @brief 卸载 target 上的挂载点
     */
    virtual void unmount(const std::filesystem::path &target) = 0;

    /**
     * @brief 为挂载点创建目标：source 是目录时创建目录，否则创建空文件
     */
    virtual void create_entry(const std::filesystem::path &source, const std::filesystem::path &target) = 0;

    /**
     * @brief 检查挂载点已经存在并且和 source 同为目录或者同为文件，不做任何修改
     * 用于已经 bind mount 的宿主机目录之下的挂载点，在那里创建文件会修改宿主机。
     */
    virtual void require_entry(const std::filesystem::path &source, const std::filesystem::path &target) = 0;
};

/**
 * @brief 直接调用 mount(2) 和 umount2(2)
 */
class linux_mount_ops : public mount_ops {
public:
    void mount_tmpfs(const std::filesystem::path &target, const std::string &options) override;
    void bind(const std::filesystem::path &source, const std::filesystem::path &target) override;
    void remount_readonly(const std::filesystem::path &target, bool recursive) override;
    void mount_proc(const std::filesystem::path &target) override;
    void unmount(const std::filesystem::path &target) override;
    void create_entry(const std::filesystem::path &source, const std::filesystem::path &target) override;
    void require_entry(const std::filesystem::path &source, const std::filesystem::path &target) override;
};

/**
 * @brief 构建沙箱根目录所需的全部信息
 */
struct staging_plan {
    /**
     * @brief 已经按照深度排序的挂载规则
     */
    std::vector<mount_rule> rules;

    bool mount_tmpfs = false;
    bool mount_proc = false;
};

staging_plan make_staging_plan(const sandbox_configuration &config);

/**
 * @brief 沙箱的根目录
 *
 * 宿主机上的临时目录由父进程创建和删除；挂载操作在子进程的挂载命名空间中进行，
 * 不会出现在宿主机上。对象只记录实际挂载成功的挂载点，卸载时严格按照相反的顺序进行。
 *
 * 降级模式下没有临时目录，根目录就是宿主机的 /。
 */
class staged_root {
public:
    /**
     * @param scratch 临时目录，为空时表示使用宿主机的根目录（降级模式）
     */
    staged_root(std::filesystem::path scratch, std::shared_ptr<mount_ops> ops);
    staged_root(const staged_root &) = delete;
    staged_root &operator=(const staged_root &) = delete;
    ~staged_root();

    /**
     * @brief 沙箱根目录在宿主机（或者挂载命名空间）中的位置
     */
    std::filesystem::path root() const;

    /**
     * @brief 是否只是宿主机的根目录
     */
    bool is_host_root() const;

    /**
     * @brief 在根目录上挂载 tmpfs、设备文件和挂载规则，最后将根目录设为只读
     * 失败时会先按相反的顺序卸载已经挂载的挂载点，再抛出异常。
     * @throw sandbox_error(mount_failed)
     */
    void stage(const staging_plan &plan);

    /**
     * @brief 已经挂载的挂载点，按照挂载的顺序排列
     */
    const std::vector<std::filesystem::path> &mounted() const;

    /**
     * @brief 按照挂载的相反顺序卸载所有挂载点
     * @return 所有挂载点都卸载成功时返回 true
     */
    bool unmount_all() noexcept;

    /**
     * @brief 卸载所有挂载点并删除临时目录，可以重复调用
     */
    void teardown() noexcept;

    bool torn_down() const;

private:
    void mount_step(const std::filesystem::path &target, const std::function<void()> &action);

    std::filesystem::path scratch;
    std::shared_ptr<mount_ops> ops;
    std::vector<std::filesystem::path> mounted_so_far;
    bool finished = false;
};

/**
 * @brief 在系统临时目录下创建本次运行的临时根目录
 * @throw sandbox_error(mount_failed) 当临时目录无法创建时
 */
std::unique_ptr<staged_root> create_staged_root(std::shared_ptr<mount_ops> ops);

/**
 * @brief 降级模式使用的根目录：宿主机的 /
 */
std::unique_ptr<staged_root> host_root();

/**
 * @brief path 是否等于 ancestor 或者位于 ancestor 之下，只比较路径的各个部分
 */
bool is_beneath(const std::filesystem::path &ancestor, const std::filesystem::path &path);

/**
 * @brief 从 /proc/self/mountinfo 的内容中找出 target 之下的所有挂载点，不包括 target 本身
 */
std::vector<std::filesystem::path> mounts_beneath(const std::filesystem::path &target, const std::string &mountinfo);

/**
 * @brief 沙箱内必须存在的设备文件
 */
extern const std::vector<std::filesystem::path> sandbox_devices;

}  // namespace runbox
