#include "runbox/cgroup.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <signal.h>
#include <stdlib.h>
#include <unistd.h>
#include <atomic>
#include <fstream>
#include <mutex>
#include "runbox/common/exceptions.hpp"

namespace runbox {
using namespace std;

namespace {

string libcgroup_error(int ret) {
    // ECGOTHER 表示真正的错误码保存在 errno 中
    return cgroup_strerror(ret == ECGOTHER ? cgroup_get_last_errno() : ret);
}

void check(int ret, const string &name, const char *op) {
    if (ret != 0)
        throw sandbox_error(error_kind::cgroup_failed, fmt::format("{}: {}: {}", name, op, libcgroup_error(ret)));
}

void initialize_libcgroup() {
    static once_flag flag;
    static int ret = 0;
    call_once(flag, [] { ret = cgroup_init(); });
    check(ret, "libcgroup", "cgroup_init");
}

/**
 * @brief libcgroup 中 cgroup 结构的 RAII 包装
 * 只管理 libcgroup 分配的内存，内核中的 cgroup 需要显式创建和删除
 */
class cgroup_handle {
public:
    explicit cgroup_handle(const string &name) : name(name), cg(cgroup_new_cgroup(name.c_str())) {
        if (!cg) check(ECGOTHER, name, "cgroup_new_cgroup");
    }

    cgroup_handle(const cgroup_handle &) = delete;
    cgroup_handle &operator=(const cgroup_handle &) = delete;

    ~cgroup_handle() {
        cgroup_free(&cg);
    }

    // 从内核读入已有 cgroup 的全部参数
    cgroup_handle &load() {
        check(cgroup_get_cgroup(cg), name, "cgroup_get_cgroup");
        return *this;
    }

    cgroup_controller *controller(const char *subsystem, bool add) {
        cgroup_controller *ctrl = add ? cgroup_add_controller(cg, subsystem) : cgroup_get_controller(cg, subsystem);
        if (!ctrl) check(ECGOTHER, name, subsystem);
        return ctrl;
    }

    void set(cgroup_controller *ctrl, const char *key, int64_t value) {
        check(cgroup_add_value_int64(ctrl, key, value), name, key);
    }

    int64_t get(const char *subsystem, const char *key) {
        int64_t value = 0;
        check(cgroup_get_value_int64(controller(subsystem, false), key, &value), name, key);
        return value;
    }

    void create() {
        check(cgroup_create_cgroup(cg, 1), name, "cgroup_create_cgroup");
    }

    void attach(pid_t pid) {
        check(cgroup_attach_task_pid(cg, pid), name, "cgroup_attach_task_pid");
    }

    // 剩余进程会被移入上一层 cgroup
    void remove() {
        controller("cpuacct", true);
        controller("memory", true);
        check(cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE),
              name, "cgroup_delete_cgroup_ext");
    }

private:
    string name;
    struct cgroup *cg;
};

}  // namespace

static atomic<unsigned> cgroup_counter{0};

cgroup_accounting::cgroup_accounting(const string &parent, optional<uint64_t> memory_limit)
    : name_(fmt::format("{}/run_{}_{}", parent, getpid(), cgroup_counter++)) {
    try {
        initialize_libcgroup();

        cgroup_handle cg(name_);
        cgroup_controller *memory = cg.controller("memory", true);
        if (memory_limit) {
            // memsw 与 memory 取相同的值，超出内存限制时不能借用交换空间
            cg.set(memory, "memory.limit_in_bytes", (int64_t)*memory_limit);
            cg.set(memory, "memory.memsw.limit_in_bytes", (int64_t)*memory_limit);
        }
        cg.controller("cpuacct", true);
        cg.create();
    } catch (sandbox_error &) {
        released = true;
        throw;
    }
    LOG(INFO) << "Created cgroup " << name_;
}

cgroup_accounting::~cgroup_accounting() {
    release();
}

const string &cgroup_accounting::name() const {
    return name_;
}

void cgroup_accounting::attach(pid_t pid) {
    cgroup_handle(name_).load().attach(pid);
}

cgroup_usage cgroup_accounting::read() const {
    cgroup_handle cg(name_);
    cg.load();

    cgroup_usage usage;
    usage.peak_memory = cg.get("memory", "memory.max_usage_in_bytes");
    usage.user_time = cg.get("cpuacct", "cpuacct.usage_user") / 1e9;  // ns
    usage.system_time = cg.get("cpuacct", "cpuacct.usage_sys") / 1e9;
    return usage;
}

bool cgroup_accounting::oom_killed() const {
    char *mount_point = nullptr;
    if (cgroup_get_subsys_mount_point("memory", &mount_point) != 0 || !mount_point)
        return false;
    string path = string(mount_point) + name_ + "/memory.oom_control";
    free(mount_point);

    bool is_oom = false;
    ifstream fin(path);
    while (fin.good()) {
        string token;
        fin >> token;
        if (token == "oom_kill") {
            int count = 0;
            fin >> count;
            is_oom = count > 0;
        }
    }
    return is_oom;
}

void cgroup_accounting::kill_all() noexcept {
    void *handle = nullptr;
    pid_t pid;

    int ret = cgroup_get_task_begin(name_.c_str(), "memory", &handle, &pid);
    while (ret == 0) {
        kill(pid, SIGKILL);
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
}

void cgroup_accounting::release() noexcept {
    if (released) return;
    released = true;

    // No process in the cgroup may outlive the run.
    kill_all();
    try {
        cgroup_handle(name_).remove();
    } catch (sandbox_error &e) {
        LOG(WARNING) << "Unable to delete cgroup " << name_ << ": " << e.what();
    }
}

}  // namespace runbox
