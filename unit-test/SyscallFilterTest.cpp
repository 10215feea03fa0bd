#include <errno.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include "gtest/gtest.h"
#include "runbox/common/exceptions.hpp"
#include "runbox/syscall_filter.hpp"

using namespace std;
using namespace runbox;

static bool has_rule(const syscall_filter &filter, const string &name, syscall_action action) {
    return find(filter.rules.begin(), filter.rules.end(), make_pair(name, action)) != filter.rules.end();
}

/**
 * @brief 在子进程中加载过滤器并调用 getppid，返回子进程的 wait status
 * 子进程在 getppid 返回 -1 且 errno 为 EPERM 时以 1 退出，正常返回时以 0 退出。
 */
static int run_filtered_getppid(const syscall_filter &filter) {
    pid_t pid = fork();
    if (pid == 0) {
        try {
            filter.load();
        } catch (...) {
            _exit(2);
        }
        long ret = syscall(SYS_getppid);
        _exit(ret == -1 && errno == EPERM ? 1 : 0);
    }
    int status = 0;
    waitpid(pid, &status, 0);
    return status;
}

TEST(SyscallFilterTest, BuildBlocksForkAndChmod) {
    auto filter = syscall_filter::build(false, false);
    EXPECT_EQ(filter.default_action, syscall_action::allow());
    EXPECT_TRUE(has_rule(filter, "fork", syscall_action::kill()));
    EXPECT_TRUE(has_rule(filter, "clone", syscall_action::kill()));
    EXPECT_TRUE(has_rule(filter, "chmod", syscall_action::kill()));

    filter = syscall_filter::build(true, true);
    EXPECT_TRUE(filter.rules.empty());
}

TEST(SyscallFilterTest, UnknownSyscallIsRejected) {
    syscall_filter filter;
    filter.add_rule("read", syscall_action::allow()).add_rule("no_such_syscall", syscall_action::allow());
    try {
        filter.validate();
        FAIL() << "unknown system call was accepted";
    } catch (sandbox_error &e) {
        EXPECT_EQ(e.kind(), error_kind::invalid_configuration);
    }
}

TEST(SyscallFilterTest, InvalidErrnoIsRejected) {
    syscall_filter filter;
    filter.add_rule("getppid", syscall_action::error(0));
    EXPECT_THROW(filter.validate(), sandbox_error);

    filter.rules.clear();
    filter.add_rule("getppid", syscall_action::error(EPERM));
    EXPECT_NO_THROW(filter.validate());
}

TEST(SyscallFilterTest, KillActionRaisesSigsys) {
    syscall_filter filter;
    filter.set_default_action(syscall_action::allow()).add_rule("getppid", syscall_action::kill());

    int status = run_filtered_getppid(filter);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGSYS);
}

TEST(SyscallFilterTest, ErrorActionReturnsErrno) {
    syscall_filter filter;
    filter.set_default_action(syscall_action::allow()).add_rule("getppid", syscall_action::error(EPERM));

    int status = run_filtered_getppid(filter);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 1);
}

TEST(SyscallFilterTest, RuleEqualToDefaultIsIgnored) {
    syscall_filter filter;
    filter.set_default_action(syscall_action::allow()).add_rule("getppid", syscall_action::allow());

    int status = run_filtered_getppid(filter);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
