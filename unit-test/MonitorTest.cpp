#include <fmt/core.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include "gtest/gtest.h"
#include "runbox/monitor.hpp"

using namespace std;
using namespace runbox;
namespace fs = std::filesystem;

static string stat_line(pid_t pid, const string &comm, pid_t ppid, uint64_t utime, uint64_t stime,
                        uint64_t cutime, uint64_t cstime, uint64_t rss) {
    return fmt::format("{} ({}) S {} {} {} 0 -1 4194560 100 0 0 0 {} {} {} {} 20 0 1 0 12345 1048576 {} 18446744073709551615 0 0 0 0 0 0 0 0 0 0 0 0 17 0 0 0 0 0 0\n",
                       pid, comm, ppid, pid, pid, utime, stime, cutime, cstime, rss);
}

TEST(MonitorTest, ParseProcStat) {
    auto stat = parse_proc_stat(stat_line(42, "cat", 1, 10, 5, 2, 1, 300));
    ASSERT_TRUE(stat);
    EXPECT_EQ(stat->pid, 42);
    EXPECT_EQ(stat->comm, "cat");
    EXPECT_EQ(stat->state, 'S');
    EXPECT_EQ(stat->ppid, 1);
    EXPECT_EQ(stat->utime, 10u);
    EXPECT_EQ(stat->stime, 5u);
    EXPECT_EQ(stat->cutime, 2u);
    EXPECT_EQ(stat->cstime, 1u);
    EXPECT_EQ(stat->rss, 300u);
}

TEST(MonitorTest, ParseProcStatWithSpacesAndParens) {
    auto stat = parse_proc_stat(stat_line(7, "a) b (c", 3, 1, 2, 3, 4, 5));
    ASSERT_TRUE(stat);
    EXPECT_EQ(stat->comm, "a) b (c");
    EXPECT_EQ(stat->ppid, 3);
    EXPECT_EQ(stat->rss, 5u);
}

TEST(MonitorTest, ParseProcStatRejectsGarbage) {
    EXPECT_FALSE(parse_proc_stat(""));
    EXPECT_FALSE(parse_proc_stat("12 (truncated) S 1 2"));
    EXPECT_FALSE(parse_proc_stat("abc (x) S 1 2 3 4 5 6 7 8 9 10 11 12 13 14 15 16 17 18 19 20 21 22"));
}

class MonitorTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        proc = fs::path(::testing::TempDir()) / fmt::format("runbox-proc-{}", getpid());
        fs::remove_all(proc);
        fs::create_directories(proc);
    }

    void TearDown() override {
        fs::remove_all(proc);
    }

    void add_process(pid_t pid, pid_t ppid, uint64_t utime, uint64_t stime, uint64_t cutime, uint64_t cstime,
                     uint64_t rss_pages, uint64_t hwm_kb) {
        fs::path dir = proc / to_string(pid);
        fs::create_directories(dir);
        ofstream(dir / "stat") << stat_line(pid, "proc " + to_string(pid), ppid, utime, stime, cutime, cstime, rss_pages);
        ofstream(dir / "status") << "Name:\tproc\nVmPeak:\t  99999 kB\nVmHWM:\t" << hwm_kb << " kB\nVmRSS:\t 1 kB\n";
    }

    fs::path proc;
};

TEST_F(MonitorTreeTest, SumsDescendantsOnly) {
    const double ticks = sysconf(_SC_CLK_TCK);
    const uint64_t page = sysconf(_SC_PAGESIZE);

    add_process(100, 1, ticks, 0, 0, 0, 10, 0);
    add_process(101, 100, ticks, ticks, 0, 0, 20, 0);
    add_process(102, 101, 0, ticks, 0, 0, 30, 0);
    add_process(200, 1, 50 * ticks, 50 * ticks, 0, 0, 1000, 0);  // 不属于这棵进程树

    tree_sample sample = sample_process_tree(100, true, proc);
    EXPECT_EQ(sample.processes, 3u);
    EXPECT_DOUBLE_EQ(sample.user_time, 2);
    EXPECT_DOUBLE_EQ(sample.system_time, 2);
    EXPECT_EQ(sample.memory, 60 * page);
}

TEST_F(MonitorTreeTest, RootOnlyContributesReapedChildren) {
    const double ticks = sysconf(_SC_CLK_TCK);

    add_process(100, 1, 10 * ticks, 10 * ticks, ticks, 2 * ticks, 10, 0);
    add_process(101, 100, ticks, 0, 0, 0, 20, 0);

    tree_sample sample = sample_process_tree(100, false, proc);
    EXPECT_EQ(sample.processes, 1u);
    EXPECT_DOUBLE_EQ(sample.user_time, 2);
    EXPECT_DOUBLE_EQ(sample.system_time, 2);
}

TEST_F(MonitorTreeTest, PeakResidentSetWins) {
    const uint64_t page = sysconf(_SC_PAGESIZE);

    add_process(100, 1, 0, 0, 0, 0, 1, 64 * 1024);
    add_process(101, 100, 0, 0, 0, 0, 1, 0);

    tree_sample sample = sample_process_tree(100, true, proc);
    EXPECT_EQ(sample.memory, max<uint64_t>(2 * page, 64ull * 1024 * 1024));
}

TEST_F(MonitorTreeTest, MissingRootIsEmpty) {
    add_process(100, 1, 1, 1, 0, 0, 1, 0);

    tree_sample sample = sample_process_tree(999, true, proc);
    EXPECT_EQ(sample.processes, 0u);
    EXPECT_EQ(sample.memory, 0u);
}

TEST(MonitorTest, MergeKeepsMaximum) {
    resource_usage a, b;
    a.user_time = 1;
    a.peak_memory = 100;
    b.user_time = 0.5;
    b.system_time = 0.2;
    b.peak_memory = 200;
    a.merge(b);
    EXPECT_DOUBLE_EQ(a.user_time, 1);
    EXPECT_DOUBLE_EQ(a.system_time, 0.2);
    EXPECT_EQ(a.peak_memory, 200u);
}
