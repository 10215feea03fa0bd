#include "runbox/monitor.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>
#include "runbox/cgroup.hpp"
#include "runbox/launcher.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

optional<proc_stat> parse_proc_stat(const string &content) {
    size_t open = content.find('(');
    size_t close = content.rfind(')');
    if (open == string::npos || close == string::npos || close < open)
        return nullopt;

    proc_stat stat;
    try {
        stat.pid = boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(content.substr(0, open)));
    } catch (boost::bad_lexical_cast &) {
        return nullopt;
    }
    stat.comm = content.substr(open + 1, close - open - 1);

    // Fields after the command name, starting from field 3 (state).
    istringstream ss(content.substr(close + 1));
    vector<string> fields;
    string field;
    while (ss >> field) fields.push_back(field);
    if (fields.size() < 22) return nullopt;

    try {
        stat.state = fields[0][0];
        stat.ppid = boost::lexical_cast<pid_t>(fields[1]);
        stat.utime = boost::lexical_cast<uint64_t>(fields[11]);
        stat.stime = boost::lexical_cast<uint64_t>(fields[12]);
        stat.cutime = boost::lexical_cast<uint64_t>(fields[13]);
        stat.cstime = boost::lexical_cast<uint64_t>(fields[14]);
        stat.rss = boost::lexical_cast<uint64_t>(fields[21]);
    } catch (boost::bad_lexical_cast &) {
        return nullopt;
    }
    return stat;
}

/**
 * @brief 读取 /proc/[pid]/status 中的 VmHWM，单位为字节
 */
static uint64_t read_peak_rss(const fs::path &status_file) {
    ifstream fin(status_file);
    string line;
    while (getline(fin, line)) {
        if (boost::algorithm::starts_with(line, "VmHWM:")) {
            istringstream ss(line.substr(6));
            uint64_t kb = 0;
            ss >> kb;
            return kb * 1024;
        }
    }
    return 0;
}

tree_sample sample_process_tree(pid_t root, bool include_root, const fs::path &proc) {
    static const double ticks = sysconf(_SC_CLK_TCK);
    static const uint64_t page_size = sysconf(_SC_PAGESIZE);

    map<pid_t, proc_stat> stats;
    multimap<pid_t, pid_t> children;
    for (auto &entry : fs::directory_iterator(proc)) {
        string name = entry.path().filename().string();
        if (!is_number(name)) continue;

        // Processes may exit at any time during the scan.
        ifstream fin(entry.path() / "stat");
        if (!fin) continue;
        string content((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
        auto stat = parse_proc_stat(content);
        if (!stat) continue;
        children.emplace(stat->ppid, stat->pid);
        stats.emplace(stat->pid, *stat);
    }

    tree_sample sample;
    if (!stats.count(root)) return sample;

    uint64_t rss_pages = 0, peak = 0;
    vector<pid_t> queue{root};
    while (!queue.empty()) {
        pid_t pid = queue.back();
        queue.pop_back();
        const proc_stat &stat = stats.at(pid);

        bool own = pid != root || include_root;
        sample.user_time += ((own ? stat.utime : 0) + stat.cutime) / ticks;
        sample.system_time += ((own ? stat.stime : 0) + stat.cstime) / ticks;
        if (own) {
            ++sample.processes;
            rss_pages += stat.rss;
            peak = max(peak, read_peak_rss(proc / to_string(pid) / "status"));
        }

        auto range = children.equal_range(pid);
        for (auto it = range.first; it != range.second; ++it)
            queue.push_back(it->second);
    }
    sample.memory = max(rss_pages * page_size, peak);
    return sample;
}

resource_monitor::resource_monitor(shared_ptr<running_process> process, const resource_limits &limits,
                                   chrono::milliseconds interval, cgroup_accounting *cgroup)
    : process(move(process)), limits(limits), interval(interval), cgroup(cgroup) {}

resource_monitor::~resource_monitor() {
    stop();
}

void resource_monitor::start() {
    clock = elapsed_time();
    worker = thread([this] { run(); });
}

void resource_monitor::stop() {
    {
        lock_guard<std::mutex> guard(usage_mutex);
        stopping = true;
    }
    stop_signal.notify_all();
    if (worker.joinable()) worker.join();
}

void resource_monitor::run() {
    while (true) {
        sample();

        unique_lock<std::mutex> lock(usage_mutex);
        if (stopping || failure_) break;

        auto wait = interval;
        if (limits.max_wall_time && !violation_) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(
                chrono::duration<double>(*limits.max_wall_time - clock.seconds()));
            if (remaining < wait) wait = max(remaining, chrono::milliseconds(0));
        }
        stop_signal.wait_for(lock, wait, [this] { return stopping; });
        if (stopping) break;
    }
}

void resource_monitor::sample_now() {
    sample();
}

void resource_monitor::sample() {
    resource_usage current;
    current.wall_time = clock.seconds();
    try {
        tree_sample tree = sample_process_tree(process->pid(), process->account_root());
        current.user_time = tree.user_time;
        current.system_time = tree.system_time;
        current.peak_memory = tree.memory;

        if (cgroup) {
            cgroup_usage cg = cgroup->read();
            current.user_time = max(current.user_time, cg.user_time);
            current.system_time = max(current.system_time, cg.system_time);
            current.peak_memory = max(current.peak_memory, cg.peak_memory);
        }
    } catch (exception &e) {
        {
            lock_guard<std::mutex> guard(usage_mutex);
            if (failure_) return;
            failure_ = e.what();
        }
        LOG(ERROR) << "Resource monitor of process " << process->pid() << " failed: " << e.what();
        // Limits can no longer be enforced.
        process->kill();
        return;
    }

    optional<limit_kind> exceeded;
    {
        lock_guard<std::mutex> guard(usage_mutex);
        usage.merge(current);
        if (!violation_) exceeded = violation_ = check_limits(limits, usage);
        else exceeded = nullopt;
    }
    if (exceeded) enforce(*exceeded);
}

void resource_monitor::enforce(limit_kind kind) {
    if (process->kill())
        LOG(INFO) << "Process " << process->pid() << " exceeded " << get_display_message(kind) << " limit, killed";
}

optional<limit_kind> resource_monitor::check_limits(const resource_limits &limits, const resource_usage &usage) {
    if (limits.max_cpu_time && usage.cpu_time() > *limits.max_cpu_time)
        return limit_kind::cpu_time;
    if (limits.max_memory && usage.peak_memory > *limits.max_memory)
        return limit_kind::memory;
    if (limits.max_wall_time && usage.wall_time >= *limits.max_wall_time)
        return limit_kind::wall_time;
    return nullopt;
}

resource_usage resource_monitor::snapshot() const {
    lock_guard<std::mutex> guard(usage_mutex);
    return usage;
}

optional<limit_kind> resource_monitor::violation() const {
    lock_guard<std::mutex> guard(usage_mutex);
    return violation_;
}

optional<string> resource_monitor::failure() const {
    lock_guard<std::mutex> guard(usage_mutex);
    return failure_;
}

void resource_monitor::cancel() {
    if (cancelled_.exchange(true)) return;
    if (process->kill())
        LOG(INFO) << "Process " << process->pid() << " cancelled";
}

bool resource_monitor::cancelled() const {
    return cancelled_;
}

double resource_monitor::elapsed() const {
    return clock.seconds();
}

}  // namespace runbox
