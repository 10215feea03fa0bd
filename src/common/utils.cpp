#include "runbox/common/utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <algorithm>
#include <climits>
#include <fstream>
#include <sstream>

namespace runbox {
using namespace std;

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), ::isdigit);
}

string read_file(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin) system_failure(errno, "unable to open '{}'", path);
    stringstream ss;
    ss << fin.rdbuf();
    return ss.str();
}

void write_file(const filesystem::path &path, const string &content) {
    int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) system_failure(errno, "unable to open '{}'", path);
    ssize_t written = write(fd, content.data(), content.size());
    int err = errno;
    close(fd);
    if (written != (ssize_t)content.size())
        system_failure(written < 0 ? err : EIO, "unable to write '{}'", path);
}

int close_descriptors_except(vector<int> keep) noexcept {
    sort(keep.begin(), keep.end());
    keep.push_back(INT_MAX);

    int first = 0;
    for (int fd : keep) {
        if (fd < first) continue;
        if (fd > first) {
            int last = fd == INT_MAX ? INT_MAX : fd - 1;
            bool closed = false;
#ifdef __NR_close_range
            closed = syscall(__NR_close_range, (unsigned)first, (unsigned)last, 0) == 0;
#endif
            if (!closed) {
                struct rlimit rl;
                if (getrlimit(RLIMIT_NOFILE, &rl) < 0) return errno;
                int upper = rl.rlim_cur == RLIM_INFINITY ? 65536 : (int)min<rlim_t>(rl.rlim_cur, 65536);
                for (int i = first; i <= last && i < upper; ++i)
                    close(i);
            }
        }
        if (fd == INT_MAX) break;
        first = fd + 1;
    }
    return 0;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace runbox
