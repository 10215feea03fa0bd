#include "runbox/channel.hpp"
#include <errno.h>
#include <string.h>
#include <unistd.h>
#include "runbox/common/utils.hpp"

namespace runbox {
using namespace std;

child_report make_report(child_stage stage, int error, const string &detail) noexcept {
    child_report report;
    memset(&report, 0, sizeof(report));
    report.stage = stage;
    report.error = error;
    strncpy(report.detail, detail.c_str(), sizeof(report.detail) - 1);
    return report;
}

void accumulate_usage(child_report &report, const struct rusage &usage) noexcept {
    report.user_usec += (int64_t)usage.ru_utime.tv_sec * 1000000 + usage.ru_utime.tv_usec;
    report.system_usec += (int64_t)usage.ru_stime.tv_sec * 1000000 + usage.ru_stime.tv_usec;
}

bool send_report(int fd, const child_report &report) noexcept {
    ssize_t ret;
    do {
        ret = write(fd, &report, sizeof(report));
    } while (ret < 0 && errno == EINTR);
    return ret == (ssize_t)sizeof(report);
}

bool receive_report(int fd, child_report &report) {
    char *buf = reinterpret_cast<char *>(&report);
    size_t got = 0;
    while (got < sizeof(report)) {
        ssize_t ret = read(fd, buf + got, sizeof(report) - got);
        if (ret < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN && got == 0) return false;
            system_failure(errno, "unable to read from status pipe");
        }
        if (ret == 0) break;
        got += ret;
    }
    if (got == 0) return false;
    if (got != sizeof(report))
        system_failure(EPROTO, "truncated report from sandbox process ({} bytes)", got);
    return true;
}

void fail_child(int fd, child_stage stage, int error, const string &detail) noexcept {
    send_report(fd, make_report(stage, error, detail));
    _exit(127);
}

}  // namespace runbox
