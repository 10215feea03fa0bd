#include "runbox/result.hpp"
#include <fmt/core.h>
#include <string.h>
#include <algorithm>

namespace runbox {
using namespace std;

const char *get_display_message(limit_kind kind) {
    switch (kind) {
        case limit_kind::cpu_time: return "cpu-time";
        case limit_kind::memory: return "memory";
        case limit_kind::wall_time: return "wall-time";
    }
    return "unknown";
}

const char *get_display_message(status_kind kind) {
    switch (kind) {
        case status_kind::success: return "success";
        case status_kind::signaled: return "signaled";
        case status_kind::limit_exceeded: return "limit-exceeded";
        case status_kind::internal_error: return "internal-error";
    }
    return "unknown";
}

const char *get_display_message(internal_error_kind kind) {
    switch (kind) {
        case internal_error_kind::none: return "none";
        case internal_error_kind::monitor_failed: return "monitor-failed";
        case internal_error_kind::wait_failed: return "wait-failed";
        case internal_error_kind::inconsistent_usage: return "inconsistent-usage";
    }
    return "unknown";
}

double resource_usage::cpu_time() const {
    return user_time + system_time;
}

void resource_usage::merge(const resource_usage &other) {
    user_time = max(user_time, other.user_time);
    system_time = max(system_time, other.system_time);
    wall_time = max(wall_time, other.wall_time);
    peak_memory = max(peak_memory, other.peak_memory);
}

bool resource_usage::operator==(const resource_usage &other) const {
    return user_time == other.user_time && system_time == other.system_time &&
           wall_time == other.wall_time && peak_memory == other.peak_memory;
}

sandbox_status sandbox_status::success(int exit_code) {
    sandbox_status status;
    status.kind = status_kind::success;
    status.exit_code = exit_code;
    return status;
}

sandbox_status sandbox_status::signaled(int signal) {
    sandbox_status status;
    status.kind = status_kind::signaled;
    status.signal = signal;
    return status;
}

sandbox_status sandbox_status::limit_exceeded(limit_kind limit) {
    sandbox_status status;
    status.kind = status_kind::limit_exceeded;
    status.limit = limit;
    return status;
}

sandbox_status sandbox_status::internal(internal_error_kind error) {
    sandbox_status status;
    status.kind = status_kind::internal_error;
    status.error = error;
    return status;
}

bool sandbox_status::operator==(const sandbox_status &other) const {
    if (kind != other.kind) return false;
    switch (kind) {
        case status_kind::success: return exit_code == other.exit_code;
        case status_kind::signaled: return signal == other.signal;
        case status_kind::limit_exceeded: return limit == other.limit;
        case status_kind::internal_error: return error == other.error;
    }
    return false;
}

string to_string(const sandbox_status &status) {
    switch (status.kind) {
        case status_kind::success: return fmt::format("Success({})", status.exit_code);
        case status_kind::signaled: return fmt::format("Signaled({}, {})", status.signal, strsignal(status.signal));
        case status_kind::limit_exceeded: return fmt::format("ResourceLimitExceeded({})", get_display_message(status.limit));
        case status_kind::internal_error: return fmt::format("InternalError({})", get_display_message(status.error));
    }
    return "Unknown";
}

sandbox_result::sandbox_result(sandbox_status status, resource_usage usage, string strategy, bool reduced_guarantees, bool cancelled, string message)
    : status_(status), usage_(usage), strategy_(move(strategy)), reduced_guarantees_(reduced_guarantees), cancelled_(cancelled), message_(move(message)) {}

const sandbox_status &sandbox_result::status() const noexcept {
    return status_;
}

const resource_usage &sandbox_result::usage() const noexcept {
    return usage_;
}

const string &sandbox_result::strategy() const noexcept {
    return strategy_;
}

bool sandbox_result::reduced_guarantees() const noexcept {
    return reduced_guarantees_;
}

bool sandbox_result::cancelled() const noexcept {
    return cancelled_;
}

const string &sandbox_result::message() const noexcept {
    return message_;
}

}  // namespace runbox
