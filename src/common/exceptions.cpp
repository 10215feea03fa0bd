#include "runbox/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace runbox {
using namespace std;

runbox_exception::runbox_exception()
    : runbox_exception("") {}

runbox_exception::runbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

const char *get_display_message(error_kind kind) {
    switch (kind) {
        case error_kind::mount_failed: return "mount failed";
        case error_kind::namespace_creation_failed: return "namespace creation failed";
        case error_kind::pivot_failed: return "pivot failed";
        case error_kind::spawn_failed: return "spawn failed";
        case error_kind::unsupported_platform: return "unsupported platform";
        case error_kind::invalid_configuration: return "invalid configuration";
        case error_kind::cgroup_failed: return "cgroup failed";
    }
    return "unknown error";
}

sandbox_error::sandbox_error(error_kind kind, const string &message)
    : runbox_exception(message), error_kind_(kind) {}

error_kind sandbox_error::kind() const noexcept {
    return error_kind_;
}

internal_error::internal_error()
    : runbox_exception() {}

internal_error::internal_error(const string &message)
    : runbox_exception(message) {}

}  // namespace runbox
