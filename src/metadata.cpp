#include "runbox/metadata.hpp"
#include <errno.h>
#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "runbox/common/utils.hpp"

namespace runbox {
using namespace std;

template <typename T>
static void append_meta(ostream &os, const char *key, T message) {
    os << key << ": " << message << endl;
}

string format_metadata(const sandbox_result &result) {
    stringstream ss;
    const sandbox_status &status = result.status();
    const resource_usage &usage = result.usage();

    append_meta(ss, "status", get_display_message(status.kind));
    switch (status.kind) {
        case status_kind::success: append_meta(ss, "exitcode", status.exit_code); break;
        case status_kind::signaled: append_meta(ss, "signal", status.signal); break;
        case status_kind::limit_exceeded: append_meta(ss, "limit", get_display_message(status.limit)); break;
        case status_kind::internal_error:
            if (result.message().empty())
                append_meta(ss, "internal-error", get_display_message(status.error));
            else
                append_meta(ss, "internal-error", fmt::format("{}: {}", get_display_message(status.error), result.message()));
            break;
    }

    append_meta(ss, "wall-time", fmt::format("{:.3f}", usage.wall_time));
    append_meta(ss, "user-time", fmt::format("{:.3f}", usage.user_time));
    append_meta(ss, "sys-time", fmt::format("{:.3f}", usage.system_time));
    append_meta(ss, "cpu-time", fmt::format("{:.3f}", usage.cpu_time()));
    append_meta(ss, "memory-bytes", usage.peak_memory);
    append_meta(ss, "strategy", result.strategy());
    append_meta(ss, "reduced-guarantees", result.reduced_guarantees() ? 1 : 0);
    append_meta(ss, "cancelled", result.cancelled() ? 1 : 0);
    return ss.str();
}

void write_metadata(const filesystem::path &metafile, const sandbox_result &result) {
    ofstream fout(metafile);
    if (!fout) system_failure(errno, "unable to open meta file '{}'", metafile);
    fout << format_metadata(result);
    if (!fout) system_failure(errno, "unable to write meta file '{}'", metafile);
}

map<string, string> read_metadata(const filesystem::path &metafile) {
    map<string, string> mp;
    ifstream fin(metafile);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(": ");
        if (end == string::npos) continue;
        mp[line.substr(0, end)] = line.substr(end + 2);
    }
    return mp;
}

template <typename T>
static void try_to_parse(const map<string, string> &metadata, const char *key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // ignore exception
    }
}

template <typename Kind>
static Kind parse_kind(const string &text, initializer_list<Kind> kinds) {
    for (Kind kind : kinds)
        if (text == get_display_message(kind)) return kind;
    throw invalid_argument("unrecognized value '" + text + "' in meta file");
}

sandbox_result read_result_metadata(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    if (!metadata.count("status"))
        throw invalid_argument(fmt::format("no status in meta file '{}'", metafile));

    sandbox_status status;
    string message;
    status.kind = parse_kind(metadata.at("status"), {status_kind::success, status_kind::signaled, status_kind::limit_exceeded, status_kind::internal_error});
    try_to_parse(metadata, "exitcode", status.exit_code);
    try_to_parse(metadata, "signal", status.signal);
    if (metadata.count("limit"))
        status.limit = parse_kind(metadata.at("limit"), {limit_kind::cpu_time, limit_kind::memory, limit_kind::wall_time});
    if (status.kind == status_kind::internal_error && metadata.count("internal-error")) {
        // "<kind>" or "<kind>: <message>"
        const string &text = metadata.at("internal-error");
        size_t sep = text.find(": ");
        status.error = parse_kind(text.substr(0, sep), {internal_error_kind::none, internal_error_kind::monitor_failed,
                                                        internal_error_kind::wait_failed, internal_error_kind::inconsistent_usage});
        if (sep != string::npos) message = text.substr(sep + 2);
    }

    resource_usage usage;
    try_to_parse(metadata, "wall-time", usage.wall_time);
    try_to_parse(metadata, "user-time", usage.user_time);
    try_to_parse(metadata, "sys-time", usage.system_time);
    try_to_parse(metadata, "memory-bytes", usage.peak_memory);

    string strategy;
    int reduced = 0, cancelled = 0;
    try_to_parse(metadata, "strategy", strategy);
    try_to_parse(metadata, "reduced-guarantees", reduced);
    try_to_parse(metadata, "cancelled", cancelled);
    return sandbox_result(status, usage, strategy, reduced != 0, cancelled != 0, message);
}

}  // namespace runbox
