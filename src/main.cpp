#include <fmt/core.h>
#include <glog/logging.h>
#include <pthread.h>
#include <signal.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <cstring>
#include <fstream>
#include <iostream>
#include <thread>
#include "runbox/common/exceptions.hpp"
#include "runbox/common/utils.hpp"
#include "runbox/configuration.hpp"
#include "runbox/metadata.hpp"
#include "runbox/platform.hpp"
#include "runbox/sandbox.hpp"
#include "runbox/serialization.hpp"

using namespace std;

namespace runbox {

/**
 * @brief 解析 --mount 参数：HOST[:SANDBOX][:rw|:ro]
 */
void validate(boost::any &v, const vector<string> &values, mount_rule *, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const &s = validators::get_single_string(values);
    vector<string> parts;
    boost::split(parts, s, boost::is_any_of(":"));
    if (parts.empty() || parts.size() > 3 || parts[0].empty())
        throw validation_error(validation_error::invalid_option_value);

    mount_rule rule;
    rule.host_path = parts[0];
    rule.sandbox_path = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        if (parts[i] == "rw") {
            rule.mode = access_mode::read_write;
        } else if (parts[i] == "ro") {
            rule.mode = access_mode::read_only;
        } else if (i == 1 && !parts[i].empty()) {
            rule.sandbox_path = parts[i];
        } else {
            throw validation_error(validation_error::invalid_option_value);
        }
    }

    v = rule;
}

}  // namespace runbox

using namespace runbox;

static string metafile_path;
static atomic<bool> finished{false};

static void runbox_terminate_handler() {
    exception_ptr cur = current_exception();
    string message = "unknown exception";
    try {
        if (cur) {
            rethrow_exception(cur);
        }
    } catch (const exception &e) {
        message = e.what();
    } catch (...) {
    }
    cerr << message << endl;

    if (!metafile_path.empty()) {
        ofstream metafile(metafile_path, ios::app);
        metafile << "internal-error: " << message << endl;
    }
    _exit(2);
}

/**
 * @brief 将 SIGINT、SIGTERM、SIGUSR1 转换为取消沙箱运行
 * 这些信号在创建任何线程之前就已经被屏蔽，只由这个线程通过 sigwait 处理。
 */
static void forward_signals(sigset_t set, sandbox &box) {
    while (true) {
        int sig = 0;
        if (sigwait(&set, &sig) != 0) return;
        if (finished) return;
        LOG(WARNING) << "Received signal (" << sig << ", " << strsignal(sig) << "), cancelling the sandbox";
        box.cancel();
    }
}

static void set_env_argument(sandbox_configuration &config, const string &arg) {
    auto equal = arg.find('=');
    if (equal == string::npos) {
        const char *value = getenv(arg.c_str());
        if (!value) throw invalid_argument(fmt::format("Variable {} not present in the environment", arg));
        config.set_env(arg, value);
    } else {
        string key = arg.substr(0, equal);
        if (key.empty()) throw invalid_argument(fmt::format("Invalid env argument {}", arg));
        config.set_env(key, arg.substr(equal + 1));
    }
}

static uint64_t kilobytes(uint64_t kb) {
    if (kb > UINT64_MAX / 1024) return UINT64_MAX;
    return kb * 1024;
}

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("runbox options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("time-limit,t", po::value<double>(), "set maximum CPU time (floating point is acceptable) consumption of the command in seconds")
        ("wall-time,w", po::value<double>(), "kill command after wall time clock seconds (floating point is acceptable)")
        ("memory-limit,m", po::value<uint64_t>(), "set maximum memory consumption of the command in KB")
        ("stack-limit", po::value<uint64_t>(), "set maximum stack size of the command in KB")
        ("file-limit", po::value<uint64_t>(), "set maximum created file size of the command in KB")
        ("nproc", po::value<uint64_t>(), "set maximum process living simutanously")
        ("env,E", po::value<vector<string>>()->composing(), "add environment variable KEY=VALUE, or copy KEY from the current environment")
        ("mount,a", po::value<vector<mount_rule>>()->composing(), "make HOST[:SANDBOX][:rw] visible inside the sandbox, read-only unless rw is given")
        ("mount-tmpfs", "mount private tmpfs on /tmp and /dev/shm")
        ("mount-proc", "mount /proc of the sandbox pid namespace")
        ("share-network", "do not isolate network")
        ("working-directory", po::value<string>(), "working directory of the command inside the sandbox")
        ("stdin,i", po::value<string>(), "redirect command standard input fd to file")
        ("stdout,o", po::value<string>(), "redirect command standard output fd to file")
        ("stderr,e", po::value<string>(), "redirect command standard error fd to file")
        ("syscall-filter", po::value<vector<string>>()->composing(), "allow only the given system calls, others kill the command")
        ("deny-syscall", po::value<vector<string>>()->composing(), "kill the command when it invokes the given system call")
        ("cgroup", po::value<string>(), "account the command in a child cgroup of the given cgroup")
        ("cpu-core", po::value<int>(), "run the command on the given processor")
        ("uid", po::value<uint32_t>(), "user id of the command inside the sandbox")
        ("gid", po::value<uint32_t>(), "group id of the command inside the sandbox")
        ("allow-insecure", "run even if only degraded supervision is available")
        ("force-degraded", "use degraded supervision without namespaces (requires --allow-insecure)")
        ("config", po::value<string>(), "load sandbox configuration from JSON file, other options override it")
        ("json", "print the result in JSON format")
        ("out-meta,M", po::value<string>(), "write the result (run time, exitcode, memory usage, ...) to file")
        ("verbose,v", "log to stderr")
        ("cmd", po::value<vector<string>>()->composing(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    if (vm.count("help")) {
        cout << "runbox: Running user program in an unprivileged sandbox with system resource access limitations." << endl
             << "Usage: " << argv[0] << " [options] -- [command]" << endl;
        cout << desc << endl;
        return 0;
    }

    if (vm.count("version")) {
        cout << "runbox" << endl;
        return 0;
    }

    if (vm.count("verbose")) FLAGS_logtostderr = true;
    if (vm.count("out-meta")) metafile_path = vm["out-meta"].as<string>();

    sandbox_configuration config;
    try {
        if (vm.count("config")) {
            auto j = nlohmann::json::parse(read_file(vm["config"].as<string>()));
            from_json(j, config);
        }

        if (vm.count("cmd")) {
            auto cmd = vm["cmd"].as<vector<string>>();
            config.executable = cmd[0];
            config.arguments.assign(cmd.begin() + 1, cmd.end());
        }
        if (config.executable.empty()) throw invalid_argument("no command given");

        if (vm.count("time-limit")) config.set_cpu_time_limit(vm["time-limit"].as<double>());
        if (vm.count("wall-time")) config.set_wall_time_limit(vm["wall-time"].as<double>());
        if (vm.count("memory-limit")) config.set_memory_limit(kilobytes(vm["memory-limit"].as<uint64_t>()));
        if (vm.count("stack-limit")) config.limits.max_stack = kilobytes(vm["stack-limit"].as<uint64_t>());
        if (vm.count("file-limit")) config.limits.max_file_size = kilobytes(vm["file-limit"].as<uint64_t>());
        if (vm.count("nproc")) config.limits.max_processes = vm["nproc"].as<uint64_t>();

        if (vm.count("env"))
            for (auto &arg : vm["env"].as<vector<string>>())
                set_env_argument(config, arg);

        if (vm.count("mount"))
            for (auto &rule : vm["mount"].as<vector<mount_rule>>())
                config.mounts.push_back(rule);

        if (vm.count("mount-tmpfs")) config.mount_tmpfs = true;
        if (vm.count("mount-proc")) config.mount_proc = true;
        if (vm.count("share-network")) config.share_network = true;
        if (vm.count("working-directory")) config.set_working_directory(vm["working-directory"].as<string>());

        if (vm.count("stdin")) config.stdin_target = stream_target::file(vm["stdin"].as<string>());
        if (vm.count("stdout")) config.stdout_target = stream_target::file(vm["stdout"].as<string>());
        if (vm.count("stderr")) config.stderr_target = stream_target::file(vm["stderr"].as<string>());

        if (vm.count("syscall-filter")) {
            syscall_filter filter;
            filter.set_default_action(syscall_action::kill());
            for (auto &name : vm["syscall-filter"].as<vector<string>>())
                filter.add_rule(name, syscall_action::allow());
            config.filter = filter;
        }
        if (vm.count("deny-syscall")) {
            if (!config.filter) config.filter = syscall_filter().set_default_action(syscall_action::allow());
            for (auto &name : vm["deny-syscall"].as<vector<string>>())
                config.filter->add_rule(name, syscall_action::kill());
        }

        if (vm.count("cgroup")) config.cgroup = vm["cgroup"].as<string>();
        if (vm.count("cpu-core")) config.cpu_core = vm["cpu-core"].as<int>();
        if (vm.count("uid")) config.uid = vm["uid"].as<uint32_t>();
        if (vm.count("gid")) config.gid = vm["gid"].as<uint32_t>();
    } catch (exception &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    if (vm.count("force-degraded")) {
        config.isolation = isolation_mode::degraded;
    } else if (config.isolation == isolation_mode::automatic && !user_namespaces_supported()) {
        config.isolation = isolation_mode::degraded;
    }

    if (config.isolation == isolation_mode::degraded && !vm.count("allow-insecure")) {
        cerr << "Your platform doesn't support a secure sandbox!" << endl
             << "Run with --allow-insecure if you really want to execute it anyway" << endl;
        return 2;
    }

    set_terminate(runbox_terminate_handler);

    // 在创建任何线程之前屏蔽信号，交给 forward_signals 处理
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    sigaddset(&sigs, SIGUSR1);
    if (pthread_sigmask(SIG_BLOCK, &sigs, nullptr) != 0) {
        cerr << "unable to block signals" << endl;
        return 2;
    }

    sandbox box(config);
    thread signal_thread(forward_signals, sigs, ref(box));

    auto stop_signal_thread = [&] {
        finished = true;
        pthread_kill(signal_thread.native_handle(), SIGUSR1);
        signal_thread.join();
    };

    try {
        sandbox_result result = box.run();
        stop_signal_thread();

        if (!metafile_path.empty()) write_metadata(metafile_path, result);

        if (vm.count("json")) {
            nlohmann::json j = result;
            cout << j.dump() << endl;
        } else {
            cout << format_metadata(result);
        }
        return 0;
    } catch (sandbox_error &e) {
        stop_signal_thread();
        LOG(ERROR) << "Unable to run the sandbox: " << get_display_message(e.kind()) << ": " << e.what();
        cerr << get_display_message(e.kind()) << ": " << e.what() << endl;
        if (!metafile_path.empty()) {
            ofstream metafile(metafile_path);
            metafile << "internal-error: " << get_display_message(e.kind()) << ": " << e.what() << endl;
        }
        return 2;
    }
}
