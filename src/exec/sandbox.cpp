#include "exec/sandbox.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include "common/utils.hpp"

namespace pyexec {
using namespace std;
namespace fs = std::filesystem;

const char *get_execution_method_name(execution_method method) {
    switch (method) {
        case execution_method::DIRECT:
            return "direct";
        case execution_method::SANDBOXED:
        default:
            return "sandboxed";
    }
}

static void log_outcome(const execution_outcome &outcome) {
    LOG(INFO) << "Return code: " << outcome.exitcode;
    LOG(INFO) << "Stdout: " << outcome.stdout_text;
    LOG(INFO) << "Stderr: " << outcome.stderr_text;
}

nsjail_sandbox::nsjail_sandbox(const configuration &config)
    : config(config) {}

optional<fs::path> nsjail_sandbox::select_profile() const {
    fs::path preferred = config.sandbox_config_dir / config.preferred_profile;
    if (fs::is_regular_file(preferred)) return preferred;
    fs::path fallback = config.sandbox_config_dir / config.fallback_profile;
    if (fs::is_regular_file(fallback)) return fallback;
    return nullopt;
}

bool nsjail_sandbox::config_present() const {
    return select_profile().has_value();
}

vector<string> nsjail_sandbox::sandboxed_command(const fs::path &profile, const fs::path &artifact, int timeout, int memory) const {
    // artifact 所在目录只读挂载到隔离环境的相同路径上
    fs::path script_dir = fs::absolute(artifact).parent_path();
    return make_command(config.nsjail,
                        "--config", profile,
                        "--time_limit", timeout,
                        "--rlimit_cpu", timeout,
                        "--rlimit_as", memory,
                        "--bindmount_ro", script_dir,
                        "--",
                        config.python, fs::absolute(artifact));
}

outcome<execution_outcome> nsjail_sandbox::run_sandboxed(const fs::path &artifact, int timeout, int memory) {
    auto profile = select_profile();
    if (!profile) {
        LOG(ERROR) << "No NSJail configuration found in " << config.sandbox_config_dir;
        return failure{error_type::EXECUTION_ERROR, "NSJail configuration file not found"};
    }

    process_options opt;
    opt.command = sandboxed_command(*profile, artifact, timeout, memory);
    // 超时主要由 nsjail 负责，这里额外等待 grace 秒，防止 nsjail 本身没有按时结束
    opt.wall_limit = chrono::seconds(timeout + config.grace_seconds);

    LOG(INFO) << "Executing command: " << boost::algorithm::join(opt.command, " ");
    execution_outcome outcome = run_process(opt);
    log_outcome(outcome);
    return outcome;
}

execution_outcome nsjail_sandbox::run_direct(const fs::path &artifact, int timeout, int memory) {
    process_options opt;
    opt.command = make_command(config.python, fs::absolute(artifact));
    opt.wall_limit = chrono::seconds(timeout);
    opt.memory_limit = (int64_t)memory << 20;

    LOG(INFO) << "Executing script directly without NSJail (fallback): " << boost::algorithm::join(opt.command, " ");
    execution_outcome outcome = run_process(opt);
    log_outcome(outcome);
    return outcome;
}

}  // namespace pyexec
