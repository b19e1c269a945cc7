#include "exec/fallback.hpp"
#include <fmt/core.h>
#include <glog/logging.h>

namespace pyexec {
using namespace std;

fallback_controller::fallback_controller(vector<string> signatures)
    : signatures(move(signatures)) {}

bool fallback_controller::isolation_unavailable(const string &stderr_text) const {
    for (auto &signature : signatures)
        if (!signature.empty() && stderr_text.find(signature) != string::npos)
            return true;
    return false;
}

failure fallback_controller::script_failure(const execution_outcome &outcome, int timeout) {
    if (outcome.timed_out)
        return failure{error_type::EXECUTION_ERROR, fmt::format("Script execution timed out after {} seconds", timeout)};
    return failure{error_type::EXECUTION_ERROR, "Script execution failed: " + outcome.stderr_text};
}

outcome<structured_result> fallback_controller::run_direct(sandbox &box, const filesystem::path &artifact, const script_submission &submit) const {
    execution_outcome direct = box.run_direct(artifact, submit.timeout, submit.memory);

    extraction extracted = extract_result(direct);
    if (auto result = get_if<structured_result>(&extracted))
        return move(*result);
    if (auto error = get_if<failure>(&extracted)) {
        // 直接执行时没有结果行一律视为脚本执行失败
        if (error->type == error_type::INTERNAL_ERROR)
            error->type = error_type::EXECUTION_ERROR;
        return move(*error);
    }
    return script_failure(direct, submit.timeout);
}

}  // namespace pyexec
