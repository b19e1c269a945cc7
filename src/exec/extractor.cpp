#include "exec/extractor.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <vector>

namespace pyexec {
using namespace std;
using namespace nlohmann;

optional<string> find_result_line(const string &stderr_text) {
    vector<string> lines;
    boost::split(lines, stderr_text, boost::is_any_of("\n"));
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        string line = boost::trim_copy(*it);
        if (boost::starts_with(line, "{") && boost::ends_with(line, "}"))
            return line;
    }
    return nullopt;
}

static string describe_error(const json &error) {
    if (error.is_string()) return error.get<string>();
    return error.dump(-1, ' ', false, json::error_handler_t::replace);
}

extraction extract_result(const execution_outcome &outcome) {
    auto json_line = find_result_line(outcome.stderr_text);
    if (!json_line) {
        if (outcome.exitcode != 0) return missing_result{};
        return failure{error_type::INTERNAL_ERROR, "No JSON output found in script execution"};
    }

    json output = json::parse(*json_line, nullptr, false);
    if (output.is_discarded() || !output.is_object()) {
        LOG(ERROR) << "Failed to parse JSON line: " << *json_line;
        return failure{error_type::EXECUTION_ERROR, "Failed to parse script output as JSON"};
    }

    if (output.count("error")) {
        string message = describe_error(output.at("error"));
        if (output.count("type") && output.at("type").is_string())
            LOG(INFO) << "Script raised " << output.at("type").get<string>() << ": " << message;
        return failure{error_type::EXECUTION_ERROR, "Script execution failed: " + message};
    }

    structured_result result;
    if (output.count("result")) result.result = output.at("result");
    if (output.count("stdout")) {
        auto &captured = output.at("stdout");
        result.stdout_text = captured.is_string() ? captured.get<string>() : captured.dump();
    }
    return result;
}

}  // namespace pyexec
