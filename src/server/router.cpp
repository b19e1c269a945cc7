#include "server/router.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/utils.hpp"
#include "config.hpp"

namespace pyexec::server {
using namespace std;
using namespace nlohmann;

static failure bad_request(const string &message) {
    return failure{error_type::BAD_REQUEST, message};
}

static bool is_json_content_type(const string &content_type) {
    string mime = boost::to_lower_copy(boost::trim_copy(content_type.substr(0, content_type.find(';'))));
    return mime == "application/json" || (boost::starts_with(mime, "application/") && boost::ends_with(mime, "+json"));
}

/**
 * @brief 读取 [1, max_value] 范围内的整数字段，缺失时使用默认值
 * 布尔值和浮点数都不被当作整数
 */
static bool read_bounded_int(const json &data, const char *key, int def_value, int max_value, int &value) {
    if (!data.count(key)) {
        value = def_value;
        return true;
    }
    auto &field = data.at(key);
    if (!field.is_number_integer()) return false;
    if (field.is_number_unsigned()) {
        auto v = field.get<uint64_t>();
        if (v < 1 || v > (uint64_t)max_value) return false;
        value = (int)v;
    } else {
        auto v = field.get<int64_t>();
        if (v < 1 || v > max_value) return false;
        value = (int)v;
    }
    return true;
}

outcome<script_submission> parse_submission(const string &content_type, const string &body) {
    if (!is_json_content_type(content_type))
        return bad_request("Request must be JSON");

    json data = json::parse(body, nullptr, false);
    if (data.is_discarded())
        return bad_request("Request body is not valid JSON");

    if (!data.is_object() || data.empty() || !data.count("script"))
        return bad_request("Request must contain 'script' field");

    script_submission submit;
    if (!data.at("script").is_string())
        return bad_request("Script must be a string");
    submit.source = data.at("script").get<string>();

    if (!read_bounded_int(data, "timeout", DEFAULT_TIMEOUT, MAX_TIMEOUT, submit.timeout))
        return bad_request(fmt::format("Timeout must be a positive integer <= {}", MAX_TIMEOUT));
    if (!read_bounded_int(data, "memory", DEFAULT_MEMORY, MAX_MEMORY, submit.memory))
        return bad_request(fmt::format("Memory must be a positive integer <= {}", MAX_MEMORY));

    return submit;
}

http_response error_response(const failure &error) {
    http_response response;
    response.status = get_http_status(error.type);
    response.body = {
        {"success", false},
        {"error", error.message},
        {"error_type", get_error_type_name(error.type)},
        {"timestamp", iso_timestamp()}};
    return response;
}

router::router(orchestrator &executor, const sandbox &box)
    : executor(executor), box(box) {}

http_response router::dispatch(const string &method, const string &target, const string &content_type, const string &body) {
    string path = target.substr(0, target.find('?'));

    if (path == "/execute") {
        if (method == "POST") return execute(content_type, body);
    } else if (path == "/health") {
        if (method == "GET") return health();
    } else {
        return error_response({error_type::NOT_FOUND, "Endpoint not found"});
    }
    return error_response({error_type::METHOD_NOT_ALLOWED, "Method not allowed"});
}

http_response router::execute(const string &content_type, const string &body) {
    auto submit = parse_submission(content_type, body);
    if (auto error = get_if<failure>(&submit)) {
        LOG(WARNING) << "Bad request: " << error->message;
        return error_response(*error);
    }

    auto report = executor.execute(get<script_submission>(submit));
    if (auto error = get_if<failure>(&report))
        return error_response(*error);

    auto &success = get<execution_report>(report);
    http_response response;
    response.status = 200;
    response.body = {
        {"success", true},
        {"result", success.result},
        {"stdout", success.stdout_text},
        {"execution_method", get_execution_method_name(success.method)},
        {"timestamp", success.timestamp}};
    return response;
}

http_response router::health() const {
    http_response response;
    response.status = 200;
    response.body = {
        {"status", "healthy"},
        {"timestamp", iso_timestamp()},
        {"sandbox_config_present", box.config_present()}};
    return response;
}

}  // namespace pyexec::server
