#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"
#include "exec/orchestrator.hpp"
#include "exec/sandbox.hpp"
#include "exec/submission.hpp"

namespace pyexec::server {

struct http_response {
    unsigned status = 200;
    nlohmann::json body;
};

/**
 * @brief 解析 POST /execute 的请求体
 * 请求体格式为 {"script": string, "timeout": int = 30, "memory": int = 128}
 * @param content_type 请求的 Content-Type，必须为 JSON
 * @param body 请求体
 * @return 解析出的请求，或者 BAD_REQUEST
 */
outcome<script_submission> parse_submission(const std::string &content_type, const std::string &body);

/**
 * @brief 所有错误响应共用的格式
 * {"success": false, "error": message, "error_type": kind, "timestamp": ...}
 */
http_response error_response(const failure &error);

/**
 * @brief 将 HTTP 请求分发到对应的处理函数
 * 与 socket 无关，只根据方法、路径、Content-Type 和请求体计算响应
 */
struct router {
    router(orchestrator &executor, const sandbox &box);

    http_response dispatch(const std::string &method, const std::string &target, const std::string &content_type, const std::string &body);

    /**
     * @brief POST /execute
     */
    http_response execute(const std::string &content_type, const std::string &body);

    /**
     * @brief GET /health
     */
    http_response health() const;

private:
    orchestrator &executor;
    const sandbox &box;
};

}  // namespace pyexec::server
