#pragma once

#include <string>
#include <variant>

namespace pyexec {

/**
 * @brief 表示一次请求失败的原因
 * 每个阶段都返回带标签的结果，只在 HTTP 边界处才把失败原因翻译成状态码
 */
enum class error_type {
    /**
     * @brief 脚本没有通过执行前的形状检查（空脚本、缺少 main、main 缺少 return）
     * 在创建任何进程之前就会被拒绝
     */
    VALIDATION_ERROR = 0,

    /**
     * @brief 请求体格式错误
     * 比如不是 JSON、缺少 script 字段、timeout 或 memory 超出范围
     */
    BAD_REQUEST = 1,

    /**
     * @brief 沙箱、进程或输出解析失败，也包括用户脚本自己抛出的异常
     * 对调用方而言“脚本失败”和“平台没能运行脚本”是同一个错误类别，
     * 但 message 会携带 harness 报告的原始信息以便区分
     */
    EXECUTION_ERROR = 2,

    /**
     * @brief 未分类的内部错误
     */
    INTERNAL_ERROR = 3,

    /**
     * @brief 没有匹配的路由
     */
    NOT_FOUND = 4,

    /**
     * @brief 路由存在但不支持该 HTTP 方法
     */
    METHOD_NOT_ALLOWED = 5
};

/**
 * @brief 错误类型的机器可读名称，作为响应中的 error_type 字段
 */
const char *get_error_type_name(error_type type);

/**
 * @brief 错误类型对应的 HTTP 状态码
 */
unsigned get_http_status(error_type type);

struct failure {
    error_type type;
    std::string message;
};

/**
 * @brief 一个阶段的结果：要么是 T，要么是失败原因
 */
template <typename T>
using outcome = std::variant<T, failure>;

template <typename T>
bool succeeded(const outcome<T> &o) {
    return std::holds_alternative<T>(o);
}

}  // namespace pyexec
