#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include "common/status.hpp"
#include "exec/process.hpp"

namespace pyexec {

/**
 * @brief harness 成功时输出的结果
 */
struct structured_result {
    /**
     * @brief main() 的返回值
     */
    nlohmann::json result;

    /**
     * @brief main() 执行期间写入 stdout 的内容
     */
    std::string stdout_text;
};

/**
 * @brief stderr 中没有结果行，且进程返回值非零
 * 需要由 fallback_controller 判断是否是宿主无法应用隔离导致的
 */
struct missing_result {};

using extraction = std::variant<structured_result, failure, missing_result>;

/**
 * @brief 从 stderr 中找出 harness 输出的结果行
 * 从最后一行向前查找第一个去除空白后以 '{' 开头、以 '}' 结尾的行。
 * nsjail 可能在同一个流中输出自己的诊断信息，只有 harness 最后输出的一行是可信的。
 * @return 结果行（已去除首尾空白），找不到时返回 std::nullopt
 */
std::optional<std::string> find_result_line(const std::string &stderr_text);

/**
 * @brief 从进程运行结果中提取 harness 的结果
 * 
 * | 找到结果行 | 返回值 | 能否解析 | 含 error 字段 | 结果                               |
 * |-----------|--------|---------|--------------|-----------------------------------|
 * | 否        | 0      | -       | -            | INTERNAL_ERROR：没有结构化输出       |
 * | 否        | 非 0   | -       | -            | missing_result，交给 fallback 判断  |
 * | 是        | 任意   | 否      | -            | EXECUTION_ERROR：无法解析输出        |
 * | 是        | 任意   | 是      | 是           | EXECUTION_ERROR：harness 报告的错误  |
 * | 是        | 任意   | 是      | 否           | structured_result                  |
 */
extraction extract_result(const execution_outcome &outcome);

}  // namespace pyexec
