#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"
#include "config.hpp"
#include "exec/fallback.hpp"
#include "exec/sandbox.hpp"
#include "exec/submission.hpp"

namespace pyexec {

/**
 * @brief 一次成功执行的报告
 */
struct execution_report {
    /**
     * @brief main() 的返回值
     */
    nlohmann::json result;

    /**
     * @brief main() 执行期间写入 stdout 的内容
     */
    std::string stdout_text;

    /**
     * @brief 结果来自隔离执行还是 fallback 的直接执行
     */
    execution_method method = execution_method::SANDBOXED;

    /**
     * @brief 报告生成的时间，ISO-8601 格式
     */
    std::string timestamp;
};

/**
 * @brief 执行一个脚本请求的完整流程
 * 
 * 1. 检查脚本形状，失败时返回 VALIDATION_ERROR，此时不会创建任何进程
 * 2. 生成 wrapper 脚本并写入唯一命名的 artifact 文件
 * 3. 在 nsjail 中运行 artifact
 * 4. 从 stderr 中提取结果
 *    1. 找到结果行：成功或者返回 harness 报告的错误
 *    2. 没有结果行且返回值为 0：INTERNAL_ERROR
 *    3. 没有结果行且返回值非 0：若 stderr 包含隔离不可用的诊断信息，
 *       不带隔离地重新执行一次，结果标记为 direct；否则原样报告 EXECUTION_ERROR
 * 5. 任何阶段抛出的异常都转换为 INTERNAL_ERROR
 * 
 * artifact 文件在所有退出路径上都会且只会被删除一次。
 * orchestrator 不保存请求之间的状态，可以被多个线程同时调用。
 */
struct orchestrator {
    orchestrator(const configuration &config, sandbox &box);

    outcome<execution_report> execute(const script_submission &submit);

private:
    outcome<execution_report> run(const script_submission &submit);

    const configuration &config;
    sandbox &box;
    fallback_controller fallback;
};

}  // namespace pyexec
