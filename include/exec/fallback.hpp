#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "exec/extractor.hpp"
#include "exec/sandbox.hpp"
#include "exec/submission.hpp"

namespace pyexec {

/**
 * @brief 处理沙箱执行没有产生结果行且返回值非零的情况
 * 
 * 在某些受限的容器宿主上（比如 Cloud Run），nsjail 无法执行 prctl(PR_SET_SECUREBITS) 等
 * 降权步骤而直接失败。这种情况下 stderr 中会有固定的诊断信息，我们改为不带隔离地重新执行
 * 同一个 artifact。其他情况都是用户脚本本身失败，原样报告且绝不重试。
 * 
 * 注意：诊断信息子串来自 nsjail 的日志输出，与 nsjail 的具体措辞耦合
 */
struct fallback_controller {
    explicit fallback_controller(std::vector<std::string> signatures);

    /**
     * @brief stderr 中是否包含“宿主无法应用隔离”的诊断信息
     */
    bool isolation_unavailable(const std::string &stderr_text) const;

    /**
     * @brief 不带隔离地重新运行 artifact，时间限制为原始的 timeout，并再次提取结果
     * @return 成功时的结果，或者 EXECUTION_ERROR
     */
    outcome<structured_result> run_direct(sandbox &box, const std::filesystem::path &artifact, const script_submission &submit) const;

    /**
     * @brief 把没有结果行的失败运行转换为 EXECUTION_ERROR，携带原始的 stderr
     */
    static failure script_failure(const execution_outcome &outcome, int timeout);

private:
    std::vector<std::string> signatures;
};

}  // namespace pyexec
