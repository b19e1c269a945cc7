#pragma once

#include <string>
#include "config.hpp"

namespace pyexec {

/**
 * @brief 表示一次脚本执行请求
 * 通过请求解析后即不再修改，orchestrator 只以常量引用访问
 */
struct script_submission {
    /**
     * @brief 用户提交的 Python 源代码，必须包含无参数的 main 函数
     */
    std::string source;

    /**
     * @brief 执行时间限制，单位为秒，范围 [1, 300]
     */
    int timeout = DEFAULT_TIMEOUT;

    /**
     * @brief 内存限制，单位为 MB，范围 [1, 1024]
     */
    int memory = DEFAULT_MEMORY;
};

}  // namespace pyexec
