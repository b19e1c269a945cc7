#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace pyexec {

/**
 * @brief 生成包含用户代码的可执行 Python 脚本（harness）
 * 
 * 生成的脚本会：
 * 1. 原样嵌入用户代码
 * 2. 仅在调用 main() 期间把 stdout 重定向到内存缓冲区
 * 3. 调用 main()，返回 None 视为非法
 * 4. 确认返回值可以被序列化为 JSON
 * 5. 向 stderr 输出恰好一行 JSON 对象：
 *    成功时为 {"result": ..., "stdout": ...}，
 *    出现任何异常时为 {"error": ..., "type": ..., "trace": ...}，并以非零返回值退出
 * 
 * 结果写到 stderr 而不是 stdout，因为解释器启动或 nsjail 可能向 stdout 写入其他内容，
 * 而 stderr 上的干扰要少得多。
 * 
 * @param source 用户提交的源代码
 * @return 完整的 Python 脚本内容
 */
std::string synthesize_wrapper(const std::string &source);

/**
 * @brief 根据提交时间和计数器生成 artifact 文件名
 * 格式为 script_YYYYmmdd_HHMMSS_ffffff_<counter>.py
 */
std::string make_artifact_name(std::chrono::system_clock::time_point tp, unsigned long counter);

/**
 * @brief 表示一个请求独占的 wrapper 脚本文件
 * 构造时在目录下创建唯一命名的文件，析构时删除。
 * 无论请求在哪个阶段失败，文件都会且只会被删除一次。
 */
struct wrapper_artifact {
    /**
     * @brief 在 dir 中创建 artifact 文件并写入 content
     * @throw internal_error 若文件无法创建或写入
     */
    wrapper_artifact(const std::filesystem::path &dir, const std::string &content);
    wrapper_artifact(const wrapper_artifact &) = delete;
    ~wrapper_artifact();

    wrapper_artifact &operator=(const wrapper_artifact &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 删除 artifact 文件，重复调用不会有任何效果
     */
    void remove();

private:
    std::filesystem::path file;
    bool removed = false;
};

}  // namespace pyexec
