#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "config.hpp"
#include "exec/process.hpp"

namespace pyexec {

/**
 * @brief 表示请求的结果来自哪一种执行方式
 */
enum class execution_method {
    /**
     * @brief 在 nsjail 隔离环境中执行
     */
    SANDBOXED = 0,

    /**
     * @brief nsjail 无法在当前宿主上应用隔离，不带隔离直接执行
     */
    DIRECT = 1
};

const char *get_execution_method_name(execution_method method);

/**
 * @brief 外部沙箱运行时的抽象
 * orchestrator 只通过这个接口运行 wrapper artifact，测试时可以替换为 mock
 */
struct sandbox {
    virtual ~sandbox() = default;

    /**
     * @brief 是否存在可用的隔离配置文件
     */
    virtual bool config_present() const = 0;

    /**
     * @brief 在隔离环境中运行 artifact
     * 非零返回值和超时都是正常的结果，只有找不到隔离配置文件时才返回失败
     * @param artifact wrapper 脚本路径
     * @param timeout 时间限制（秒）
     * @param memory 内存限制（MB）
     */
    virtual outcome<execution_outcome> run_sandboxed(const std::filesystem::path &artifact, int timeout, int memory) = 0;

    /**
     * @brief 不带隔离地直接运行 artifact，时间限制为 timeout
     */
    virtual execution_outcome run_direct(const std::filesystem::path &artifact, int timeout, int memory) = 0;
};

/**
 * @brief 通过 nsjail 运行 wrapper artifact
 */
struct nsjail_sandbox : public sandbox {
    explicit nsjail_sandbox(const configuration &config);

    bool config_present() const override;

    outcome<execution_outcome> run_sandboxed(const std::filesystem::path &artifact, int timeout, int memory) override;

    execution_outcome run_direct(const std::filesystem::path &artifact, int timeout, int memory) override;

    /**
     * @brief 选择隔离配置文件
     * 优先使用适用于受限容器宿主的配置，不存在时使用更严格的默认配置
     * @return 配置文件路径，两个都不存在时返回 std::nullopt
     */
    std::optional<std::filesystem::path> select_profile() const;

    /**
     * @brief 构造 nsjail 命令行
     * nsjail --config <profile> --time_limit T --rlimit_cpu T --rlimit_as M --bindmount_ro <script_dir> -- <python> <artifact>
     */
    std::vector<std::string> sandboxed_command(const std::filesystem::path &profile, const std::filesystem::path &artifact, int timeout, int memory) const;

private:
    const configuration &config;
};

}  // namespace pyexec
