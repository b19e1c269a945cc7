#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pyexec {

/**
 * @brief 请求中 timeout 字段的默认值与上限（秒）
 */
constexpr int DEFAULT_TIMEOUT = 30;
constexpr int MAX_TIMEOUT = 300;

/**
 * @brief 请求中 memory 字段的默认值与上限（MB）
 */
constexpr int DEFAULT_MEMORY = 128;
constexpr int MAX_MEMORY = 1024;

/**
 * @brief 执行服务的全部配置
 * 在 main 中构造一次，之后以引用的形式传给 sandbox、orchestrator 和 HTTP 服务，
 * 运行期间不会被修改，因此可以被多个请求线程并发读取。
 */
struct configuration {
    /**
     * @brief 存放 wrapper artifact 的目录
     * 每个请求在这里创建一个唯一命名的脚本文件，请求结束时删除。
     * 
     * SCRIPT_DIR
     * ├── script_20240501_123045_123456_0.py // 正在执行的请求
     * └── ...
     */
    std::filesystem::path script_dir = "scripts";

    /**
     * @brief 存放 nsjail 隔离配置文件的目录
     * 
     * SANDBOX_CONFIG_DIR
     * ├── python_cloud_run.cfg // 受限容器宿主（比如 Cloud Run）可用的配置
     * └── python_secure.cfg // 更严格的默认配置
     */
    std::filesystem::path sandbox_config_dir = "configs";

    /**
     * @brief 优先使用的隔离配置文件名
     */
    std::string preferred_profile = "python_cloud_run.cfg";

    /**
     * @brief 优先配置不存在时使用的隔离配置文件名
     */
    std::string fallback_profile = "python_secure.cfg";

    /**
     * @brief nsjail 可执行文件
     */
    std::filesystem::path nsjail = "/usr/local/bin/nsjail";

    /**
     * @brief 执行 wrapper artifact 的 Python 解释器
     */
    std::filesystem::path python = "/usr/local/bin/python3";

    /**
     * @brief 等待沙箱进程时在 timeout 之外额外给予的秒数，用于吸收 nsjail 的启动开销
     */
    int grace_seconds = 5;

    /**
     * @brief 表示“当前宿主无法应用隔离”的 nsjail 诊断信息子串
     * 命中任意一个时改为不带隔离地直接执行
     */
    std::vector<std::string> fallback_signatures = {"PR_SET_SECUREBITS"};

    std::string host = "0.0.0.0";

    unsigned short port = 8080;

    /**
     * @brief 是否开启 DEBUG 模式
     * 开启后启动时不再要求 nsjail 和隔离配置文件可用，只打印警告
     */
    bool debug = false;
};

/**
 * @brief 从 JSON 配置文件中读取配置，缺少的字段保持原值
 */
void from_json(const nlohmann::json &j, configuration &config);

}  // namespace pyexec
