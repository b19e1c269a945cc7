#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace pyexec {

struct process_options {
    /**
     * @brief 要执行的命令，command[0] 为程序路径，通过 PATH 查找
     */
    std::vector<std::string> command;

    /**
     * @brief 时钟时间限制，超时后杀死整个进程组
     * 为 0 时不限制
     */
    std::chrono::milliseconds wall_limit{0};

    /**
     * @brief 通过 RLIMIT_AS 限制的地址空间大小（字节），小于 0 时不限制
     */
    int64_t memory_limit = -1;

    /**
     * @brief 每个输出流最多保留的字节数
     * 超出时丢弃最早的数据，保留末尾，因为 harness 的结果总是最后一行
     */
    size_t stream_limit = 16 << 20;
};

/**
 * @brief 进程的运行结果
 * 非零返回值和超时都是正常的结果，不会以异常的形式抛出
 */
struct execution_outcome {
    /**
     * @brief 进程的返回值
     * 若进程因为信号终止，则为 128 + 信号编号
     */
    int exitcode = -1;

    /**
     * @brief 终止进程的信号，没有则为 -1
     */
    int signal = -1;

    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 是否因为超出 wall_limit 而被杀死
     */
    bool timed_out = false;
};

/**
 * @brief 运行外部命令并分别捕获 stdout、stderr 和返回值
 * 
 * 1. 创建连接到子进程 stdout/stderr 的管道，stdin 重定向到 /dev/null
 * 2. fork 出子进程，并将子进程放到独立的进程组，以便超时时杀死整个进程组
 * 3. 子进程设置 RLIMIT_AS 后通过 execvp 执行命令
 * 4. 父进程通过 poll 读取两个管道，直到管道关闭且子进程退出，或者超出时间限制
 * 5. 超时时先发送 SIGTERM，0.1 秒后发送 SIGKILL
 * 
 * 这个函数不注册任何信号处理函数，也不使用全局状态，可以被多个线程同时调用。
 * 若命令不存在，子进程以 127 退出，错误信息写入 stderr。
 * 
 * @throw internal_error 创建管道、fork 等系统调用失败
 */
execution_outcome run_process(const process_options &opt);

}  // namespace pyexec
