#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <condition_variable>
#include <mutex>
#include <set>
#include "config.hpp"
#include "server/router.hpp"

namespace pyexec::server {

/**
 * @brief HTTP/1.1 服务
 * 主线程通过 io_context 异步接受连接，每个连接交给一个独立的线程同步处理。
 * 请求之间没有排队和准入控制：每个请求都会立即尝试创建子进程，
 * 并发上限取决于宿主的进程和资源容量。
 * 无法为新连接创建线程时只关闭该连接，服务继续运行。
 *
 * 停止时关闭监听端口，正在处理的请求会完成并写回响应，
 * 空闲的 keep-alive 连接会被关闭，run() 等待所有连接线程结束后才返回。
 */
struct http_server {
    http_server(const configuration &config, router &handler);

    /**
     * @brief 绑定并监听 config 中的地址
     * @throw boost::system::system_error 若地址无法绑定
     */
    void listen();

    /**
     * @brief 实际监听的端口，port 配置为 0 时由系统分配
     */
    unsigned short local_port() const;

    /**
     * @brief 开始处理连接并阻塞，直到收到 SIGINT 或 SIGTERM，或者调用了 stop()
     * 尚未调用 listen() 时先调用 listen()
     */
    void run();

    /**
     * @brief 停止接受新连接，已经建立的连接会处理完当前请求
     */
    void stop();

private:
    void do_accept();

    void session(boost::asio::ip::tcp::socket &socket);
    bool register_session(int fd);
    void unregister_session(int fd);
    void finish_session();

    const configuration &config;
    router &handler;
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor;
    boost::asio::signal_set signals;

    std::mutex session_lock;
    std::condition_variable session_done;
    /**
     * @brief 尚未结束的连接线程数量
     */
    size_t active_sessions = 0;
    /**
     * @brief 正在等待请求的连接，停止时关闭它们的读端
     */
    std::set<int> session_fds;
    bool stopping = false;
};

}  // namespace pyexec::server
