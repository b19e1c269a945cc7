#include "server/http_server.hpp"
#include <glog/logging.h>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <signal.h>
#include <sys/socket.h>
#include <memory>
#include <system_error>
#include <thread>
#include "common/defer.hpp"

namespace pyexec::server {
using namespace std;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

// 允许较大的脚本，但避免无限制地读取请求体
static const uint64_t BODY_LIMIT = 16 << 20;

static string to_std_string(beast::string_view sv) {
    return string(sv.data(), sv.size());
}

http_server::http_server(const configuration &config, router &handler)
    : config(config), handler(handler), acceptor(ioc), signals(ioc, SIGINT, SIGTERM) {}

void http_server::listen() {
    tcp::endpoint endpoint(asio::ip::make_address(config.host), config.port);
    acceptor.open(endpoint.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(asio::socket_base::max_listen_connections);
    LOG(INFO) << "Listening on " << config.host << ":" << local_port();
}

unsigned short http_server::local_port() const {
    return acceptor.local_endpoint().port();
}

void http_server::run() {
    if (!acceptor.is_open()) listen();

    signals.async_wait([this](const beast::error_code &ec, int signum) {
        if (ec) return;  // stop() 取消了等待
        LOG(ERROR) << "Received signal " << signum << ", stopping server";
        stop();
    });

    do_accept();
    ioc.run();

    unique_lock<mutex> lock(session_lock);
    if (active_sessions > 0)
        LOG(INFO) << "Waiting for " << active_sessions << " connections to finish";
    session_done.wait(lock, [this] { return active_sessions == 0; });
    LOG(INFO) << "Server stopped";
}

void http_server::stop() {
    asio::post(ioc, [this]() {
        beast::error_code ec;
        acceptor.close(ec);
        signals.cancel(ec);

        lock_guard<mutex> guard(session_lock);
        stopping = true;
        // 阻塞在读取请求上的连接线程会读到 EOF，正在处理的请求不受影响
        for (int fd : session_fds)
            ::shutdown(fd, SHUT_RD);
    });
}

void http_server::do_accept() {
    acceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) return;
        if (ec) {
            LOG(WARNING) << "Accepting connection failed: " << ec.message();
        } else {
            {
                lock_guard<mutex> guard(session_lock);
                ++active_sessions;
            }
            // 每个连接一个线程，请求的处理会阻塞到子进程结束
            // socket 在线程计数减少之前析构，run() 返回后不再有线程访问 io_context
            auto conn = make_unique<tcp::socket>(move(socket));
            try {
                thread([this, conn = move(conn)]() mutable {
                    session(*conn);
                    conn.reset();
                    finish_session();
                }).detach();
            } catch (system_error &e) {
                LOG(ERROR) << "Unable to start a thread for the connection, closing it: " << e.what();
                finish_session();
            }
        }
        do_accept();
    });
}

bool http_server::register_session(int fd) {
    lock_guard<mutex> guard(session_lock);
    if (stopping) return false;
    session_fds.insert(fd);
    return true;
}

void http_server::unregister_session(int fd) {
    lock_guard<mutex> guard(session_lock);
    session_fds.erase(fd);
}

void http_server::finish_session() {
    lock_guard<mutex> guard(session_lock);
    --active_sessions;
    session_done.notify_all();
}

void http_server::session(tcp::socket &socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    int fd = socket.native_handle();
    if (!register_session(fd)) {
        socket.close(ec);
        return;
    }
    // 先注销再关闭，stop() 不会对已经被复用的描述符调用 shutdown
    defer {
        unregister_session(fd);
        beast::error_code close_ec;
        socket.shutdown(tcp::socket::shutdown_send, close_ec);
        socket.close(close_ec);
    };

    while (true) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(BODY_LIMIT);
        http::read(socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) break;
        if (ec) {
            LOG(WARNING) << "Reading request failed: " << ec.message();
            break;
        }

        auto &req = parser.get();
        http_response result;
        try {
            result = handler.dispatch(to_std_string(req.method_string()),
                                      to_std_string(req.target()),
                                      to_std_string(req[http::field::content_type]),
                                      req.body());
        } catch (std::exception &e) {
            LOG(ERROR) << "Handling request failed: " << e.what();
            result = error_response({error_type::INTERNAL_ERROR, "Internal server error"});
        }

        http::response<http::string_body> res{static_cast<http::status>(result.status), req.version()};
        res.set(http::field::server, "pyexec");
        res.set(http::field::content_type, "application/json");
        res.keep_alive(req.keep_alive());
        res.body() = result.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        res.prepare_payload();

        LOG(INFO) << req.method_string() << " " << req.target() << " " << result.status;

        http::write(socket, res, ec);
        if (ec) {
            LOG(WARNING) << "Writing response failed: " << ec.message();
            break;
        }
        if (!res.keep_alive()) break;
    }
}

}  // namespace pyexec::server
