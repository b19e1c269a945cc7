#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace pyexec {

struct pyexec_exception : std::exception {
    pyexec_exception();
    explicit pyexec_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const pyexec_exception &ex);

    template <typename T>
    pyexec_exception operator<<(const T &t) const {
        return pyexec_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

    /**
     * @brief 异常抛出时的调用栈，用于在日志中定位内部错误
     */
    const boost::stacktrace::stacktrace &trace() const;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行服务的内部错误
 * 一般是操作系统调用失败（创建管道、写入脚本文件等），
 * 而不是用户脚本本身的问题
 */
struct internal_error : public pyexec_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

}  // namespace pyexec
