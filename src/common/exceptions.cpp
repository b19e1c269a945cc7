#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace pyexec {
using namespace std;

pyexec_exception::pyexec_exception()
    : pyexec_exception("") {}

pyexec_exception::pyexec_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *pyexec_exception::what() const noexcept {
    return message.c_str();
}

const boost::stacktrace::stacktrace &pyexec_exception::trace() const {
    return *stacktrace;
}

std::ostream &operator<<(std::ostream &os, const pyexec_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : pyexec_exception() {}

internal_error::internal_error(const string &message)
    : pyexec_exception(message) {}

}  // namespace pyexec
