#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace pyexec {
using namespace std;

// clang-format off
static const unordered_map<error_type, const char *> error_type_string = boost::assign::map_list_of
    (error_type::VALIDATION_ERROR, "validation_error")
    (error_type::BAD_REQUEST, "bad_request")
    (error_type::EXECUTION_ERROR, "execution_error")
    (error_type::INTERNAL_ERROR, "internal_error")
    (error_type::NOT_FOUND, "not_found")
    (error_type::METHOD_NOT_ALLOWED, "method_not_allowed");

static const unordered_map<error_type, unsigned> error_type_http_status = boost::assign::map_list_of
    (error_type::VALIDATION_ERROR, 400u)
    (error_type::BAD_REQUEST, 400u)
    (error_type::EXECUTION_ERROR, 500u)
    (error_type::INTERNAL_ERROR, 500u)
    (error_type::NOT_FOUND, 404u)
    (error_type::METHOD_NOT_ALLOWED, 405u);
// clang-format on

const char *get_error_type_name(error_type type) {
    return error_type_string.at(type);
}

unsigned get_http_status(error_type type) {
    return error_type_http_status.at(type);
}

}  // namespace pyexec
