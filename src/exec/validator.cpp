#include "exec/validator.hpp"
#include <boost/algorithm/string.hpp>
#include <cctype>
#include <vector>

namespace pyexec {
using namespace std;

static size_t indentation_of(const string &line) {
    size_t indent = 0;
    while (indent < line.size() && (line[indent] == ' ' || line[indent] == '\t'))
        ++indent;
    return indent;
}

static bool is_main_declaration(const string &stripped) {
    return boost::starts_with(stripped, "def main()");
}

static bool is_function_declaration(const string &stripped) {
    return boost::starts_with(stripped, "def ") || boost::starts_with(stripped, "async def ");
}

// "return" 后面必须不是标识符字符，避免把 returned = 1 这样的赋值当成 return
static bool is_return_statement(const string &stripped) {
    if (!boost::starts_with(stripped, "return")) return false;
    if (stripped.size() == 6) return true;
    char next = stripped[6];
    return !(isalnum(static_cast<unsigned char>(next)) || next == '_');
}

optional<failure> validate_script(const string &source) {
    if (boost::trim_copy(source).empty())
        return failure{error_type::VALIDATION_ERROR, "Script content cannot be empty"};

    vector<string> lines;
    boost::split(lines, source, boost::is_any_of("\n"));

    bool found_main = false, has_return = false;
    size_t main_indent = 0;
    for (auto &line : lines) {
        string stripped = boost::trim_copy(line);
        if (stripped.empty()) continue;

        if (!found_main) {
            if (is_main_declaration(stripped)) {
                found_main = true;
                main_indent = indentation_of(line);
            }
            continue;
        }

        if (is_function_declaration(stripped) && indentation_of(line) <= main_indent)
            break;  // main 的兄弟函数，main 的范围到此为止

        if (is_return_statement(stripped)) {
            has_return = true;
            break;
        }
    }

    if (!found_main)
        return failure{error_type::VALIDATION_ERROR, "Script must contain a 'main()' function"};
    if (!has_return)
        return failure{error_type::VALIDATION_ERROR, "main() function must contain a return statement"};
    return nullopt;
}

}  // namespace pyexec
