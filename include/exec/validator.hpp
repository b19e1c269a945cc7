#pragma once

#include <optional>
#include <string>
#include "common/status.hpp"

namespace pyexec {

/**
 * @brief 检查脚本是否满足执行的前置条件
 * 
 * 这里只做基于行前缀的浅层检查，不解析也不执行脚本：
 * 1. 去除首尾空白后脚本不能为空
 * 2. 必须有一行以 "def main()" 开头，即无参数的 main 函数声明
 * 3. 从 main 的声明开始，到下一个缩进不深于 main 的函数声明为止，
 *    至少有一行以 return 开头
 * 
 * 这个检查不是安全边界：不可达的 return、嵌套函数里的 return、
 * 永远不会执行的条件 return 都能通过检查，它们会在运行时以普通的执行错误暴露出来。
 * 
 * @param source 用户提交的源代码
 * @return 检查通过时返回 std::nullopt，否则返回 VALIDATION_ERROR
 */
std::optional<failure> validate_script(const std::string &source);

}  // namespace pyexec
