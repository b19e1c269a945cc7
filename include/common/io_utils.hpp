#pragma once

#include <filesystem>
#include <string>

namespace pyexec {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 创建一个新文件并写入全部内容
 * 文件必须不存在，以 O_EXCL 方式创建，避免两个请求写入同一个文件
 * @param path 要创建的文件路径
 * @param content 文件内容
 * @param mode 文件权限
 * @return 若文件已存在返回 false，其他错误抛出 std::system_error
 */
bool create_file_exclusive(const std::filesystem::path &path, const std::string &content, mode_t mode);

}  // namespace pyexec
