#pragma once

#include <filesystem>
#include <string>

namespace runbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw internal_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 断言 subpath 一定不会跳出工作目录
 * 项目文件名会拼接进容器内的 shell 命令，如果文件名包含 "../"
 * 或者是绝对路径，选手就能覆盖工作目录以外的文件；
 * 文件名也只允许字母、数字和 ._-/，避免 glob 和其他 shell 元字符。
 * @param subpath 被检查的文件名
 * @return subpath 本身
 * @throw validation_error 若文件名不安全
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace runbox
