#pragma once

#include <ctime>
#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将内容写入文件，会自动创建父目录并覆盖已有文件
 * @param path 文件路径
 * @param content 写入的内容，按二进制写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 提交的文件名由调用方提供，如果包含 ".." 或者是绝对路径，
 * 写入时就有可能覆盖临时目录以外的文件。
 * @param subpath 被检查的文件名
 * @throw std::invalid_argument 如果文件名不安全
 */
std::string assert_safe_path(const std::string &subpath);

time_t last_write_time(const std::filesystem::path &path);

void last_write_time(const std::filesystem::path &path, time_t time);

}  // namespace codejudge
