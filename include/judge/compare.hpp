#pragma once

#include <string>
#include "judge/submission.hpp"

namespace codejudge {

/**
 * @brief 规范化程序输出
 * 1. normalize_crlf 时将 "\r\n" 替换为 "\n"
 * 2. ignore_extra_whitespace 时将每行内连续的空白字符压缩为一个空格
 * 3. 去掉每行首尾的空白字符，再去掉整个结果首尾的空白字符
 * 对同一个结果再次规范化不会改变结果。
 */
std::string normalize_output(const std::string &output, const normalization_options &options);

/**
 * @brief 比较规范化之后的实际输出与期望输出
 */
bool outputs_match(const std::string &actual, const std::string &expected, const normalization_options &options);

}  // namespace codejudge
