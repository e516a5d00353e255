#pragma once

#include <nlohmann/json.hpp>
#include "judge/interactive.hpp"
#include "judge/submission.hpp"

/**
 * 评测请求和评测结果的 JSON 格式
 * 字段名与协议保持一致，使用 snake_case，评测结果和难度使用 "Ok"、"Easy" 这样的名称
 */
namespace codejudge {

void from_json(const nlohmann::json &j, test_case &tc);

void from_json(const nlohmann::json &j, problem &prob);

void from_json(const nlohmann::json &j, normalization_options &options);

void from_json(const nlohmann::json &j, judge_request &request);

void to_json(nlohmann::json &j, const execution_result &result);
void to_json(nlohmann::json &j, const test_case_result &result);
void to_json(nlohmann::json &j, const submission_result &result);
void to_json(nlohmann::json &j, const judge_response &response);

void from_json(const nlohmann::json &j, code_file &file);
void to_json(nlohmann::json &j, const compile_result &result);

/**
 * @brief 序列化为一行 JSON，非法的 UTF-8 字节会被替换
 * 程序输出可能包含任意字节
 */
std::string dump_json(const nlohmann::json &j, int indent = -1);

}  // namespace codejudge
