#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/problem.hpp"

namespace codejudge {

/**
 * @brief 输出比较前的规范化选项
 */
struct normalization_options {
    /**
     * @brief 将 "\r\n" 替换为 "\n"
     */
    bool normalize_crlf = false;

    /**
     * @brief 将每行内连续的空白字符压缩为一个空格
     */
    bool ignore_extra_whitespace = false;
};

/**
 * @brief 程序的一次运行结果
 * 程序本身的失败（非零退出、超时）都记录在这里，不会抛出异常
 */
struct execution_result {
    /**
     * @brief 程序是否正常退出且返回值为 0
     */
    bool success = false;

    /**
     * @brief 程序的标准输出，超时时为空
     */
    std::string output;

    /**
     * @brief 错误信息
     * 运行失败且标准错误流非空时为标准错误流的内容，超时时为 "Time limit exceeded"
     */
    std::optional<std::string> error;

    /**
     * @brief 运行的墙上时间，单位为毫秒
     */
    std::uint64_t execution_time = 0;

    /**
     * @brief 采样得到的内存峰值，单位为 KB
     */
    std::uint64_t memory_usage = 0;

    /**
     * @brief 程序的返回值，如果程序没有正常退出则为 -1
     */
    int exit_code = -1;

    /**
     * @brief 导致程序终止的信号，如果程序正常退出则为 0
     */
    int signal = 0;
};

struct test_case_result {
    /**
     * @brief 测试点在题目中的下标
     */
    std::size_t test_case_id = 0;

    bool passed = false;

    execution_result result;

    /**
     * @brief 未经规范化的期望输出
     */
    std::string expected_output;

    /**
     * @brief 未经规范化的实际输出
     */
    std::string actual_output;
};

struct submission_result {
    std::string problem_id;

    std::size_t total_test_cases = 0;

    std::size_t passed_test_cases = 0;

    /**
     * @brief 按测试点顺序排列的结果
     */
    std::vector<test_case_result> test_case_results;

    bool compilation_successful = false;

    std::optional<std::string> compilation_error;

    /**
     * @brief 所有测试点运行时间之和，单位为毫秒
     */
    std::uint64_t total_execution_time = 0;

    /**
     * @brief 得分，为 passed_test_cases / total_test_cases * 100
     */
    double score = 0;

    std::optional<std::uint64_t> compile_time_ms;

    std::optional<std::uint64_t> executable_size_bytes;

    /**
     * @brief 可执行文件是否来自编译缓存
     */
    bool cached = false;
};

struct judge_request {
    std::string code;

    std::string language;

    struct problem problem;

    normalization_options normalization;
};

struct judge_response {
    bool success = false;

    std::optional<submission_result> result;

    std::optional<std::string> error;

    overall_status status = overall_status::OK;
};

}  // namespace codejudge
