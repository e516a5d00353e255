#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 题目难度，仅用于展示
 */
enum class difficulty {
    EASY,
    MEDIUM,
    HARD
};

const char *get_display_message(difficulty level);

/**
 * @brief 由 "Easy", "Medium", "Hard" 解析题目难度
 * @throw std::invalid_argument 如果名称不存在
 */
difficulty parse_difficulty(const std::string &name);

/**
 * @brief 一个测试点，由标准输入和期望输出组成
 * 测试点在题目中的下标就是测试点编号
 */
struct test_case {
    /**
     * @brief 传给选手程序标准输入的内容
     */
    std::string input;

    /**
     * @brief 期望的标准输出，比较前会进行规范化
     */
    std::string expected_output;

    /**
     * @brief 是否对选手隐藏该测试点，不影响运行
     */
    bool is_hidden = false;
};

/**
 * @brief 题目
 * 评测过程中不会被修改
 */
struct problem {
    std::string id;

    std::string title;

    std::string description;

    difficulty level = difficulty::EASY;

    /**
     * @brief 每个测试点的时间限制，单位为毫秒
     */
    std::uint64_t time_limit = 1000;

    /**
     * @brief 内存限制，单位为 MB
     * 只有打开 ENFORCE_MEMORY_LIMIT 时才会强制执行
     */
    std::uint64_t memory_limit = 256;

    std::vector<test_case> test_cases;

    std::vector<std::string> tags;
};

}  // namespace codejudge
