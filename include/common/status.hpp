#pragma once

#include <string>

namespace codejudge {

/**
 * @brief 表示整个提交的评测结果
 * 由各个测试点的运行结果推导得到，不会为单个测试点保存
 */
enum class overall_status {
    /**
     * @brief 评测正常完成
     * 所有测试点均通过，或者未通过的测试点都是答案错误（此时分数小于 100）
     */
    OK = 0,

    /**
     * @brief 编译失败、编译超时，或者源代码、可执行文件超过大小限制
     */
    COMPILE_ERROR = 1,

    /**
     * @brief 存在运行失败且有错误输出的测试点
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 存在超出时间限制的测试点
     */
    TIMEOUT = 3,

    /**
     * @brief 提交的语言不被支持
     */
    UNSUPPORTED_LANGUAGE = 4,

    /**
     * @brief 评测环境不可用，比如找不到编译器
     */
    ENV_ERROR = 5
};

/**
 * @brief 获得评测结果的名称，用于序列化
 * @return 如 "Ok", "CompileError"
 */
const char *get_display_message(overall_status stat);

/**
 * @brief 由名称解析评测结果
 * @throw std::invalid_argument 如果名称不存在
 */
overall_status parse_overall_status(const std::string &name);

}  // namespace codejudge
