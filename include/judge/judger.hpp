#pragma once

#include <memory>
#include <vector>
#include "judge/compile_cache.hpp"
#include "judge/sandbox.hpp"
#include "judge/submission.hpp"
#include "judge/toolchain.hpp"

namespace codejudge {

/**
 * @brief 评测一份提交
 *
 * 流程：解析语言 -> 编译（或命中缓存）-> 按顺序运行每个测试点 -> 规范化并比较输出 -> 计算分数和评测结果。
 * 每个测试点使用新的 executor，某个测试点失败不会影响后续测试点的运行。
 * judger 拥有一个沙箱，沙箱在 judger 析构时被删除。
 */
struct judger {
    /**
     * @param chain 工具链，默认调用本机的 gcc/g++
     */
    explicit judger(std::shared_ptr<toolchain> chain = std::make_shared<native_toolchain>());

    /**
     * @brief 评测提交
     * 编译失败、运行失败等情况都记录在返回值中
     * @param request 评测请求
     * @return 评测结果
     * @throw std::invalid_argument 如果题目没有测试点
     */
    judge_response judge(const judge_request &request);

    /**
     * @brief 检查编译器是否可用
     * @throw environment_error 如果编译器不可用
     */
    void check_environment();

    const sandbox &get_sandbox() const;

    const compile_cache &get_cache() const;

private:
    std::shared_ptr<toolchain> chain;
    sandbox box;
    compile_cache cache;
};

/**
 * @brief 由各个测试点的结果推导整个提交的评测结果
 * 全部通过为 OK；否则存在超时为 TIMEOUT；否则存在有错误信息的运行失败为 RUNTIME_ERROR；
 * 否则（只有答案错误）仍为 OK
 */
overall_status derive_overall_status(const std::vector<test_case_result> &results);

/**
 * @brief 计算得分 passed / total * 100
 * @throw std::invalid_argument 如果 total 为 0
 */
double compute_score(std::size_t passed, std::size_t total);

}  // namespace codejudge
