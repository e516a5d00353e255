#pragma once

#include <atomic>
#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "judge/artifact_store.hpp"
#include "judge/interactive.hpp"
#include "judge/judger.hpp"

namespace codejudge {

/**
 * @brief 解析后的请求
 */
struct request_message {
    /**
     * @brief 请求编号，原样返回，请求中没有时为 null
     */
    nlohmann::json id;

    /**
     * @brief ping, version, env_check, judge, execute 之一
     */
    std::string action;

    /**
     * @brief judge 请求的评测请求
     */
    std::optional<judge_request> judge;

    /**
     * @brief execute 请求的语言
     */
    std::string language;

    /**
     * @brief execute 请求的单文件源代码
     */
    std::optional<std::string> code;

    /**
     * @brief execute 请求的多文件源代码，优先于 code
     */
    std::optional<std::vector<code_file>> files;
};

/**
 * @brief 解析一行请求
 * @throw std::invalid_argument 如果不是合法的 JSON、action 未知或者缺少必需的字段
 */
request_message parse_request(const std::string &line);

/**
 * @brief 通过标准输入输出提供评测服务
 *
 * 每行一个 JSON 请求，按 action 区分：
 * - ping: 返回 "pong"
 * - version: 返回版本号
 * - env_check: 检查编译器是否可用
 * - judge: 评测 request 字段中的评测请求
 * - execute: 编译 code 或 files，返回可执行文件路径
 * 每个请求对应一行 JSON 响应 {"id", "success", "data", "error"}，id 与请求相同。
 * 无法解析的请求返回 id 为 null 的错误响应，空行被忽略，任何请求都不会使服务退出。
 */
struct stdio_server {
    /**
     * @param judge 评测器
     * @param chain 交互式编译使用的工具链
     * @param artifacts 交互式编译产物目录
     */
    stdio_server(judger &judge, std::shared_ptr<toolchain> chain, run_artifact_store &artifacts);

    /**
     * @brief 处理一行请求
     * @return 响应，空行返回 std::nullopt
     */
    std::optional<nlohmann::json> handle(const std::string &line);

    /**
     * @brief 逐行读取请求并写出响应，直到输入结束或 stop 被调用
     */
    void serve(std::istream &in, std::ostream &out);

    /**
     * @brief 要求 serve 在处理完当前请求后退出
     */
    void stop();

private:
    judger &judge;
    std::shared_ptr<toolchain> chain;
    run_artifact_store &artifacts;
    std::atomic<bool> stopped;

    nlohmann::json dispatch(const request_message &request);
    nlohmann::json execute(const request_message &request);
};

/**
 * @brief 构造响应
 */
nlohmann::json make_response(const nlohmann::json &id, bool success, const nlohmann::json &data, const std::optional<std::string> &error);

}  // namespace codejudge
