#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace codejudge {

enum class language {
    C,
    CPP
};

/**
 * @brief 一种语言的编译方式
 */
struct language_spec {
    language lang;

    /**
     * @brief 语言名称，用于缓存键，如 "c", "cpp"
     */
    std::string name;

    /**
     * @brief 编译器命令，如 "gcc"
     */
    std::string compiler;

    /**
     * @brief 固定的编译选项，放在源文件之后
     */
    std::vector<std::string> flags;

    /**
     * @brief 单文件提交写入的源文件名
     */
    std::string source_name;
};

/**
 * @brief 解析语言名称，不区分大小写
 * "c" 为 C 语言，"cpp" 和 "c++" 为 C++
 * @return 不支持的语言返回 std::nullopt
 */
std::optional<language> parse_language(const std::string &name);

/**
 * @brief 获得语言的编译方式
 * 编译器命令取自 C_COMPILER 和 CXX_COMPILER
 */
language_spec get_language_spec(language lang);

/**
 * @brief 判断文件是否是需要传给编译器的源文件（.c 和 .cpp）
 */
bool is_source_file(const std::filesystem::path &path);

/**
 * @brief 编译工具链
 * 编译器通过这个接口调用外部编译器，测试时可以替换为不调用真实编译器的实现
 */
struct toolchain {
    virtual ~toolchain();

    /**
     * @brief 调用编译器
     * @param argv 编译器命令及参数
     * @param workdir 编译器的工作目录
     * @param time_limit 时间限制，单位为毫秒
     * @return 编译器的运行结果，超时时 error 为 "Time limit exceeded"
     * @throw environment_error 如果找不到编译器
     */
    virtual execution_result invoke(const std::vector<std::string> &argv, const std::filesystem::path &workdir, int time_limit) = 0;

    /**
     * @brief 工具链的标识，作为编译缓存键的一部分
     * 编译器升级后标识会变化，从而不会命中旧版本编译器生成的缓存
     */
    virtual std::string fingerprint(const language_spec &spec) = 0;
};

/**
 * @brief 调用本机 gcc/g++ 的工具链
 */
struct native_toolchain : public toolchain {
    execution_result invoke(const std::vector<std::string> &argv, const std::filesystem::path &workdir, int time_limit) override;

    /**
     * @brief 编译器命令加上 -dumpfullversion 的输出，每个编译器只查询一次
     */
    std::string fingerprint(const language_spec &spec) override;

private:
    std::mutex mut;
    std::map<std::string, std::string> versions;
};

}  // namespace codejudge
