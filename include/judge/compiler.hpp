#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "common/exceptions.hpp"
#include "judge/compile_cache.hpp"
#include "judge/toolchain.hpp"

namespace codejudge {

/**
 * @brief 表示选手程序编译错误
 */
struct compilation_error : public judge_exception {
    /**
     * @brief 编译器的错误输出
     */
    const std::string error_log;

    compilation_error(const std::string &what, const std::string &error_log);
};

/**
 * @brief 表示编译器运行超过 COMPILE_TIME_LIMIT
 * 比如 #include </dev/random> 这样的代码
 */
struct compilation_timeout_error : public compilation_error {
    compilation_timeout_error(const std::string &what, const std::string &error_log);
};

/**
 * @brief 源代码超过 SOURCE_SIZE_LIMIT，在写入磁盘之前抛出
 */
struct source_too_large_error : public judge_exception {
    const std::size_t size;
    const std::size_t limit;

    source_too_large_error(std::size_t size, std::size_t limit);
};

/**
 * @brief 编译产物超过 EXECUTABLE_SIZE_LIMIT，此时产物已被删除且不会进入缓存
 */
struct executable_too_large_error : public judge_exception {
    const std::uintmax_t size;
    const std::uintmax_t limit;

    executable_too_large_error(std::uintmax_t size, std::uintmax_t limit);
};

struct compile_output {
    /**
     * @brief 可执行文件路径，可能位于编译缓存中
     */
    std::filesystem::path executable;

    /**
     * @brief 是否命中编译缓存
     */
    bool cached = false;

    /**
     * @brief 编译耗时，单位为毫秒，命中缓存时为查找缓存的耗时
     */
    std::uint64_t compile_time = 0;

    std::uintmax_t executable_size = 0;
};

/**
 * @brief 编译单文件提交
 *
 * 编译流程：检查源代码大小 -> 查找缓存 -> 写入源文件 -> 调用编译器 -> 检查可执行文件大小 -> 写入缓存。
 * 每个 compiler 拥有自己的临时目录，析构时删除。
 */
struct compiler {
    /**
     * @param chain 调用编译器的工具链
     * @param cache 编译缓存
     * @param scratch_root 临时目录的父目录
     */
    compiler(toolchain &chain, const compile_cache &cache, const std::filesystem::path &scratch_root);
    compiler(const compiler &) = delete;
    compiler &operator=(const compiler &) = delete;
    ~compiler();

    /**
     * @brief 编译源代码
     * @param code 源代码
     * @param lang 语言
     * @return 可执行文件信息
     * @throw source_too_large_error 源代码过大，此时不会写入任何文件
     * @throw compilation_error 编译失败，包括编译超时
     * @throw executable_too_large_error 可执行文件过大
     * @throw environment_error 找不到编译器
     */
    compile_output compile(const std::string &code, language lang);

    /**
     * @brief 临时目录，第一次编译时才会创建
     */
    const std::filesystem::path &scratch_dir() const;

    /**
     * @brief 检查 C 和 C++ 编译器是否可用
     * @throw environment_error 如果任一编译器不可用
     */
    static void check_toolchain(toolchain &chain);

private:
    toolchain &chain;
    const compile_cache &cache;
    std::filesystem::path scratch;
};

}  // namespace codejudge
