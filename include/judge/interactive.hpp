#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "judge/artifact_store.hpp"
#include "judge/toolchain.hpp"

namespace codejudge {

/**
 * @brief 多文件提交中的一个文件
 */
struct code_file {
    /**
     * @brief 相对路径，可以包含子目录，不能包含 ".." 或者是绝对路径
     */
    std::string filename;

    std::string content;
};

struct compile_result {
    bool success = false;

    /**
     * @brief 编译成功时可执行文件在产物目录中的路径
     */
    std::optional<std::string> executable_path;

    /**
     * @brief 编译失败时编译器的错误输出
     */
    std::optional<std::string> error;

    std::uint64_t compile_time_ms = 0;
};

/**
 * @brief 编译多文件提交，产物保存在 store 中
 *
 * 所有文件按相对路径写入临时目录，扩展名为 .c 或 .cpp 的文件作为源文件传给编译器，
 * 其余文件（如头文件）只写入不编译。编译成功后先清理过期产物，再将可执行文件复制到 store。
 * @param files 提交的文件
 * @param language_name 语言名称
 * @param chain 工具链
 * @param store 产物目录
 * @param scratch_root 临时目录的父目录
 * @return 编译结果，编译失败和编译超时记录在返回值中
 * @throw unsupported_language_error 如果语言不被支持
 * @throw std::invalid_argument 如果没有源文件或者文件名不安全
 * @throw source_too_large_error 如果文件总大小超过 SOURCE_SIZE_LIMIT
 * @throw environment_error 如果找不到编译器
 */
compile_result compile_files(const std::vector<code_file> &files, const std::string &language_name,
                             toolchain &chain, run_artifact_store &store,
                             const std::filesystem::path &scratch_root);

/**
 * @brief 单文件提交使用的文件名，C 为 main.c，C++ 为 main.cpp
 * @throw unsupported_language_error 如果语言不被支持
 */
std::string default_filename(const std::string &language_name);

}  // namespace codejudge
