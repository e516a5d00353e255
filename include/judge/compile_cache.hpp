#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "judge/toolchain.hpp"

namespace codejudge {

/**
 * @brief 编译缓存格式的版本号
 * 编译选项或缓存键的计算方式改变时需要增加版本号，使旧的缓存失效
 */
constexpr int COMPILE_CACHE_VERSION = 1;

/**
 * @brief 按内容寻址的编译缓存
 *
 * 缓存文件名为 {hash}_{language}，hash 由源代码、语言、工具链标识和编译选项计算得到。
 * 缓存目录可以被多个评测进程共享：写入时先复制到临时文件再原子地重命名，
 * 相同内容的并发写入不会相互影响。
 */
struct compile_cache {
    explicit compile_cache(std::filesystem::path dir);

    /**
     * @brief 计算缓存键
     * @param source 源代码
     * @param spec 语言的编译方式
     * @param toolchain_fingerprint 工具链标识
     * @return 形如 {32 位十六进制}_{language} 的缓存键
     */
    static std::string make_key(const std::string &source, const language_spec &spec, const std::string &toolchain_fingerprint);

    /**
     * @brief 查找缓存
     * @return 缓存的可执行文件路径，未命中时返回 std::nullopt
     */
    std::optional<std::filesystem::path> find(const std::string &key) const;

    /**
     * @brief 将可执行文件存入缓存
     * 写入失败只记录警告，不会抛出异常
     * @return 是否写入成功
     */
    bool store(const std::string &key, const std::filesystem::path &executable) const;

    const std::filesystem::path &directory() const;

private:
    std::filesystem::path dir;
};

}  // namespace codejudge
