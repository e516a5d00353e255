#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#ifndef CODEJUDGE_VERSION
#define CODEJUDGE_VERSION "0.1.0"
#endif

namespace codejudge {

/**
 * @brief 源代码的最大字节数，超过该大小的提交在写入磁盘之前直接拒绝
 * @defaultValue 262144 (256KB)
 */
extern std::size_t SOURCE_SIZE_LIMIT;

/**
 * @brief 编译产物的最大字节数，超过该大小的可执行文件将被删除
 * @defaultValue 67108864 (64MB)
 */
extern std::size_t EXECUTABLE_SIZE_LIMIT;

/**
 * @brief 编译器运行的时间限制，单位为毫秒
 * 与测试点的运行时间限制相互独立
 * @defaultValue 15000
 */
extern int COMPILE_TIME_LIMIT;

/**
 * @brief 每个输出流最多保留的字节数，超出部分仍会被读出但被丢弃
 * @defaultValue 67108864 (64MB)
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 内存采样间隔，单位为毫秒
 * @defaultValue 30
 */
extern int MEMORY_SAMPLE_INTERVAL;

/**
 * @brief 是否在采样到的内存峰值超过题目内存限制时终止程序
 * 关闭时内存统计仅用于展示
 */
extern bool ENFORCE_MEMORY_LIMIT;

/**
 * @brief 编译缓存目录
 * 按源代码内容哈希保存编译好的可执行文件，文件名为 {hash}_{language}
 * 多个评测进程可以共享同一个缓存目录
 */
extern std::filesystem::path CACHE_DIR;

/**
 * @brief 交互式编译产物的存放目录
 * 文件名为 run-{时间戳}-{序号}，超过 RUN_ARTIFACT_RETENTION 的文件会在下次编译时被清理
 */
extern std::filesystem::path RUN_ARTIFACT_DIR;

/**
 * @brief 交互式编译产物的保留时间，单位为秒
 * @defaultValue 1800
 */
extern int RUN_ARTIFACT_RETENTION;

/**
 * @brief C 语言编译器
 * @defaultValue gcc
 */
extern std::string C_COMPILER;

/**
 * @brief C++ 语言编译器
 * @defaultValue g++
 */
extern std::string CXX_COMPILER;

/**
 * @brief 调试模式，打开后会保留沙箱目录以便检查
 */
extern bool DEBUG;

}  // namespace codejudge
