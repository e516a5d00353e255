#pragma once

#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace codejudge {

/**
 * @brief 超时时 execution_result::error 的内容
 * 评测结果的推导依赖这个字符串，不要修改
 */
constexpr char TIME_LIMIT_EXCEEDED_MESSAGE[] = "Time limit exceeded";

/**
 * @brief 内存超限时 execution_result::error 的内容
 */
constexpr char MEMORY_LIMIT_EXCEEDED_MESSAGE[] = "Memory limit exceeded";

/**
 * @brief 在时间限制下运行一次程序
 *
 * 每次运行会启动一个新的进程组，在同一个 poll 循环里完成：
 * 1. 非阻塞地写入标准输入，程序关闭标准输入时静默停止写入
 * 2. 非阻塞地读取标准输出和标准错误，避免管道写满导致死锁
 * 3. 每隔 MEMORY_SAMPLE_INTERVAL 毫秒读取 /proc/<pid>/status 记录内存峰值
 * 4. 等待程序退出或者到达时间限制
 * 超时后整个进程组会被 SIGKILL 并回收，循环退出时子进程一定已经被回收，
 * 所有管道都已关闭。
 *
 * 程序本身的失败不会抛出异常，全部记录在 execution_result 中。
 */
/**
 * @brief 时间限制的上限，单位为毫秒，更大的限制按上限处理
 */
constexpr std::uint64_t MAX_TIME_LIMIT = 7ull * 24 * 60 * 60 * 1000;

struct executor {
    /**
     * @param time_limit 墙上时间限制，单位为毫秒，超过 MAX_TIME_LIMIT 时按 MAX_TIME_LIMIT 处理
     * @param memory_limit 内存限制，单位为 MB，为 0 表示不限制，只有打开 ENFORCE_MEMORY_LIMIT 才会生效
     * @param workdir 子进程的工作目录，为空则继承当前目录
     */
    executor(std::uint64_t time_limit, std::uint64_t memory_limit = 0, std::filesystem::path workdir = {});

    /**
     * @brief 运行可执行文件，不带命令行参数
     * @param executable 可执行文件路径，相对路径按当前目录而不是 workdir 解析
     * @param input 标准输入的内容
     */
    execution_result execute(const std::filesystem::path &executable, const std::string &input) const;

    /**
     * @brief 运行外部命令
     * @param argv 命令及参数，argv[0] 会在 PATH 中查找
     * @param input 标准输入的内容
     */
    execution_result run(const std::vector<std::string> &argv, const std::string &input) const;

private:
    std::chrono::milliseconds time_limit;
    std::uint64_t memory_limit;
    std::filesystem::path workdir;

    execution_result spawn_and_wait(const std::vector<std::string> &argv, const std::string &input) const;
};

/**
 * @brief 读取进程的常驻内存峰值
 * 优先使用 VmHWM，不存在时使用 VmRSS
 * @param pid 进程号
 * @return 内存大小，单位为 KB，进程不存在或已经退出时返回 0
 */
std::uint64_t read_process_memory(pid_t pid);

}  // namespace codejudge
