#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace codejudge {

/**
 * @brief 交互式编译产物的存放目录
 *
 * 产物需要在编译结束之后继续存在，由调用方按路径运行。
 * 文件名为 run-{微秒时间戳}-{进程内序号}，每次编译前清理超过保留时间的文件。
 */
struct run_artifact_store {
    /**
     * @param dir 存放目录，不存在时会在第一次使用时创建
     * @param retention 保留时间
     */
    run_artifact_store(std::filesystem::path dir, std::chrono::seconds retention);

    /**
     * @brief 生成一个新的产物路径，同一进程内不会重复
     */
    std::filesystem::path next_path();

    /**
     * @brief 删除超过保留时间的产物，删除失败的文件会被跳过
     * @return 删除的文件数
     */
    std::size_t sweep();

    const std::filesystem::path &directory() const;

private:
    std::filesystem::path dir;
    std::chrono::seconds retention;
};

}  // namespace codejudge
