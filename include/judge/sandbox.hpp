#pragma once

#include <filesystem>

namespace codejudge {

/**
 * @brief 评测用的临时工作目录
 *
 * 构造时在临时目录下创建 codejudge-sandbox-<uuid>，包含 input 和 output 两个子目录，
 * 析构时递归删除。选手程序以该目录为工作目录运行，编译器的临时目录也位于其中。
 * 这里只提供目录隔离，不提供任何系统级别的隔离。
 */
struct sandbox {
    /**
     * @brief 在系统临时目录下创建沙箱
     */
    sandbox();

    /**
     * @brief 在指定目录下创建沙箱
     * @param parent 沙箱目录的父目录
     */
    explicit sandbox(const std::filesystem::path &parent);

    sandbox(const sandbox &) = delete;
    sandbox &operator=(const sandbox &) = delete;
    ~sandbox();

    /**
     * @brief 沙箱目录是否存在且是一个目录
     */
    bool is_secure() const;

    const std::filesystem::path &working_dir() const;

    std::filesystem::path input_dir() const;

    std::filesystem::path output_dir() const;

    /**
     * @brief 删除沙箱目录，可以重复调用，不会抛出异常
     * DEBUG 模式下保留目录
     */
    void cleanup() noexcept;

private:
    std::filesystem::path dir;
    bool removed = false;
};

}  // namespace codejudge
