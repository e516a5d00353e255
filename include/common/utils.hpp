#pragma once

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

namespace codejudge {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * 用于拼接编译器的命令行参数
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为 vector，则遍历这个容器将各个元素加入结果容器中）
 * @code{.cpp}
 *     std::vector<std::string> argv;
 *     // argv = {"gcc", "-o", "/tmp/a.out", "main.c", "-O2"}
 *     to_string_list(argv, "gcc", "-o", std::filesystem::path("/tmp/a.out"), sources, flags);
 * @endcode
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    to_string_cont<std::decay_t<const Head &>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 在 PATH 中查找可执行文件
 * @param program 程序名，如果包含 '/' 则直接检查该路径
 * @return 可执行文件的路径，找不到时返回空路径
 */
std::filesystem::path which(const std::string &program);

/**
 * @brief 单调时钟计时器，构造时开始计时
 * 使用 steady_clock，不受系统时间调整的影响
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 已经过去的毫秒数
     */
    std::uint64_t millis() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace codejudge
