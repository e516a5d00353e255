#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace nlohmann {

/**
 * @brief 按照 keys 依次向下查找 json 对象的成员
 * @return 找到的成员，找不到时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
json access_optional(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return !ref ? json{} : *ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(-1, ' ', false, json::error_handler_t::replace);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::type_error &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 如果 keys 指向的成员存在且不为 null，则赋值给 value
 * @throw std::invalid_argument 如果成员存在但类型不匹配
 */
template <typename T, typename... Keys>
void assign_optional(const json &j, T &value, Keys &&... keys) {
    const json *res = find_path(j, keys...);
    if (!res || res->is_null()) return;
    try {
        value = res->get<T>();
    } catch (json::type_error &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 如果 keys 指向的成员存在且不为 null，则赋值给 optional
 */
template <typename T, typename... Keys>
void assign_optional(const json &j, std::optional<T> &value, Keys &&... keys) {
    const json *res = find_path(j, keys...);
    if (!res || res->is_null()) return;
    try {
        value = res->get<T>();
    } catch (json::type_error &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 将 optional 转换为 json，没有值时为 null
 */
template <typename T>
json optional_to_json(const std::optional<T> &value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace nlohmann
