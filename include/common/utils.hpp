#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace runbox {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成由小写字母和数字组成的随机字符串
 * 用于生成临时容器名的随机后缀
 * @param length 字符串长度
 */
std::string random_suffix(std::size_t length);

/**
 * @brief 将字符串用单引号包起来，使其能安全地拼接进 sh -c 命令
 * @code{.cpp}
 *     shell_quote("it's") == "'it'\\''s'"
 * @endcode
 */
std::string shell_quote(const std::string &value);

/**
 * @brief 将任意二进制内容编码为 base64（带 = 填充）
 */
std::string base64_encode(const std::string &data);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    long long milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace runbox
