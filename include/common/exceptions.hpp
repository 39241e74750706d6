#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace runbox {

struct runbox_exception : std::exception {
    runbox_exception();
    explicit runbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示请求本身不合法，比如代码为空、没有测试用例
 * 这是唯一会抛给调用者的错误
 */
struct validation_error : public runbox_exception {
    explicit validation_error(const std::string &message);
};

/**
 * @brief 表示不支持的编程语言
 * 在创建任何容器之前抛出
 */
struct unsupported_language : public runbox_exception {
    const std::string language;

    explicit unsupported_language(const std::string &language);
};

/**
 * @brief 表示常驻容器不存在
 * 这是部署问题而不是代码问题，错误信息需要告诉运维如何修复
 */
struct container_missing : public runbox_exception {
    const std::string container;

    container_missing(const std::string &container, const std::string &message);
};

/**
 * @brief 表示程序运行超出了时钟时间限制
 */
struct execution_timeout : public runbox_exception {
    explicit execution_timeout(const std::string &message);
};

/**
 * @brief 表示容器引擎返回了错误的 HTTP 状态码
 */
struct engine_error : public runbox_exception {
    const long status_code;

    engine_error(long status_code, const std::string &message);

    bool is_not_found() const;
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public runbox_exception {
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示沙箱的内部错误
 * 比如源代码没能写入容器
 */
struct internal_error : public runbox_exception {
    explicit internal_error(const std::string &message);
};

}  // namespace runbox
