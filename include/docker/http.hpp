#pragma once

#include <map>
#include <string>

namespace runbox::docker {

/**
 * @brief 一次 HTTP 请求的结果
 */
struct http_response {
    long status = 0;
    std::string body;
};

/**
 * @brief 解析后的 HTTP 响应头部
 * 头部字段名统一转换为小写
 */
struct http_head {
    long status = 0;
    std::string reason;
    std::map<std::string, std::string> headers;
};

/**
 * @brief 解析 HTTP 响应的状态行和头部
 * @param head 从状态行开始到空行（\r\n\r\n）之前的内容
 * @throw network_error 若状态行格式不正确
 */
http_head parse_http_head(const std::string &head);

/**
 * @brief 通过 unix socket 访问 HTTP 服务的客户端（基于 CURL）
 * 每个请求使用一个独立的 CURL 句柄，因此可以被多个线程同时使用
 */
class unix_socket_client {
public:
    /**
     * @param socket_path unix socket 的路径，比如 /var/run/docker.sock
     */
    explicit unix_socket_client(const std::string &socket_path);

    /**
     * @brief 发送一个请求并等待完整的响应
     * @param method HTTP 方法，GET/POST/DELETE
     * @param path 请求路径（包含 query），比如 /containers/json?all=1
     * @param body 请求体，为空时不发送；非空时以 application/json 发送
     * @throw network_error 若无法连接或传输失败
     */
    http_response request(const std::string &method, const std::string &path, const std::string &body = "") const;

    const std::string &socket() const;

private:
    std::string socket_path;
};

}  // namespace runbox::docker
