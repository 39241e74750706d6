#pragma once

#include <curl/curl.h>
#include <atomic>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include "docker/engine.hpp"
#include "docker/http.hpp"

namespace runbox::docker {

/**
 * @brief 通过 HTTP Upgrade 接管的 exec 连接
 * 使用 CURL 的 CONNECT_ONLY 模式建立 unix socket 连接，手动发送 HTTP 请求，
 * 收到 101 UPGRADED 之后这个连接就变成了进程 stdin/stdout/stderr 的原始数据流。
 */
class hijacked_exec_stream : public exec_stream {
public:
    explicit hijacked_exec_stream(const std::string &socket_path);
    ~hijacked_exec_stream() override;

    hijacked_exec_stream(const hijacked_exec_stream &) = delete;
    hijacked_exec_stream &operator=(const hijacked_exec_stream &) = delete;

    /**
     * @brief 建立连接，发送 HTTP 请求并读取响应头部
     * 响应头部之后已经读到的数据会作为流的第一段数据返回
     * @param request 完整的 HTTP 请求报文
     * @throw engine_error 若容器引擎拒绝了请求
     * @throw network_error 若连接失败
     */
    void open(const std::string &request);

    std::size_t read_some(std::string &buffer) override;

    void write(const std::string &data) override;

    void close_write() override;

    void cancel() override;

private:
    std::size_t receive(std::string &buffer);

    bool wait_socket(short events);

    std::string socket_path;
    CURL *curl = nullptr;
    curl_socket_t fd = CURL_SOCKET_BAD;
    std::string pending;
    std::atomic<bool> cancelled{false};
};

/**
 * @brief 通过 Docker Engine API 实现的容器引擎
 */
class docker_engine : public container_engine {
public:
    /**
     * @param socket_path Docker 守护进程的 unix socket 路径
     * @param api_version API 版本，比如 v1.41，为空时使用守护进程的默认版本
     */
    docker_engine(const std::string &socket_path, const std::string &api_version);

    bool ping() override;

    container_state inspect(const std::string &name) override;

    std::string create(const std::string &name, const container_spec &spec) override;

    void start(const std::string &id) override;

    void stop(const std::string &id, int timeout_seconds) override;

    void remove(const std::string &id, bool force) override;

    std::string create_exec(const std::string &container_id, const exec_spec &spec) override;

    std::unique_ptr<exec_stream> start_exec(const std::string &exec_id) override;

    int inspect_exec(const std::string &exec_id) override;

private:
    std::string api(const std::string &path) const;

    /**
     * @brief 检查响应状态码，不在 accepted 中时抛出 engine_error
     * @param what 出错时错误信息的前缀
     */
    void expect(const http_response &response, std::initializer_list<long> accepted, const std::string &what) const;

    unix_socket_client client;
    std::string api_version;
};

/**
 * @brief 将 container_spec 转换为 POST /containers/create 的请求体
 */
nlohmann::json to_create_body(const container_spec &spec);

/**
 * @brief 从容器引擎的错误响应中提取错误信息
 * 容器引擎的错误响应格式为 {"message": "..."}，不是 JSON 时返回原文
 */
std::string error_message(const std::string &body);

}  // namespace runbox::docker
