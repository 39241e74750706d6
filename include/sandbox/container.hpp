#pragma once

#include <chrono>
#include <map>
#include <string>
#include "config.hpp"
#include "docker/engine.hpp"
#include "sandbox/language.hpp"

/**
 * 这个头文件包含容器的生命周期管理
 * 我们有两种容器：
 * 1. 临时容器：每次运行都创建一个新容器，运行结束后无论成功失败都会删除。
 *    状态：不存在 -> 已创建 -> 运行中 -> (执行命令)* -> 停止中 -> 已删除
 * 2. 常驻容器：每种语言一个预先部署好的容器（比如通过 docker compose），
 *    沙箱只负责在它停止时重新启动，从不删除它。
 *    同一个常驻容器不能被并发使用，调用者需要自行保证。
 */
namespace runbox {

enum class container_mode {
    EPHEMERAL,
    PERSISTENT
};

std::string to_string(container_mode mode);

/**
 * @brief 根据名称解析容器模式
 * @param name ephemeral 或 persistent
 * @throw validation_error 若名称不合法
 */
container_mode parse_container_mode(const std::string &name);

/**
 * @brief 表示一个可以执行命令的容器
 */
struct container_handle {
    /**
     * @brief 容器名
     */
    std::string name;

    /**
     * @brief 容器 id，由容器引擎分配
     */
    std::string id;

    container_mode mode = container_mode::EPHEMERAL;

    /**
     * @brief 源代码写入的目录
     * 临时容器为 /tmp（tmpfs），常驻容器为 /app
     */
    std::string workdir;

    std::string language;
};

/**
 * @brief 容器的获取和释放
 */
struct container_provider {
    virtual ~container_provider() = default;

    /**
     * @brief 获取一个已经在运行的容器
     * @param profile 要运行的语言
     * @throw container_missing 若常驻容器不存在
     * @throw engine_error, network_error 若容器引擎出错
     */
    virtual container_handle acquire(const language_profile &profile) = 0;

    /**
     * @brief 释放容器，对同一个 handle 多次调用是安全的
     * @throw engine_error, network_error 若容器引擎出错（容器不存在不算错误）
     */
    virtual void release(const container_handle &handle) = 0;
};

/**
 * @brief 临时容器
 * 容器只运行一个无限等待的命令，源代码的写入、编译和运行都通过 exec 完成
 */
class ephemeral_container_provider : public container_provider {
public:
    static constexpr const char *WORKDIR = "/tmp";

    ephemeral_container_provider(docker::container_engine &engine, const sandbox_config &config);

    container_handle acquire(const language_profile &profile) override;

    void release(const container_handle &handle) override;

    /**
     * @brief 生成唯一的容器名 <prefix>-<language>-<毫秒时间戳>-<随机后缀>
     */
    std::string make_name(const std::string &language) const;

private:
    /**
     * @brief 删除同名的旧容器
     * 正常情况下不会存在同名容器
     */
    void remove_stale(const std::string &name);

    docker::container_engine &engine;
    std::string prefix;
    container_limits limits;
    int stop_timeout;
};

/**
 * @brief 常驻容器
 * 常驻容器表在构造时传入，沙箱不会自行查找或创建常驻容器
 */
class persistent_container_provider : public container_provider {
public:
    static constexpr const char *WORKDIR = "/app";

    /**
     * @param registry 常驻容器表，键为语言名，值为容器名
     * @param settle 启动一个已停止的容器后等待多久再使用它
     */
    persistent_container_provider(docker::container_engine &engine, const std::map<std::string, std::string> &registry, std::chrono::milliseconds settle);

    container_handle acquire(const language_profile &profile) override;

    /**
     * @brief 常驻容器不需要释放
     */
    void release(const container_handle &handle) override;

private:
    docker::container_engine &engine;
    std::map<std::string, std::string> registry;
    std::chrono::milliseconds settle;
};

}  // namespace runbox
