#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/utils.hpp"
#include "config.hpp"
#include "docker/demultiplexer.hpp"
#include "docker/engine.hpp"
#include "sandbox/container.hpp"
#include "sandbox/injector.hpp"
#include "sandbox/language.hpp"

namespace runbox {

/**
 * @brief 程序没有任何输出时返回给调用者的标准输出
 */
extern const char *const NO_OUTPUT_MESSAGE;

enum class execution_status {
    /**
     * @brief 程序正常结束，退出码为 0
     */
    SUCCESS,

    /**
     * @brief 编译错误，或者程序以非 0 退出码结束
     */
    RUNTIME_ERROR,

    /**
     * @brief 程序运行超出时钟时间限制，已被强制中断
     */
    TIMEOUT,

    UNSUPPORTED_LANGUAGE,

    /**
     * @brief 常驻容器不存在，需要运维处理
     */
    CONTAINER_MISSING,

    /**
     * @brief 容器引擎出错或沙箱内部错误，与用户代码无关
     */
    INTERNAL_ERROR
};

std::string to_string(execution_status status);

/**
 * @brief 单文件运行请求
 */
struct execution_request {
    std::string code;
    std::string language;

    /**
     * @brief 程序的标准输入，为空时不连接 stdin
     */
    std::optional<std::string> stdin_text;

    container_mode mode = container_mode::EPHEMERAL;
};

/**
 * @brief 多文件项目运行请求
 */
struct project_request {
    std::vector<source_file> files;

    /**
     * @brief 要运行的文件，必须是 files 之一
     */
    std::string main_file;

    std::string language;
    std::optional<std::string> stdin_text;
    container_mode mode = container_mode::EPHEMERAL;
};

/**
 * @brief 一次运行的结果，每个请求恰好产生一个
 */
struct execution_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 从收到请求到得出结果的时钟时间，包括创建容器的时间
     */
    long long elapsed_ms = 0;

    execution_status status = execution_status::SUCCESS;

    /**
     * @brief 进程的退出码，未知时为 -1
     */
    int exit_code = -1;
};

/**
 * @brief 容器引擎的可用状态
 */
struct engine_status {
    bool available = false;
    std::string message;
};

void from_json(const nlohmann::json &j, execution_request &request);
void from_json(const nlohmann::json &j, source_file &file);
void from_json(const nlohmann::json &j, project_request &request);
void to_json(nlohmann::json &j, const execution_result &result);
void to_json(nlohmann::json &j, const engine_status &status);

/**
 * @brief 运行用户代码
 * 测试框架只依赖这个接口，方便在单元测试中替换
 */
struct executor {
    virtual ~executor() = default;

    /**
     * @brief 运行单文件代码
     * 运行失败、超时、语言不支持等都通过返回值表示
     * @throw validation_error 若请求本身不合法
     */
    virtual execution_result execute(const execution_request &request) = 0;
};

/**
 * @brief 在容器中运行代码
 *
 * 每次运行的流程为：
 * 校验请求 -> 查找语言 -> 获取容器 -> 写入源代码 -> 运行 -> 收集输出 -> 清理
 * 清理一定会执行，而且清理失败只会记录日志，不会覆盖运行结果。
 *
 * 不同的请求可以在不同线程中同时调用，只要它们不共享同一个常驻容器。
 */
class sandbox_executor : public executor {
public:
    /**
     * @param ephemeral 临时容器的获取方式
     * @param persistent 常驻容器的获取方式，包含常驻容器表
     */
    sandbox_executor(docker::container_engine &engine,
                     const language_table &languages,
                     container_provider &ephemeral,
                     container_provider &persistent,
                     const sandbox_config &config);

    execution_result execute(const execution_request &request) override;

    /**
     * @brief 运行多文件项目
     * @throw validation_error 若文件名不安全、主文件不存在等
     */
    execution_result execute_project(const project_request &request);

    /**
     * @brief 检查容器引擎是否可用，不会抛出异常
     */
    engine_status ping();

    std::vector<std::string> languages() const;

private:
    struct run_plan {
        const language_profile *profile = nullptr;
        std::vector<source_file> files;
        std::string main_file;
        std::optional<std::string> stdin_text;
        container_mode mode = container_mode::EPHEMERAL;
        std::chrono::milliseconds timeout{0};
    };

    execution_result run(const run_plan &plan, const elapsed_time &timer);

    /**
     * @brief 写入 stdin 并收集输出，直到程序结束或者超时
     * @return 超时时返回 std::nullopt
     */
    std::optional<docker::demuxed_output> collect(docker::exec_stream &stream, const std::optional<std::string> &stdin_text, std::chrono::milliseconds timeout);

    int exit_code_of(const std::string &exec_id);

    void cleanup(container_provider &containers, const container_handle &handle, const run_plan &plan, const std::vector<std::string> &written);

    container_provider &provider(container_mode mode);

    void validate_code(const std::string &code, const std::string &what) const;

    docker::container_engine &engine;
    const language_table &table;
    container_provider &ephemeral;
    container_provider &persistent;
    source_injector injector;
    std::size_t max_code_length;
    std::chrono::milliseconds execution_timeout;
    std::chrono::milliseconds project_timeout;
    std::chrono::milliseconds stdin_settle;
};

}  // namespace runbox
