#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace runbox {

/**
 * @brief 源代码长度上限的最大值
 * base64 编码后为 128000 个字符
 */
constexpr std::size_t MAX_CODE_LENGTH_LIMIT = 96000;

/**
 * @brief 临时容器的资源限制，在创建容器时设置
 */
struct container_limits {
    /**
     * @brief 内存上限，单位为字节，默认 256MB
     */
    std::int64_t memory_bytes = 256LL * 1024 * 1024;

    /**
     * @brief CPU 配额，和 cpu_period 一起决定能使用多少 CPU
     * 默认 50000/100000，也就是半个 CPU 核心
     */
    std::int64_t cpu_quota = 50000;

    std::int64_t cpu_period = 100000;

    /**
     * @brief 是否禁用容器网络（NetworkMode=none）
     */
    bool network_disabled = true;

    /**
     * @brief 挂载在工作目录上的 tmpfs 参数
     * 编译型语言需要在 /tmp 中运行编译好的程序，因此默认为 exec；
     * 如果只运行解释型语言，可以改为 noexec 以获得更严格的隔离
     */
    std::string tmpfs_options = "rw,exec,nosuid,size=50m";
};

void from_json(const nlohmann::json &j, container_limits &limits);

/**
 * @brief 沙箱的全部配置
 * 配置可以从 JSON 文件加载，然后被命令行参数和环境变量覆盖（参见 main.cpp）
 */
struct sandbox_config {
    /**
     * @brief 容器引擎的 unix socket 路径
     */
    std::string docker_socket = "/var/run/docker.sock";

    /**
     * @brief 容器引擎 API 版本，会作为所有请求路径的前缀，比如 /v1.41/containers/create
     * 为空时不加版本前缀
     */
    std::string api_version = "v1.41";

    /**
     * @brief 临时容器名的前缀
     * 临时容器名为 <prefix>-<language>-<毫秒时间戳>-<随机后缀>
     */
    std::string container_prefix = "runbox";

    container_limits limits;

    /**
     * @brief 覆盖各语言默认使用的镜像，键为语言名
     */
    std::map<std::string, std::string> images;

    /**
     * @brief 常驻容器表，键为语言名，值为预先创建好的容器名
     */
    std::map<std::string, std::string> persistent_containers = {
        {"python", "runbox-python"},
        {"javascript", "runbox-javascript"},
        {"java", "runbox-java"},
        {"cpp", "runbox-cpp"}};

    /**
     * @brief 单文件运行的时钟时间限制
     */
    std::chrono::milliseconds execution_timeout{10000};

    /**
     * @brief 多文件项目运行的时钟时间限制
     */
    std::chrono::milliseconds project_timeout{15000};

    /**
     * @brief 测试框架为每个测试用例额外设置的外层时间限制
     */
    std::chrono::milliseconds test_case_timeout{10000};

    /**
     * @brief 启动常驻容器后等待其就绪的时间
     */
    std::chrono::milliseconds start_settle{1000};

    /**
     * @brief 启动进程后写入 stdin 之前的等待时间
     */
    std::chrono::milliseconds stdin_settle{100};

    /**
     * @brief 停止临时容器时给进程的宽限时间，单位为秒
     */
    int stop_timeout = 1;

    /**
     * @brief 单个源文件的最大长度，单位为字节
     * 源代码会经过 base64 编码（膨胀为 4/3）放在一个 sh -c 参数里，
     * 而 Linux 单个参数最长 131072 字节（含结尾的 0），
     * 还要给 mkdir/printf 命令本身和路径留出空间，因此不能超过 MAX_CODE_LENGTH_LIMIT
     */
    std::size_t max_code_length = 50000;
};

void from_json(const nlohmann::json &j, sandbox_config &config);

/**
 * @brief 从 JSON 配置文件中加载配置，文件中未出现的项保持默认值
 * @param path 配置文件路径
 */
sandbox_config load_config(const std::string &path);

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，临时容器在运行结束后不会被删除，
 * 以便手动检查写入容器的文件是否符合预期。
 */
extern bool DEBUG;

}  // namespace runbox
