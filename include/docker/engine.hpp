#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * 这个头文件包含容器引擎的抽象接口
 * 沙箱的其他部分只通过 container_engine 访问容器，
 * 实际的实现是通过 unix socket 访问 Docker Engine API 的 docker_engine，
 * 单元测试中使用 mock。
 */
namespace runbox::docker {

/**
 * @brief 创建容器所需的参数
 */
struct container_spec {
    /**
     * @brief 容器使用的镜像
     */
    std::string image;

    /**
     * @brief 容器的主进程，我们使用一个无限等待的命令，
     * 之后每个操作都通过 exec 在容器内执行
     */
    std::vector<std::string> cmd;

    std::string working_dir;

    /**
     * @brief 内存上限，单位为字节，0 表示不限制
     */
    std::int64_t memory_bytes = 0;

    std::int64_t cpu_quota = 0;

    std::int64_t cpu_period = 0;

    bool network_disabled = true;

    /**
     * @brief tmpfs 挂载点，键为容器内路径，值为挂载参数
     * @code{.json}
     * {"/tmp": "rw,exec,nosuid,size=50m"}
     * @endcode
     */
    std::map<std::string, std::string> tmpfs;
};

/**
 * @brief inspect 容器得到的状态
 */
struct container_state {
    std::string id;
    std::string name;
    bool running = false;
};

/**
 * @brief 在容器内执行命令所需的参数
 */
struct exec_spec {
    std::vector<std::string> cmd;
    bool attach_stdin = false;
    bool attach_stdout = true;
    bool attach_stderr = true;
    std::string working_dir;
};

/**
 * @brief 一个已经启动的 exec 的双向数据流
 * 读到的是 Docker 的多路复用格式（8 字节帧头 + 数据），需要交给 stream_demultiplexer 解析。
 * read_some 和 write/close_write 只能在同一个线程中调用，cancel 可以在任意线程调用。
 */
struct exec_stream {
    virtual ~exec_stream() = default;

    /**
     * @brief 读取一段数据，阻塞直到有数据、流结束或者被取消
     * @param buffer 读取到的数据将追加到 buffer 后
     * @return 读取到的字节数，0 表示流已结束（或者已被取消）
     * @throw network_error 若连接出错
     */
    virtual std::size_t read_some(std::string &buffer) = 0;

    /**
     * @brief 向进程的 stdin 写入数据
     */
    virtual void write(const std::string &data) = 0;

    /**
     * @brief 关闭写端，进程将读到 EOF
     */
    virtual void close_write() = 0;

    /**
     * @brief 强制关闭数据流，正在阻塞的 read_some 会立刻返回 0
     */
    virtual void cancel() = 0;
};

/**
 * @brief 容器引擎
 * 所有函数在引擎返回错误时抛出 engine_error（容器不存在时 is_not_found() 为真），
 * 在无法连接到引擎时抛出 network_error。
 */
struct container_engine {
    virtual ~container_engine() = default;

    /**
     * @brief 检查容器引擎是否可用
     */
    virtual bool ping() = 0;

    /**
     * @brief 查询容器状态
     * @param name 容器名或者容器 id
     */
    virtual container_state inspect(const std::string &name) = 0;

    /**
     * @brief 创建容器（不启动）
     * @param name 容器名
     * @param spec 容器参数
     * @return 容器 id
     */
    virtual std::string create(const std::string &name, const container_spec &spec) = 0;

    virtual void start(const std::string &id) = 0;

    /**
     * @brief 停止容器
     * @param timeout_seconds 发送 SIGTERM 后等待多少秒再发送 SIGKILL
     */
    virtual void stop(const std::string &id, int timeout_seconds) = 0;

    virtual void remove(const std::string &id, bool force) = 0;

    /**
     * @brief 在容器中创建一个 exec
     * @return exec id
     */
    virtual std::string create_exec(const std::string &container_id, const exec_spec &spec) = 0;

    /**
     * @brief 启动 exec 并接管其输入输出流
     */
    virtual std::unique_ptr<exec_stream> start_exec(const std::string &exec_id) = 0;

    /**
     * @brief 查询 exec 的退出码
     * @return 退出码，进程还没有结束时返回 -1
     */
    virtual int inspect_exec(const std::string &exec_id) = 0;
};

}  // namespace runbox::docker
