#pragma once

#include <string>
#include <vector>
#include "docker/demultiplexer.hpp"
#include "docker/engine.hpp"
#include "sandbox/container.hpp"

namespace runbox {

/**
 * @brief 一个要写入容器的源文件
 */
struct source_file {
    /**
     * @brief 相对于容器工作目录的路径，可以包含子目录
     */
    std::string name;

    std::string content;
};

/**
 * @brief 将源代码写入容器，以及在运行结束后清理
 *
 * 源代码经过 base64 编码后放在 exec 命令行中，在容器内解码写入文件，
 * 因此源代码中的引号、换行、反斜杠等任何字符都不会被 shell 解释。
 */
class source_injector {
public:
    explicit source_injector(docker::container_engine &engine);

    /**
     * @brief 将文件写入容器的工作目录，需要时自动创建子目录
     * @throw internal_error 若写入命令执行失败
     */
    void write(const container_handle &handle, const source_file &file);

    /**
     * @brief 删除写入的源文件和编译产物
     * @param file_names 写入的文件名，会被转义
     * @param artifacts 编译产物，可能包含 glob，不会被转义
     * @throw internal_error 若删除命令执行失败
     */
    void remove(const container_handle &handle, const std::vector<std::string> &file_names, const std::vector<std::string> &artifacts);

    static std::string write_command(const std::string &workdir, const source_file &file);

    static std::string cleanup_command(const std::string &workdir, const std::vector<std::string> &file_names, const std::vector<std::string> &artifacts);

private:
    /**
     * @brief 在容器内运行一条不需要 stdin 的短命令，并等待其结束
     * @return 命令的退出码，未知时为 -1
     */
    int run(const container_handle &handle, const std::string &command, docker::demuxed_output &output);

    docker::container_engine &engine;
};

}  // namespace runbox
