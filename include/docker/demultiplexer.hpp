#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include "docker/engine.hpp"

namespace runbox::docker {

/**
 * @brief 多路复用流中每一帧的类型，即帧头的第一个字节
 */
enum class stream_type : std::uint8_t {
    STDIN = 0,
    STDOUT = 1,
    STDERR = 2
};

/**
 * @brief 解析后的标准输出和标准错误
 */
struct demuxed_output {
    std::string stdout_text;
    std::string stderr_text;
};

/**
 * @brief Docker 多路复用流的解码器
 *
 * 每一帧的格式为：
 * | 1 字节流类型 | 3 字节保留 | 4 字节大端序长度 | payload |
 *
 * 帧和网络读取到的数据块没有对齐关系，一个帧头甚至可能被拆到两个数据块里，
 * 因此不完整的尾部数据会被保留，等下一个数据块到达后再继续解析。
 */
class stream_demultiplexer {
public:
    static constexpr std::size_t HEADER_SIZE = 8;

    /**
     * @brief 喂入新读取到的数据块
     */
    void feed(std::string_view chunk);

    /**
     * @brief 流结束，返回累积的输出
     * 如果还有不完整的帧，那么这部分数据会被丢弃
     */
    demuxed_output finish();

    /**
     * @brief 当前还未能解析的字节数
     */
    std::size_t pending() const;

private:
    std::string buffer;
    demuxed_output output;
};

/**
 * @brief 读取整个 exec 流直到结束，并解析出标准输出和标准错误
 * @param stream 已经启动的 exec 流
 * @throw network_error 若读取过程中连接出错
 */
demuxed_output demultiplex(exec_stream &stream);

}  // namespace runbox::docker
