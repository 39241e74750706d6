#include "docker/demultiplexer.hpp"
#include <glog/logging.h>

namespace runbox::docker {
using namespace std;

static uint32_t read_uint32_be(const char *p) {
    auto *u = reinterpret_cast<const unsigned char *>(p);
    return (uint32_t(u[0]) << 24) | (uint32_t(u[1]) << 16) | (uint32_t(u[2]) << 8) | uint32_t(u[3]);
}

void stream_demultiplexer::feed(string_view chunk) {
    buffer.append(chunk.data(), chunk.size());

    size_t offset = 0;
    while (buffer.size() - offset >= HEADER_SIZE) {
        const char *header = buffer.data() + offset;
        uint32_t length = read_uint32_be(header + 4);
        if (buffer.size() - offset - HEADER_SIZE < length)
            break;  // payload 还没有全部到达

        const char *payload = header + HEADER_SIZE;
        switch (static_cast<stream_type>(static_cast<unsigned char>(header[0]))) {
            case stream_type::STDOUT:
                output.stdout_text.append(payload, length);
                break;
            case stream_type::STDERR:
                output.stderr_text.append(payload, length);
                break;
            default:
                break;
        }
        offset += HEADER_SIZE + length;
    }
    buffer.erase(0, offset);
}

demuxed_output stream_demultiplexer::finish() {
    if (!buffer.empty()) {
        LOG(WARNING) << "Multiplexed stream ended with " << buffer.size() << " bytes of incomplete frame, discarded";
        buffer.clear();
    }
    return move(output);
}

size_t stream_demultiplexer::pending() const {
    return buffer.size();
}

demuxed_output demultiplex(exec_stream &stream) {
    stream_demultiplexer demux;
    string chunk;
    while (true) {
        chunk.clear();
        if (stream.read_some(chunk) == 0) break;
        demux.feed(chunk);
    }
    return demux.finish();
}

}  // namespace runbox::docker
