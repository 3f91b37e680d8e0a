#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace coderun {

/**
 * @brief docker 日志流解码器
 * 
 * 没有分配 TTY 的容器，其 stdout 和 stderr 被复用在同一个流中，
 * 每一帧都有 8 字节的头部：
 * 
 *     [stream type, 0, 0, 0, size (4 字节大端序)] + payload
 * 
 * stream type 为 0 (stdin)、1 (stdout)、2 (stderr)。
 * 解码器按到达顺序把所有帧的内容拼接成一个输出，不区分 stdout 和 stderr。
 * 数据可以分多次喂入，帧可以在任意位置被切开。
 * 如果遇到不合法的头部，则认为流没有被复用，之后的数据按原样输出。
 */
struct log_stream_decoder {
    /**
     * @param max_bytes 最多保存多少字节的输出，超出部分被丢弃
     */
    explicit log_stream_decoder(std::size_t max_bytes);

    /**
     * @brief 喂入一段从 docker 收到的数据
     */
    void feed(const char *data, std::size_t size);

    /**
     * @brief 流结束，处理残留的不完整头部
     */
    void finish();

    const std::string &output() const;

    /**
     * @brief 输出是否因超过大小限制而被截断
     */
    bool truncated() const;

private:
    void append(const char *data, std::size_t size);

    enum class state {
        HEADER,
        PAYLOAD,
        RAW
    };

    std::size_t max_bytes;
    std::string buffer;
    bool is_truncated = false;

    state current = state::HEADER;
    unsigned char header[8];
    std::size_t header_size = 0;
    uint32_t remaining = 0;
};

}  // namespace coderun
