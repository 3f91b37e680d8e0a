#include "sandbox/log_stream.hpp"
#include <algorithm>

namespace coderun {
using namespace std;

log_stream_decoder::log_stream_decoder(size_t max_bytes) : max_bytes(max_bytes) {}

/**
 * @brief 去掉结尾不完整的 UTF-8 字符
 * 截断可能发生在多字节字符的中间，留下的半个字符无法被编码成 json
 */
static void drop_partial_utf8_tail(string &s) {
    size_t i = s.size(), continuation = 0;
    while (i > 0 && continuation < 4 && (static_cast<unsigned char>(s[i - 1]) & 0xC0) == 0x80) {
        --i;
        ++continuation;
    }
    if (i == 0) return;
    unsigned char lead = static_cast<unsigned char>(s[i - 1]);
    size_t expected = 0;
    if ((lead & 0xE0) == 0xC0) expected = 2;
    else if ((lead & 0xF0) == 0xE0) expected = 3;
    else if ((lead & 0xF8) == 0xF0) expected = 4;
    // ASCII 或者不合法的首字节不是被截断造成的，保持原样
    if (expected > 0 && continuation + 1 < expected) s.resize(i - 1);
}

void log_stream_decoder::append(const char *data, size_t size) {
    if (is_truncated) return;
    size_t room = buffer.size() < max_bytes ? max_bytes - buffer.size() : 0;
    buffer.append(data, min(size, room));
    if (size > room) {
        is_truncated = true;
        drop_partial_utf8_tail(buffer);
    }
}

static bool valid_header(const unsigned char *header) {
    return header[0] <= 2 && header[1] == 0 && header[2] == 0 && header[3] == 0;
}

void log_stream_decoder::feed(const char *data, size_t size) {
    while (size > 0) {
        switch (current) {
            case state::RAW:
                append(data, size);
                return;
            case state::HEADER: {
                size_t n = min(size, sizeof(header) - header_size);
                copy(data, data + n, header + header_size);
                header_size += n;
                data += n;
                size -= n;
                if (header_size < sizeof(header)) return;

                if (!valid_header(header)) {
                    // 不是复用流，把已经读入的头部当作普通输出
                    current = state::RAW;
                    append(reinterpret_cast<const char *>(header), header_size);
                    header_size = 0;
                    break;
                }
                remaining = (uint32_t(header[4]) << 24) | (uint32_t(header[5]) << 16) |
                            (uint32_t(header[6]) << 8) | uint32_t(header[7]);
                header_size = 0;
                current = remaining > 0 ? state::PAYLOAD : state::HEADER;
            } break;
            case state::PAYLOAD: {
                size_t n = min<size_t>(size, remaining);
                append(data, n);
                data += n;
                size -= n;
                remaining -= n;
                if (remaining == 0) current = state::HEADER;
            } break;
        }
    }
}

void log_stream_decoder::finish() {
    if (current == state::HEADER && header_size > 0) {
        // 流在头部中间结束，只能检查已经收到的字节
        bool multiplexed = header[0] <= 2;
        for (size_t i = 1; i < min<size_t>(header_size, 4); ++i)
            multiplexed = multiplexed && header[i] == 0;
        if (!multiplexed)
            append(reinterpret_cast<const char *>(header), header_size);
    }
    header_size = 0;
}

const string &log_stream_decoder::output() const {
    return buffer;
}

bool log_stream_decoder::truncated() const {
    return is_truncated;
}

}  // namespace coderun
