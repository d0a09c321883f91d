/**
 * Mycelium bridge wire protocol
 *
 * Frame: 8-byte header (magic + payload_size, both network byte order)
 * followed by a UTF-8 JSON envelope.
 */
#pragma once
#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace mycelium::ipc {

// Magic bytes for frame validation
constexpr uint32_t MAGIC_BYTES = 0x4D59434C; // "MYCL" in hex
constexpr size_t HEADER_SIZE = 8;
constexpr size_t MAX_PAYLOAD_SIZE = 1024 * 1024; // 1MB max

enum class FrameStatus {
    COMPLETE,
    INCOMPLETE,   // need more bytes
    INVALID       // bad magic or oversized payload; the stream cannot be resynced
};

struct DecodedFrame {
    FrameStatus status = FrameStatus::INCOMPLETE;
    std::string payload;
    size_t consumed = 0;
};

inline std::vector<uint8_t> encode_frame(const std::string& payload) {
    std::vector<uint8_t> buffer(HEADER_SIZE + payload.size());

    uint32_t magic = htonl(MAGIC_BYTES);
    uint32_t size = htonl(static_cast<uint32_t>(payload.size()));
    std::memcpy(buffer.data(), &magic, sizeof(magic));
    std::memcpy(buffer.data() + sizeof(magic), &size, sizeof(size));
    if (!payload.empty()) {
        std::memcpy(buffer.data() + HEADER_SIZE, payload.data(), payload.size());
    }

    return buffer;
}

// Decode the first frame in data[0..len)
inline DecodedFrame decode_frame(const uint8_t* data, size_t len) {
    DecodedFrame frame;
    if (len < HEADER_SIZE) {
        return frame;
    }

    uint32_t magic = 0;
    uint32_t size = 0;
    std::memcpy(&magic, data, sizeof(magic));
    std::memcpy(&size, data + sizeof(magic), sizeof(size));
    magic = ntohl(magic);
    size = ntohl(size);

    if (magic != MAGIC_BYTES || size > MAX_PAYLOAD_SIZE) {
        frame.status = FrameStatus::INVALID;
        return frame;
    }

    if (len < HEADER_SIZE + size) {
        return frame;
    }

    frame.status = FrameStatus::COMPLETE;
    frame.payload.assign(reinterpret_cast<const char*>(data + HEADER_SIZE), size);
    frame.consumed = HEADER_SIZE + size;
    return frame;
}

} // namespace mycelium::ipc
