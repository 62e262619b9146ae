#pragma once

#include "util/data_block.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace protocol {

enum class MessageType : std::uint32_t {
    Start = 1,
    Data = 2,
    End = 3,
    Error = 4,
    Ack = 5,
    Resend = 6,
};

const char* to_string(MessageType type);

// Frame header: type, transfer id length, payload length; little-endian u32.
constexpr std::size_t kHeaderSize = 12;

struct Frame {
    std::uint32_t type = 0;
    std::string transfer_id;
    ByteBuffer payload;

    bool is(MessageType t) const { return type == static_cast<std::uint32_t>(t); }
};

ByteBuffer encode(std::uint32_t type, std::string_view transfer_id, ConstDataBlock payload);

inline ByteBuffer encode(MessageType type, std::string_view transfer_id, ConstDataBlock payload) {
    return encode(static_cast<std::uint32_t>(type), transfer_id, payload);
}

// Returns nullopt when the declared lengths disagree with the buffer. Never
// throws.
std::optional<Frame> decode(ConstDataBlock frame);

void write_u32_le(ByteBuffer& out, std::uint32_t value);
std::uint32_t read_u32_le(const std::byte* in);

} // namespace protocol
