#include "protocol/codec.h"
#include <spdlog/spdlog.h>

namespace protocol {

const char* to_string(MessageType type) {
    switch (type) {
    case MessageType::Start:
        return "START";
    case MessageType::Data:
        return "DATA";
    case MessageType::End:
        return "END";
    case MessageType::Error:
        return "ERROR";
    case MessageType::Ack:
        return "ACK";
    case MessageType::Resend:
        return "RESEND";
    }
    return "UNKNOWN";
}

void write_u32_le(ByteBuffer& out, std::uint32_t value) {
    out.push_back(static_cast<std::byte>(value & 0xFFU));
    out.push_back(static_cast<std::byte>((value >> 8U) & 0xFFU));
    out.push_back(static_cast<std::byte>((value >> 16U) & 0xFFU));
    out.push_back(static_cast<std::byte>((value >> 24U) & 0xFFU));
}

std::uint32_t read_u32_le(const std::byte* in) {
    return std::to_integer<std::uint32_t>(in[0]) | (std::to_integer<std::uint32_t>(in[1]) << 8U)
           | (std::to_integer<std::uint32_t>(in[2]) << 16U)
           | (std::to_integer<std::uint32_t>(in[3]) << 24U);
}

ByteBuffer encode(std::uint32_t type, std::string_view transfer_id, ConstDataBlock payload) {
    ByteBuffer out;
    out.reserve(kHeaderSize + transfer_id.size() + payload.size());
    write_u32_le(out, type);
    write_u32_le(out, static_cast<std::uint32_t>(transfer_id.size()));
    write_u32_le(out, static_cast<std::uint32_t>(payload.size()));
    const auto id = util::as_block(transfer_id);
    out.insert(out.end(), id.begin(), id.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::optional<Frame> decode(ConstDataBlock frame) {
    if (frame.size() < kHeaderSize) {
        spdlog::debug("[protocol::decode] Frame of {} bytes is shorter than the header",
                      frame.size());
        return std::nullopt;
    }

    const auto type = read_u32_le(frame.data());
    const std::uint64_t id_length = read_u32_le(frame.data() + 4);
    const std::uint64_t payload_length = read_u32_le(frame.data() + 8);

    if (kHeaderSize + id_length + payload_length != frame.size()) {
        spdlog::debug("[protocol::decode] Declared {} + {} bytes, frame carries {}",
                      id_length,
                      payload_length,
                      frame.size() - kHeaderSize);
        return std::nullopt;
    }

    Frame decoded;
    decoded.type = type;
    const auto id = frame.subspan(kHeaderSize, id_length);
    decoded.transfer_id.assign(util::as_string_view(id));
    const auto body = frame.subspan(kHeaderSize + id_length);
    decoded.payload.assign(body.begin(), body.end());
    return decoded;
}

} // namespace protocol
