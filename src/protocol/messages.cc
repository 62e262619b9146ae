#include "protocol/messages.h"
#include <spdlog/spdlog.h>

namespace protocol {

std::optional<ByteBuffer> pack_chunk(const wire::ChunkHeader& header, ConstDataBlock data) {
    ByteBuffer payload;
    const auto header_size = header.ByteSizeLong();
    payload.reserve(4 + header_size + data.size());
    write_u32_le(payload, static_cast<std::uint32_t>(header_size));
    if (!util::serialize_append(header, payload)) {
        spdlog::error("[protocol::pack_chunk] Failed to encode header for chunk {}",
                      header.chunk_index());
        return std::nullopt;
    }
    payload.insert(payload.end(), data.begin(), data.end());
    return payload;
}

std::optional<ByteBuffer> make_data_frame(std::string_view transfer_id,
                                          const wire::ChunkHeader& header,
                                          ConstDataBlock data) {
    const auto payload = pack_chunk(header, data);
    if (!payload) {
        return std::nullopt;
    }
    return encode(MessageType::Data, transfer_id, ConstDataBlock(payload->data(), payload->size()));
}

std::optional<ChunkView> unpack_chunk(ConstDataBlock payload) {
    if (payload.size() < 4) {
        return std::nullopt;
    }
    const std::uint64_t header_size = read_u32_le(payload.data());
    if (4 + header_size > payload.size()) {
        return std::nullopt;
    }

    auto header = util::deserialize<wire::ChunkHeader>(payload.subspan(4, header_size));
    if (!header) {
        return std::nullopt;
    }

    const auto data = payload.subspan(4 + header_size);
    if (header->payload_length() != data.size()) {
        spdlog::debug("[protocol::unpack_chunk] Chunk {} declares {} bytes, carries {}",
                      header->chunk_index(),
                      header->payload_length(),
                      data.size());
        return std::nullopt;
    }
    return ChunkView{std::move(*header), data};
}

} // namespace protocol
