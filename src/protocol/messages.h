#pragma once

#include "protocol/codec.h"
#include "util/data_block.h"
#include "wire.pb.h"
#include <optional>
#include <string_view>

namespace protocol {

// Bytes a DATA frame adds around the chunk itself, with room for the
// largest chunk header.
constexpr std::size_t kDataFrameOverhead = kHeaderSize + 4 + 128;

// Encodes a control message body and wraps it in a frame.
template<util::ProtobufMessage T>
std::optional<ByteBuffer> make_frame(MessageType type, std::string_view transfer_id, const T& body) {
    const auto encoded = util::serialize(body);
    if (!encoded) {
        return std::nullopt;
    }
    return encode(type, transfer_id, ConstDataBlock(encoded->data(), encoded->size()));
}

template<util::ProtobufMessage T>
std::optional<T> parse_body(const Frame& frame) {
    return util::deserialize<T>(ConstDataBlock(frame.payload.data(), frame.payload.size()));
}

// DATA payload: [header length, u32 LE][ChunkHeader][chunk bytes].
std::optional<ByteBuffer> pack_chunk(const wire::ChunkHeader& header, ConstDataBlock data);

std::optional<ByteBuffer> make_data_frame(std::string_view transfer_id,
                                          const wire::ChunkHeader& header,
                                          ConstDataBlock data);

struct ChunkView {
    wire::ChunkHeader header;
    ConstDataBlock data;
};

// data points into payload. Returns nullopt if the header does not parse or
// its payload_length disagrees with the bytes present.
std::optional<ChunkView> unpack_chunk(ConstDataBlock payload);

} // namespace protocol
