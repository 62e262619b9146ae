#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using MutDataBlock = std::span<std::byte>;
using ConstDataBlock = std::span<const std::byte>;
using ByteBuffer = std::vector<std::byte>;

namespace util {

inline ConstDataBlock as_block(std::string_view text) {
    return ConstDataBlock(reinterpret_cast<const std::byte*>(text.data()), text.size());
}

inline std::string_view as_string_view(ConstDataBlock data) {
    return std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
}

template<typename T>
concept ProtobufMessage = requires(T msg, void* ptr, int size) {
    { msg.ByteSizeLong() } -> std::same_as<size_t>;
    { msg.SerializeToArray(ptr, size) } -> std::same_as<bool>;
    { msg.ParseFromArray(ptr, size) } -> std::same_as<bool>;
};

// Appends the encoded message to buffer; returns false if encoding failed.
template<ProtobufMessage T>
bool serialize_append(const T& message, ByteBuffer& buffer) {
    const size_t size = message.ByteSizeLong();
    const size_t offset = buffer.size();
    buffer.resize(offset + size);
    if (size == 0) {
        return true;
    }
    return message.SerializeToArray(buffer.data() + offset, static_cast<int>(size));
}

template<ProtobufMessage T>
std::optional<ByteBuffer> serialize(const T& message) {
    ByteBuffer buffer;
    if (!serialize_append(message, buffer)) {
        return std::nullopt;
    }
    return buffer;
}

// An empty block is a valid encoding of a message with every field at its
// default value.
template<ProtobufMessage T>
std::optional<T> deserialize(ConstDataBlock data) {
    T message;
    if (!message.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        return std::nullopt;
    }
    return message;
}

} // namespace util
