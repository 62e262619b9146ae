#pragma once

#include <random>
#include <string>
#include <stduuid/uuid.h>

namespace util {

// Random UUID v4, used as the transfer id.
inline std::string generate_uuid() {
    thread_local std::random_device rd;
    thread_local std::mt19937 generator(rd());

    uuids::uuid_random_generator gen{generator};
    return uuids::to_string(gen());
}

// Short random token for correlation ids.
inline std::string generate_token(std::size_t length = 9) {
    constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 generator(std::random_device{}());
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);

    std::string token;
    token.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        token.push_back(kAlphabet[pick(generator)]);
    }
    return token;
}

} // namespace util
