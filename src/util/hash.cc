#include "util/hash.h"
#include <fstream>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace util::hash {

void Sha256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    if (ctx != nullptr) {
        EVP_MD_CTX_free(ctx);
    }
}

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        spdlog::error("[Sha256::Sha256] EVP_MD_CTX_new failed");
        return;
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        spdlog::error("[Sha256::Sha256] EVP_DigestInit_ex failed");
        return;
    }
    ok_ = true;
}

Sha256::~Sha256() = default;

bool Sha256::update(ConstDataBlock data) {
    if (!ok_) {
        return false;
    }
    if (data.empty()) {
        return true;
    }
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        spdlog::error("[Sha256::update] EVP_DigestUpdate failed");
        ok_ = false;
    }
    return ok_;
}

std::optional<Digest> Sha256::finish() {
    if (!ok_) {
        return std::nullopt;
    }
    ok_ = false;

    Digest digest{};
    unsigned int digest_size = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), reinterpret_cast<unsigned char*>(digest.data()), &digest_size)
        != 1) {
        spdlog::error("[Sha256::finish] EVP_DigestFinal_ex failed");
        return std::nullopt;
    }
    if (digest_size != digest.size()) {
        spdlog::error("[Sha256::finish] Unexpected SHA-256 digest size: {}", digest_size);
        return std::nullopt;
    }
    return digest;
}

std::optional<std::string> Sha256::finish_hex() {
    const auto digest = finish();
    if (!digest) {
        return std::nullopt;
    }
    return to_hex(ConstDataBlock(digest->data(), digest->size()));
}

std::string to_hex(ConstDataBlock data) {
    constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(data.size() * 2);
    for (const auto value : data) {
        const auto byte = std::to_integer<unsigned int>(value);
        hex.push_back(kDigits[(byte >> 4U) & 0x0FU]);
        hex.push_back(kDigits[byte & 0x0FU]);
    }
    return hex;
}

std::optional<Digest> sha256(ConstDataBlock data) {
    Sha256 hasher;
    if (!hasher.update(data)) {
        return std::nullopt;
    }
    return hasher.finish();
}

std::optional<std::string> sha256_hex(ConstDataBlock data) {
    Sha256 hasher;
    if (!hasher.update(data)) {
        return std::nullopt;
    }
    return hasher.finish_hex();
}

std::optional<Digest> sha256_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        spdlog::error("[hash::sha256_file] Failed to open file: {}", file_path.string());
        return std::nullopt;
    }

    Sha256 hasher;
    constexpr std::size_t kBufferSize = 64 * 1024;
    std::vector<std::byte> buffer(kBufferSize);

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), kBufferSize);
        const auto bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read > 0 && !hasher.update(ConstDataBlock(buffer.data(), bytes_read))) {
            return std::nullopt;
        }
    }

    if (file.bad()) {
        spdlog::error("[hash::sha256_file] Error reading file: {}", file_path.string());
        return std::nullopt;
    }
    return hasher.finish();
}

std::optional<std::string> sha256_file_hex(const std::filesystem::path& file_path) {
    const auto digest = sha256_file(file_path);
    if (!digest) {
        return std::nullopt;
    }
    return to_hex(ConstDataBlock(digest->data(), digest->size()));
}
} // namespace util::hash
