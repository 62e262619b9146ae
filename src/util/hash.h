#pragma once

#include "util/data_block.h"
#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

struct evp_md_ctx_st;

namespace util::hash {
constexpr std::size_t kSha256Size = 32;
using Digest = std::array<std::byte, kSha256Size>;

std::string to_hex(ConstDataBlock data);

std::optional<Digest> sha256(ConstDataBlock data);
std::optional<std::string> sha256_hex(ConstDataBlock data);

std::optional<Digest> sha256_file(const std::filesystem::path& file_path);
std::optional<std::string> sha256_file_hex(const std::filesystem::path& file_path);

// Incremental SHA-256 over data that arrives in pieces.
class Sha256 {
  public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    bool valid() const { return ok_; }
    bool update(ConstDataBlock data);
    std::optional<Digest> finish();
    std::optional<std::string> finish_hex();

  private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool ok_ = false;
};
} // namespace util::hash
