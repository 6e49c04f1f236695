#include "hash.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace runlens::util {

namespace {

constexpr std::size_t kReadChunkBytes = 64 * 1024;

struct DigestCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

DigestCtx NewSha256() {
  DigestCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 init failed");
  }
  return ctx;
}

void Update(EVP_MD_CTX* ctx, const void* data, std::size_t len) {
  if (EVP_DigestUpdate(ctx, data, len) != 1) {
    throw std::runtime_error("sha256 update failed");
  }
}

ContentHash Finish(EVP_MD_CTX* ctx) {
  ContentHash  hash{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, hash.data(), &len) != 1 || len != hash.size()) {
    throw std::runtime_error("sha256 final failed");
  }
  return hash;
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

ContentHash HashFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open file for hashing: " + path);
  }

  auto              ctx = NewSha256();
  std::vector<char> buf(kReadChunkBytes);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = in.gcount();
    if (got > 0) {
      Update(ctx.get(), buf.data(), static_cast<std::size_t>(got));
    }
  }
  if (in.bad()) {
    throw std::runtime_error("read error while hashing: " + path);
  }
  return Finish(ctx.get());
}

ContentHash HashBytes(std::string_view bytes) {
  auto ctx = NewSha256();
  Update(ctx.get(), bytes.data(), bytes.size());
  return Finish(ctx.get());
}

std::string ToHex(const ContentHash& hash) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(hash.size() * 2);
  for (uint8_t b : hash) {
    out.push_back(kHex[(b >> 4) & 0x0F]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::optional<ContentHash> ContentHashFromHex(std::string_view hex) {
  ContentHash hash{};
  if (hex.size() != hash.size() * 2) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < hash.size(); ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    hash[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return hash;
}

} // namespace runlens::util
