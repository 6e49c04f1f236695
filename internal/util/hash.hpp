#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace runlens::util {

/*
  Content address of an activity file: SHA-256 over the raw bytes.

  Stored and logged as 64 lowercase hex characters.
*/
using ContentHash = std::array<uint8_t, 32>;

// Throws std::runtime_error if the file cannot be read.
ContentHash HashFile(const std::string& path);

ContentHash HashBytes(std::string_view bytes);

std::string ToHex(const ContentHash& hash);

// Accepts upper- or lowercase hex; nullopt on bad length/characters.
std::optional<ContentHash> ContentHashFromHex(std::string_view hex);

} // namespace runlens::util
