#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace storykb::util {

/*
  Stable content hash used as an idempotency token.

  SHA-256 over the raw UTF-8 bytes, rendered as 64 lowercase hex chars.
  Identical content hashes identically across processes and versions.
*/

using Sha256Digest = std::array<std::uint8_t, 32>;

Sha256Digest Sha256(std::string_view data);

std::string ToHex(const Sha256Digest& digest);

std::string ContentHash(std::string_view content);

bool IsContentHash(std::string_view value);

} // namespace storykb::util
