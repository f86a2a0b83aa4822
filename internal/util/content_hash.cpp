#include "content_hash.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace storykb::util {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

} // namespace

Sha256Digest Sha256(std::string_view data) {
  Sha256Digest out{};

  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

  unsigned int out_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
    throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
  }

  if (out_len != out.size()) {
    throw std::runtime_error("OpenSSL: unexpected SHA-256 digest length");
  }
  return out;
}

std::string ToHex(const Sha256Digest& digest) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(digest.size() * 2);
  for (const auto byte : digest) {
    result.push_back(kHex[(byte >> 4) & 0x0F]);
    result.push_back(kHex[byte & 0x0F]);
  }
  return result;
}

std::string ContentHash(std::string_view content) {
  return ToHex(Sha256(content));
}

bool IsContentHash(std::string_view value) {
  if (value.size() != 64) return false;
  for (const char c : value) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) return false;
  }
  return true;
}

} // namespace storykb::util
